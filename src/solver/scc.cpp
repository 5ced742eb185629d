#include "scc.h"

#include <algorithm>
#include <limits>

#include "debug.h"
#include "measurements.h"

namespace gsat {

namespace {
constexpr size_t unvisited = std::numeric_limits<size_t>::max();

struct frame_t {
  literal_t node;
  size_t next_edge;
};
}  // namespace

condensation_t condense(const implication_graph_t &g) {
  condensation_t result;
  result.component.construct(g.var_count, unvisited);

  literal_map_t<size_t> index(g.var_count);
  literal_map_t<size_t> low(g.var_count);
  literal_map_t<char> on_stack(g.var_count);
  std::fill(std::begin(index), std::end(index), unvisited);

  std::vector<literal_t> stack;
  std::vector<frame_t> frames;
  size_t counter = 0;

  auto visit = [&](literal_t v) {
    index[v] = low[v] = counter++;
    stack.push_back(v);
    on_stack[v] = true;
    frames.push_back({v, 0});
  };

  for (literal_t start : literal_range(g.var_count)) {
    if (index[start] != unvisited) continue;
    visit(start);

    while (!frames.empty()) {
      literal_t v = frames.back().node;
      const auto &succ = g.successors(v);
      if (frames.back().next_edge < succ.size()) {
        literal_t w = succ[frames.back().next_edge++];
        if (index[w] == unvisited) {
          visit(w);
        } else if (on_stack[w]) {
          low[v] = std::min(low[v], index[w]);
        }
        continue;
      }

      // All edges of v explored.
      frames.pop_back();
      if (low[v] == index[v]) {
        size_t c = result.members.size();
        result.members.emplace_back();
        auto &m = result.members.back();
        literal_t w;
        do {
          w = stack.back();
          stack.pop_back();
          on_stack[w] = false;
          result.component[w] = c;
          m.push_back(w);
        } while (w != v);
        std::sort(std::begin(m), std::end(m));
        cond_log(settings::trace_decide, pipeline_action::component_found, c,
                 m);
      }
      if (!frames.empty()) {
        literal_t parent = frames.back().node;
        low[parent] = std::min(low[parent], low[v]);
      }
    }
  }

  // Condensation edges. "stamp" remembers the last component that recorded
  // d as a successor, so each edge is added once without sorting.
  result.successors.resize(result.size());
  std::vector<size_t> stamp(result.size(), unvisited);
  for (size_t c = 0; c < result.size(); c++) {
    auto &s = result.successors[c];
    for (literal_t u : result.members[c]) {
      for (literal_t w : g.successors(u)) {
        size_t d = result.component[w];
        if (d == c || stamp[d] == c) continue;
        stamp[d] = c;
        s.push_back(d);
      }
    }
    std::sort(std::begin(s), std::end(s));
    GSAT_ASSERT(s.empty() || s.back() < c);
  }
  return result;
}

}  // namespace gsat
