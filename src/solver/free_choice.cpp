#include "free_choice.h"

#include <algorithm>
#include <limits>

#include "debug.h"
#include "measurements.h"

size_t free_choice_set_t::independent_count() const {
  return std::count_if(std::begin(groups), std::end(groups),
                       [](const free_group_t &g) { return g.independent; });
}

namespace gsat {

namespace {
enum class pair_state_t : char { unknown, free, forced };
constexpr size_t never = std::numeric_limits<size_t>::max();
}  // namespace

free_choice_set_t analyze_free_choices(const condensation_t &cond,
                                       const assignment_t &canonical) {
  free_choice_set_t result;
  const size_t n = cond.size();

  std::vector<char> is_true(n);
  std::vector<std::vector<size_t>> predecessors(n);
  for (size_t c = 0; c < n; c++) {
    is_true[c] = canonical.literal_true(cond.members[c][0]);
    for (size_t d : cond.successors[c]) {
      predecessors[d].push_back(c);
    }
  }

  // Indexed by component, only meaningful for canonically false ones.
  std::vector<pair_state_t> state(n, pair_state_t::unknown);
  std::vector<size_t> visited(n, never);
  std::vector<size_t> work;
  std::vector<size_t> reached;

  // Sources first: a probe from high up the DAG settles many pairs at once.
  for (size_t f = n; f-- > 0;) {
    if (is_true[f] || state[f] != pair_state_t::unknown) continue;
    const size_t t = cond.dual(f);

    // Setting f true is consistent iff f cannot reach its dual.
    bool forced = false;
    reached.clear();
    work.assign(1, f);
    visited[f] = f;
    while (!work.empty() && !forced) {
      size_t c = work.back();
      work.pop_back();
      result.probe_visits++;
      if (!is_true[c]) reached.push_back(c);
      for (size_t d : cond.successors[c]) {
        if (d == t || (!is_true[d] && state[d] == pair_state_t::forced)) {
          forced = true;
          break;
        }
        if (visited[d] == f) continue;
        visited[d] = f;
        work.push_back(d);
      }
    }

    if (!forced) {
      // Everything f implies can be true together, so each canonically false
      // component we walked through can be flipped in some model.
      for (size_t c : reached) state[c] = pair_state_t::free;
      continue;
    }

    // Anything implying f is just as impossible.
    state[f] = pair_state_t::forced;
    work.assign(1, f);
    while (!work.empty()) {
      size_t c = work.back();
      work.pop_back();
      for (size_t p : predecessors[c]) {
        GSAT_ASSERT(!is_true[p]);
        GSAT_ASSERT(state[p] != pair_state_t::free);
        if (state[p] == pair_state_t::forced) continue;
        state[p] = pair_state_t::forced;
        work.push_back(p);
      }
    }
  }

  for (size_t f = 0; f < n; f++) {
    if (is_true[f]) continue;
    if (state[f] == pair_state_t::forced) {
      for (literal_t l : cond.members[f]) {
        result.forced.push_back(var(l));
        cond_log(settings::trace_free_choices, pipeline_action::forced_variable,
                 lit_to_dimacs(neg(l)));
      }
      continue;
    }
    GSAT_ASSERT(state[f] == pair_state_t::free);
    free_group_t g;
    g.false_component = f;
    g.true_component = cond.dual(f);
    for (literal_t l : cond.members[f]) g.variables.push_back(var(l));
    std::sort(std::begin(g.variables), std::end(g.variables));
    g.independent = std::all_of(std::begin(cond.successors[f]),
                                std::end(cond.successors[f]),
                                [&](size_t d) { return is_true[d]; });
    result.groups.push_back(std::move(g));
  }
  std::sort(std::begin(result.forced), std::end(result.forced));

  std::stable_sort(std::begin(result.groups), std::end(result.groups),
                   [](const free_group_t &a, const free_group_t &b) {
                     if (a.independent != b.independent) return a.independent;
                     return a.variables.front() < b.variables.front();
                   });
  for (size_t i = 0; i < result.groups.size(); i++) {
    const auto &g = result.groups[i];
    cond_log(settings::trace_free_choices, pipeline_action::free_group, i,
             g.independent, cond.members[g.false_component]);
  }
  cond_log(settings::trace_free_choices, pipeline_action::free_choices_done,
           result.groups.size(), result.forced.size(), result.probe_visits);
  return result;
}

void apply_flips(assignment_t &a, const free_choice_set_t &fcs,
                 const std::vector<size_t> &chosen) {
  for (size_t i : chosen) {
    for (variable_t v : fcs.groups[i].variables) {
      a.flip(v);
    }
  }
}

}  // namespace gsat
