#pragma once
#include <vector>

#include "formula.h"

// Nodes are literals (2 per variable). An edge u -> v means "u true forces v
// true". Every binary clause (x y) contributes -x -> y and -y -> x; duplicate
// edges are kept so the edge count is always twice the clause count.
struct implication_graph_t {
  variable_t var_count = 0;
  literal_map_t<std::vector<literal_t>> out;
  size_t edge_count = 0;

  implication_graph_t() = default;
  explicit implication_graph_t(variable_t var_count);

  size_t node_count() const { return 2 * static_cast<size_t>(var_count); }
  void add_implication(literal_t u, literal_t v);
  void add_clause(const clause_t &c);

  const std::vector<literal_t> &successors(literal_t l) const {
    return out[l];
  }
};

namespace gsat {
implication_graph_t build_implication_graph(const formula_t &psi);
}  // namespace gsat
