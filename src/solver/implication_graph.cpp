#include "implication_graph.h"

#include "debug.h"
#include "measurements.h"

implication_graph_t::implication_graph_t(variable_t var_count)
    : var_count(var_count), out(var_count) {}

void implication_graph_t::add_implication(literal_t u, literal_t v) {
  out[u].push_back(v);
  edge_count++;
}

void implication_graph_t::add_clause(const clause_t &c) {
  GSAT_ASSERT(c.has_arity(clause_kind_t::binary));
  add_implication(neg(c[0]), c[1]);
  add_implication(neg(c[1]), c[0]);
}

namespace gsat {
implication_graph_t build_implication_graph(const formula_t &psi) {
  GSAT_ASSERT(psi.kind == clause_kind_t::binary);
  implication_graph_t g(psi.var_count);
  for (const clause_t &c : psi) {
    g.add_clause(c);
  }
  GSAT_ASSERT(g.edge_count == 2 * psi.clause_count());
  cond_log(settings::trace_decide, pipeline_action::graph_built,
           g.node_count(), g.edge_count);
  return g;
}
}  // namespace gsat
