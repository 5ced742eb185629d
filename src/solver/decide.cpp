#include "decide.h"

#include "debug.h"
#include "measurements.h"

namespace gsat {

decision_result_t decide(const formula_t &psi) {
  implication_graph_t g = build_implication_graph(psi);
  condensation_t cond = condense(g);
  return decide(g, cond);
}

decision_result_t decide(const implication_graph_t &g,
                         const condensation_t &cond) {
  decision_result_t result;
  for (variable_t v : variable_range(g.var_count)) {
    if (cond.contradictory(v)) {
      result.conflict_variable = v;
      cond_log(settings::trace_decide, pipeline_action::decided_unsat,
               lit_to_dimacs(lit(v)));
      return result;
    }
  }

  // Sinks first: a literal met before its negation is set true. Nothing it
  // implies can have been set false, since everything it implies sits in a
  // component we already walked past.
  result.status = decision_t::sat;
  result.assignment = assignment_t(g.var_count);
  var_bitset_t resolved;
  resolved.construct(g.var_count);
  for (const auto &members : cond.members) {
    for (literal_t l : members) {
      variable_t v = var(l);
      if (resolved.get(v)) continue;
      resolved.set(v);
      result.assignment.set(v, ispos(l));
      cond_log(settings::trace_decide, pipeline_action::variable_resolved,
               lit_to_dimacs(l), cond.component[l]);
    }
  }
  cond_log(settings::trace_decide, pipeline_action::decided_sat,
           result.assignment);
  return result;
}

}  // namespace gsat
