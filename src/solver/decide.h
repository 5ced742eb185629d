#pragma once
#include "scc.h"

enum class decision_t { sat, unsat };

struct decision_result_t {
  decision_t status = decision_t::unsat;
  // Total over psi's variables when sat, empty when unsat.
  assignment_t assignment;
  // When unsat: the first variable whose literals share a component.
  variable_t conflict_variable = -1;

  bool sat() const { return status == decision_t::sat; }
};

namespace gsat {
decision_result_t decide(const formula_t &psi);
decision_result_t decide(const implication_graph_t &g,
                         const condensation_t &cond);
}  // namespace gsat
