#pragma once
#include <chrono>
#include <vector>

#include "decide.h"
#include "filter_search.h"
#include "free_choice.h"
#include "projector.h"
#include "transform.h"

// phi -> psi -> decide -> search -> project, as a state machine.
// unsat_early is reached straight from decided when psi itself is UNSAT;
// rejected straight from built when phi is malformed.
struct pipeline_t {
  enum class state_t {
    built,
    transformed,
    decided,
    filtered,
    done,
    unsat_early,
    rejected
  };
  enum class outcome_t {
    pending,
    sat,
    unsat,                  // psi is UNSAT, so phi is
    unsat_after_filtering,  // every model of psi is spurious
    budget_exceeded,
    malformed,
  };

  formula_t phi;
  search_budget_t budget;
  state_t state = state_t::built;
  outcome_t outcome = outcome_t::pending;

  formula_error_t error;
  transform_result_t transformed;
  implication_graph_t graph;
  condensation_t condensation;
  decision_result_t decision;
  free_choice_set_t free_choices;
  filter_result_t filter;
  // Witnesses restricted to phi's variables, in search order.
  std::vector<assignment_t> models;

  std::chrono::duration<double> transform_time{0};
  std::chrono::duration<double> decide_time{0};
  std::chrono::duration<double> analyze_time{0};
  std::chrono::duration<double> search_time{0};

  pipeline_t(formula_t phi, search_budget_t budget = {});

  // Run every remaining transition.
  outcome_t run();
  // A single transition; false once a terminal state is reached.
  bool step();
  bool terminal() const;

  void report_metrics() const;
};

const char *to_string(pipeline_t::state_t s);
const char *to_string(pipeline_t::outcome_t o);
