#include "pipeline.h"

#include <iostream>

#include "debug.h"
#include "measurements.h"

const char *to_string(pipeline_t::state_t s) {
  switch (s) {
    case pipeline_t::state_t::built:
      return "built";
    case pipeline_t::state_t::transformed:
      return "transformed";
    case pipeline_t::state_t::decided:
      return "decided";
    case pipeline_t::state_t::filtered:
      return "filtered";
    case pipeline_t::state_t::done:
      return "done";
    case pipeline_t::state_t::unsat_early:
      return "unsat_early";
    case pipeline_t::state_t::rejected:
      return "rejected";
  }
  return "unknown";
}

const char *to_string(pipeline_t::outcome_t o) {
  switch (o) {
    case pipeline_t::outcome_t::pending:
      return "pending";
    case pipeline_t::outcome_t::sat:
      return "sat";
    case pipeline_t::outcome_t::unsat:
      return "unsat";
    case pipeline_t::outcome_t::unsat_after_filtering:
      return "unsat after filtering";
    case pipeline_t::outcome_t::budget_exceeded:
      return "budget exceeded";
    case pipeline_t::outcome_t::malformed:
      return "malformed";
  }
  return "unknown";
}

pipeline_t::pipeline_t(formula_t phi, search_budget_t budget)
    : phi(std::move(phi)), budget(budget) {}

bool pipeline_t::terminal() const {
  return state == state_t::done || state == state_t::unsat_early ||
         state == state_t::rejected;
}

pipeline_t::outcome_t pipeline_t::run() {
  while (step()) {
  }
  return outcome;
}

bool pipeline_t::step() {
  using clock_type = std::chrono::steady_clock;
  auto start = clock_type::now();

  switch (state) {
    case state_t::built: {
      error = gsat::transform::transform(phi, transformed);
      transform_time = clock_type::now() - start;
      if (!error.ok()) {
        outcome = outcome_t::malformed;
        state = state_t::rejected;
        break;
      }
      if (settings::print_psi) {
        std::cout << transformed.psi;
      }
      state = state_t::transformed;
      break;
    }

    case state_t::transformed: {
      graph = gsat::build_implication_graph(transformed.psi);
      condensation = gsat::condense(graph);
      decision = gsat::decide(graph, condensation);
      decide_time = clock_type::now() - start;
      state = state_t::decided;
      break;
    }

    case state_t::decided: {
      // Not an error: nothing left to filter.
      if (!decision.sat()) {
        outcome = outcome_t::unsat;
        state = state_t::unsat_early;
        break;
      }
      free_choices =
          gsat::analyze_free_choices(condensation, decision.assignment);
      auto analyzed = clock_type::now();
      analyze_time = analyzed - start;

      filter = gsat::filter_search(transformed.psi, decision.assignment,
                                   free_choices, phi, transformed.aux_map,
                                   budget);
      search_time = clock_type::now() - analyzed;
      state = state_t::filtered;
      break;
    }

    case state_t::filtered: {
      switch (filter.status) {
        case filter_status_t::found:
          for (const auto &w : filter.witnesses) {
            models.push_back(gsat::project_dense(
                w.assignment, transformed.aux_map, phi.var_count));
            GSAT_ASSERT(gsat::satisfies(models.back(), phi));
          }
          outcome = outcome_t::sat;
          break;
        case filter_status_t::exhausted:
          outcome = outcome_t::unsat_after_filtering;
          break;
        case filter_status_t::budget_exceeded:
          outcome = outcome_t::budget_exceeded;
          break;
      }
      state = state_t::done;
      break;
    }

    case state_t::done:
    case state_t::unsat_early:
    case state_t::rejected:
      return false;
  }
  return !terminal();
}

void pipeline_t::report_metrics() const {
  std::cout << "Original variables:\t\t" << phi.var_count << std::endl;
  std::cout << "Original clauses:\t\t" << phi.clause_count() << std::endl;
  std::cout << "Transformed variables:\t\t" << transformed.psi.var_count
            << std::endl;
  std::cout << "Transformed clauses:\t\t" << transformed.psi.clause_count()
            << std::endl;
  std::cout << "Implication edges:\t\t" << graph.edge_count << std::endl;
  std::cout << "Components:\t\t\t" << condensation.size() << std::endl;
  std::cout << "Forced variables:\t\t" << free_choices.forced.size()
            << std::endl;
  std::cout << "Free groups:\t\t\t" << free_choices.size() << " ("
            << free_choices.independent_count() << " independent)"
            << std::endl;
  std::cout << "Probe visits:\t\t\t" << free_choices.probe_visits << std::endl;
  std::cout << "Subset space:\t\t\t" << filter.stats.subset_space << std::endl;
  std::cout << "Subsets explored:\t\t" << filter.stats.subsets_explored
            << std::endl;
  std::cout << "Consistent candidates:\t\t"
            << filter.stats.candidates_consistent << std::endl;
  std::cout << "Spurious candidates:\t\t" << filter.stats.candidates_spurious
            << std::endl;
  std::cout << "Largest subset tried:\t\t" << filter.stats.largest_subset
            << std::endl;
  std::cout << "Search workers:\t\t\t" << filter.stats.workers << std::endl;
  std::cout << "Search cut short:\t\t"
            << (filter.stats.cut_short ? "yes" : "no") << std::endl;
  std::cout << "Transform time:\t\t\t" << transform_time.count() << "s"
            << std::endl;
  std::cout << "Decide time:\t\t\t" << decide_time.count() << "s" << std::endl;
  std::cout << "Free choice time:\t\t" << analyze_time.count() << "s"
            << std::endl;
  std::cout << "Search time:\t\t\t" << search_time.count() << "s" << std::endl;
  std::cout << "Outcome:\t\t\t" << to_string(outcome) << std::endl;
}
