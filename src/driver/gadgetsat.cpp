#include <cstdio>
#include <fstream>
#include <iostream>

#include "decide.h"
#include "formula.h"
#include "pipeline.h"
#include "settings.h"

// gadgetsat.cpp is the main driver module.
// It reads a formula, hands it to the pipeline (or, for a 2-CNF input, just
// the decider), and prints the result in the usual SATISFIABLE/UNSATISFIABLE
// form, plus the projected models the search found.

namespace {

search_budget_t budget_from_settings() {
  search_budget_t b;
  b.max_subsets = settings::max_subsets();
  b.max_duration_ms = settings::max_duration_ms();
  b.threads = settings::threads();
  b.max_witnesses = settings::max_models();
  return b;
}

bool load_input(clause_kind_t kind, formula_t& f) {
  formula_error_t e;
  if (settings::read_file) {
    std::ifstream in(settings::input_path());
    if (!in) {
      fprintf(stderr, "Input file not found: %s\n", settings::input_path());
      return false;
    }
    e = gsat::io::load_formula(in, kind, f);
  } else {
    e = gsat::io::load_formula(std::cin, kind, f);
  }
  if (!e.ok()) {
    fprintf(stderr, "Failed to parse input: %s at line %zu\n",
            to_string(e.status), e.where);
    return false;
  }
  return true;
}

// The --out file mirrors what we print: a header, then one model per line.
bool write_output(const pipeline_t& p) {
  std::ofstream out(settings::output_path());
  if (!out) {
    fprintf(stderr, "Cannot write %s\n", settings::output_path());
    return false;
  }
  switch (p.outcome) {
    case pipeline_t::outcome_t::unsat:
      out << "# UNSAT\n";
      break;
    case pipeline_t::outcome_t::unsat_after_filtering:
      out << "# UNSAT after filtering\n";
      break;
    case pipeline_t::outcome_t::budget_exceeded:
      out << "# UNKNOWN (search budget exceeded)\n";
      break;
    default:
      out << "# Projected assignments for original " << p.phi.var_count
          << " vars\n";
      for (const auto& m : p.models) out << m << "\n";
      break;
  }
  return true;
}

int run_two_cnf() {
  formula_t psi;
  if (!load_input(clause_kind_t::binary, psi)) return 2;
  if (settings::print_parse) std::cout << psi;
  decision_result_t d = gsat::decide(psi);
  if (!d.sat()) {
    printf("UNSATISFIABLE\n");
    return 0;
  }
  if (settings::print_certificate) print_certificate(d.assignment);
  printf("SATISFIABLE\n");
  return 0;
}

}  // namespace

// Main entry point, this is a driver that allows for multiple modes.
int main(int argc, char* argv[]) {
  // Parse flags to set global state.
  int error_flag = settings::parse(argc, argv);
  if (error_flag) {
    printf("Error with flag #%d: \"%s\"\n", error_flag, argv[error_flag]);
    settings::print_help();
    return 1;
  }
  if (settings::help) {
    settings::print_help();
    return 0;
  }

  if (settings::two_cnf) {
    return run_two_cnf();
  }

  formula_t phi;
  if (!load_input(clause_kind_t::ternary, phi)) return 2;
  if (settings::print_parse) std::cout << phi;
  if (settings::verbose) {
    printf("Read %zu clauses over %d original variables\n", phi.clause_count(),
           phi.var_count);
  }

  pipeline_t pipeline(std::move(phi), budget_from_settings());
  auto outcome = pipeline.run();

  switch (outcome) {
    case pipeline_t::outcome_t::malformed:
      fprintf(stderr, "Transformation failed: %s in clause %zu\n",
              to_string(pipeline.error.status), pipeline.error.where);
      return 3;
    case pipeline_t::outcome_t::unsat:
      printf("UNSATISFIABLE\n");
      if (settings::verbose) printf("c the 2-CNF relaxation is unsatisfiable\n");
      break;
    case pipeline_t::outcome_t::unsat_after_filtering:
      printf("UNSATISFIABLE\n");
      if (settings::verbose) printf("c no model survived filtering\n");
      break;
    case pipeline_t::outcome_t::budget_exceeded:
      printf("UNKNOWN\n");
      if (settings::verbose) printf("c search budget exceeded\n");
      break;
    case pipeline_t::outcome_t::sat:
      if (settings::print_certificate) print_certificate(pipeline.models[0]);
      printf("SATISFIABLE\n");
      for (size_t i = 0; i < pipeline.models.size(); i++) {
        std::cout << "Model " << i + 1 << ": " << pipeline.models[i]
                  << std::endl;
      }
      if (pipeline.filter.stats.cut_short &&
          pipeline.models.size() < pipeline.budget.max_witnesses) {
        printf("c search budget reached after %zu of %zu models\n",
               pipeline.models.size(), pipeline.budget.max_witnesses);
      }
      break;
    case pipeline_t::outcome_t::pending:
      break;
  }

  if (settings::report_metrics) pipeline.report_metrics();
  if (settings::write_file && !write_output(pipeline)) return 4;
  return 0;
}
