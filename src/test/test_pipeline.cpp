#include "test_util.h"

#include "pipeline.h"

using test::make_formula;
typedef pipeline_t::state_t state_t;
typedef pipeline_t::outcome_t outcome_t;

void test_transitions() {
  pipeline_t p(make_formula(clause_kind_t::ternary, 3, {{1, 2, 3}}));
  assert(p.state == state_t::built);
  assert(p.outcome == outcome_t::pending);
  assert(p.step());
  assert(p.state == state_t::transformed);
  assert(p.transformed.psi.var_count == 4);
  assert(p.step());
  assert(p.state == state_t::decided);
  assert(p.decision.sat());
  assert(p.step());
  assert(p.state == state_t::filtered);
  assert(p.filter.found());
  assert(!p.step());
  assert(p.state == state_t::done);
  assert(p.terminal());
  assert(p.outcome == outcome_t::sat);
  // Terminal states stay put.
  assert(!p.step());
  assert(p.state == state_t::done);
}

void test_models_are_projected() {
  pipeline_t p(make_formula(clause_kind_t::ternary, 3,
                            {{1, 2, 3}, {-1, -2, -3}}));
  assert(p.run() == outcome_t::sat);
  assert(p.models.size() == 1);
  assert(p.models[0].var_count() == 3);
  assert(gsat::satisfies(p.models[0], p.phi));

  projection_t proj = gsat::project(p.filter.assignment(),
                                    p.transformed.aux_map);
  assert(proj.size() == 3);
  for (const auto &kv : proj) {
    assert(!p.transformed.aux_map.is_auxiliary(kv.first));
    assert(kv.second == p.models[0].value(kv.first));
  }
}

void test_malformed_is_rejected() {
  formula_t phi(clause_kind_t::ternary, 3);
  phi.add_clause({dimacs_to_lit(1), dimacs_to_lit(2)});
  pipeline_t p(phi);
  assert(!p.step());
  assert(p.state == state_t::rejected);
  assert(p.outcome == outcome_t::malformed);
  assert(p.error.status == formula_status_t::malformed_clause);
  assert(p.error.where == 0);

  pipeline_t q(make_formula(clause_kind_t::ternary, 2, {{1, 2, 3}}));
  assert(q.run() == outcome_t::malformed);
  assert(q.error.status == formula_status_t::variable_out_of_range);
}

// All eight sign patterns over three variables: the relaxation is
// satisfiable, so the answer only comes out of filtering.
void test_unsat_needs_filtering() {
  pipeline_t p(make_formula(
      clause_kind_t::ternary, 3,
      {{1, 2, 3}, {1, 2, -3}, {1, -2, 3}, {1, -2, -3},
       {-1, 2, 3}, {-1, 2, -3}, {-1, -2, 3}, {-1, -2, -3}}));
  assert(p.run() == outcome_t::unsat_after_filtering);
  assert(p.state == state_t::done);
  assert(p.decision.sat());
  assert(p.filter.status == filter_status_t::exhausted);
  assert(p.models.empty());
  assert(p.filter.stats.subsets_explored == p.filter.stats.subset_space);
}

void test_budget_exceeded() {
  search_budget_t budget;
  budget.max_subsets = 1;
  pipeline_t p(make_formula(
      clause_kind_t::ternary, 3,
      {{1, 2, 3}, {1, 2, -3}, {1, -2, 3}, {1, -2, -3},
       {-1, 2, 3}, {-1, 2, -3}, {-1, -2, 3}, {-1, -2, -3}}),
      budget);
  assert(p.run() == outcome_t::budget_exceeded);
  assert(p.state == state_t::done);
  assert(p.filter.stats.cut_short);
  assert(p.models.empty());
}

// The rewrite never yields an UNSAT psi, so hand the pipeline one at the
// decided state: x & -x.
void test_unsat_psi_stops_early() {
  pipeline_t p(make_formula(clause_kind_t::ternary, 1, {{1, 1, 1}}));
  assert(p.step());
  assert(p.state == state_t::transformed);
  p.transformed.psi.add_clause({dimacs_to_lit(1), dimacs_to_lit(1)});
  p.transformed.psi.add_clause({dimacs_to_lit(-1), dimacs_to_lit(-1)});
  assert(p.step());
  assert(p.state == state_t::decided);
  assert(!p.decision.sat());
  assert(p.decision.conflict_variable == 0);

  assert(!p.step());
  assert(p.state == state_t::unsat_early);
  assert(p.terminal());
  assert(p.outcome == outcome_t::unsat);
  assert(p.free_choices.empty());
  assert(p.filter.stats.subsets_explored == 0);
  assert(p.models.empty());
  assert(p.run() == outcome_t::unsat);
}

void test_empty_formula() {
  pipeline_t p(formula_t(clause_kind_t::ternary, 2));
  assert(p.run() == outcome_t::sat);
  assert(p.models.size() == 1);
  assert(p.models[0].var_count() == 2);
}

void test_multiple_models() {
  search_budget_t budget;
  budget.max_witnesses = 4;
  pipeline_t p(make_formula(clause_kind_t::ternary, 3, {{1, 2, -3}}), budget);
  assert(p.run() == outcome_t::sat);
  assert(p.models.size() == 4);
  for (size_t i = 0; i < p.models.size(); i++) {
    assert(gsat::satisfies(p.models[i], p.phi));
    for (size_t j = 0; j < i; j++) assert(!(p.models[i] == p.models[j]));
  }
}

void test_agrees_with_brute_force() {
  std::mt19937 rng(31337);
  int sat = 0, unsat = 0;
  for (int round = 0; round < 300; round++) {
    variable_t n = 1 + round % 5;
    size_t m = 1 + rng() % 12;
    formula_t phi = test::random_formula(rng, clause_kind_t::ternary, n, m);
    bool expected = test::brute_force_sat(phi);

    search_budget_t budget;
    budget.threads = 1 + round % 3;
    pipeline_t p(phi, budget);
    outcome_t o = p.run();
    assert(p.decision.sat());
    if (expected) {
      assert(o == outcome_t::sat);
      assert(gsat::satisfies(p.models[0], phi));
      sat++;
    } else {
      assert(o == outcome_t::unsat_after_filtering);
      unsat++;
    }
  }
  assert(sat > 0 && unsat > 0);
}

int main() {
  RUN_TEST(test_transitions);
  RUN_TEST(test_models_are_projected);
  RUN_TEST(test_malformed_is_rejected);
  RUN_TEST(test_unsat_needs_filtering);
  RUN_TEST(test_budget_exceeded);
  RUN_TEST(test_unsat_psi_stops_early);
  RUN_TEST(test_empty_formula);
  RUN_TEST(test_multiple_models);
  RUN_TEST(test_agrees_with_brute_force);
  return 0;
}
