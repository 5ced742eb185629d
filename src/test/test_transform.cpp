#include "test_util.h"

#include <sstream>

#include "transform.h"

using test::make_formula;

void test_single_clause_gadget() {
  formula_t phi = make_formula(clause_kind_t::ternary, 3, {{1, 2, 3}});
  transform_result_t r;
  assert(gsat::transform::transform(phi, r).ok());

  assert(r.psi.kind == clause_kind_t::binary);
  assert(r.psi.var_count == 4);
  assert(r.aux_map.size() == 1);
  variable_t a = r.aux_map[0];
  assert(a == 3);

  formula_t expected =
      make_formula(clause_kind_t::binary, 4, {{-1, 4}, {-2, 4}, {4, 3}});
  assert(r.psi.clauses == expected.clauses);
}

void test_sizes() {
  formula_t phi = make_formula(clause_kind_t::ternary, 4,
                               {{1, 2, 3}, {-1, 2, -4}, {3, -3, 4}, {1, 1, 1}});
  transform_result_t r;
  assert(gsat::transform::transform(phi, r).ok());
  assert(r.psi.var_count == 4 + 4);
  assert(r.psi.clause_count() == 3 * 4);
  for (size_t i = 0; i < phi.clause_count(); i++) {
    assert(r.aux_map[i] == static_cast<variable_t>(4 + i));
    assert(r.aux_map.is_auxiliary(r.aux_map[i]));
  }
  assert(!r.aux_map.is_auxiliary(0));
  assert(gsat::validate(r.psi).ok());
}

void test_malformed_rejected() {
  formula_t phi = make_formula(clause_kind_t::ternary, 3, {{1, 2, 3}, {1, 2}});
  transform_result_t r;
  formula_error_t e = gsat::transform::transform(phi, r);
  assert(e.status == formula_status_t::malformed_clause);
  assert(e.where == 1);

  formula_t out_of_range = make_formula(clause_kind_t::ternary, 2, {{1, 2, 3}});
  e = gsat::transform::transform(out_of_range, r);
  assert(e.status == formula_status_t::variable_out_of_range);
  assert(e.where == 0);

  formula_t binary = make_formula(clause_kind_t::binary, 2, {{1, 2}});
  assert(!gsat::transform::transform(binary, r).ok());

  // A generator that would hand out one of phi's own variables.
  formula_t phi2 = make_formula(clause_kind_t::ternary, 3, {{1, 2, 3}});
  aux_generator_t gen(1);
  assert(gsat::transform::transform(phi2, gen, r).status ==
         formula_status_t::variable_out_of_range);
}

// Two runs with unrelated generators differ only in the auxiliary names.
void test_isomorphic_up_to_aux_renaming() {
  formula_t phi = make_formula(clause_kind_t::ternary, 3,
                               {{1, 2, 3}, {-1, -2, -3}, {2, -3, 1}});
  transform_result_t r1, r2;
  aux_generator_t g1(3), g2(40);
  assert(gsat::transform::transform(phi, g1, r1).ok());
  assert(gsat::transform::transform(phi, g2, r2).ok());
  assert(r1.psi.clause_count() == r2.psi.clause_count());

  std::vector<variable_t> rename(r1.psi.var_count, -1);
  for (variable_t v = 0; v < phi.var_count; v++) rename[v] = v;
  for (size_t i = 0; i < phi.clause_count(); i++) {
    rename[r1.aux_map[i]] = r2.aux_map[i];
  }
  for (size_t i = 0; i < r1.psi.clause_count(); i++) {
    const clause_t &c1 = r1.psi[i];
    const clause_t &c2 = r2.psi[i];
    assert(c1.size() == c2.size());
    for (size_t j = 0; j < c1.size(); j++) {
      assert(make_literal(rename[var(c1[j])], ispos(c1[j])) == c2[j]);
    }
  }
}

void test_invariant() {
  formula_t phi = make_formula(clause_kind_t::ternary, 3, {{1, -2, 3}});
  auxiliary_map_t aux;
  aux.add(0, 3);
  // l1 = x1 false, l2 = -x2 false (x2 true), a true: the spurious pattern.
  assignment_t a = test::from_bits(4, 0b1010);
  assert(!gsat::transform::respects_invariant(a, phi, aux, 0));
  assert(!gsat::transform::respects_invariants(a, phi, aux));
  a.set(0, true);
  assert(gsat::transform::respects_invariants(a, phi, aux));
  a = test::from_bits(4, 0b0010);  // a false
  assert(gsat::transform::respects_invariants(a, phi, aux));
}

// A psi model that respects every invariant satisfies phi, whatever a is.
void test_invariant_implies_phi() {
  std::mt19937 rng(7);
  for (int round = 0; round < 50; round++) {
    formula_t phi = test::random_formula(rng, clause_kind_t::ternary, 4, 5);
    transform_result_t r;
    assert(gsat::transform::transform(phi, r).ok());
    for (uint64_t bits = 0; bits < (uint64_t{1} << r.psi.var_count); bits++) {
      assignment_t a = test::from_bits(r.psi.var_count, bits);
      if (!gsat::satisfies(a, r.psi)) continue;
      if (!gsat::transform::respects_invariants(a, phi, r.aux_map)) continue;
      assert(gsat::satisfies(a, phi));
    }
  }
}

void test_load_dimacs() {
  std::istringstream in(
      "c a comment\n"
      "p cnf 4 2\n"
      "1 -2 3 0\n"
      "-4 2\n"
      " 1 0\n");
  formula_t f;
  assert(gsat::io::load_formula(in, clause_kind_t::ternary, f).ok());
  assert(f.var_count == 4);
  assert(f.clause_count() == 2);
  assert(f[0] == clause_t({dimacs_to_lit(1), dimacs_to_lit(-2),
                           dimacs_to_lit(3)}));
  assert(f[1] == clause_t({dimacs_to_lit(-4), dimacs_to_lit(2),
                           dimacs_to_lit(1)}));
}

void test_load_simple() {
  std::istringstream in(
      "# three ints per line\n"
      "1 2 3\n"
      "\n"
      "-1 -5 2  # trailing comment\n");
  formula_t f;
  assert(gsat::io::load_formula(in, clause_kind_t::ternary, f).ok());
  assert(f.var_count == 5);
  assert(f.clause_count() == 2);
  assert(lit_to_dimacs(f[1][1]) == -5);
}

void test_load_errors() {
  formula_t f;
  std::istringstream wrong_arity("p cnf 3 1\n1 2 0\n");
  formula_error_t e =
      gsat::io::load_formula(wrong_arity, clause_kind_t::ternary, f);
  assert(e.status == formula_status_t::malformed_clause);
  assert(e.where == 2);

  std::istringstream unterminated("p cnf 3 1\n1 2 3\n");
  e = gsat::io::load_formula(unterminated, clause_kind_t::ternary, f);
  assert(e.status == formula_status_t::parse_error);

  std::istringstream junk("1 x 3\n");
  e = gsat::io::load_formula(junk, clause_kind_t::ternary, f);
  assert(e.status == formula_status_t::parse_error);
  assert(e.where == 1);

  std::istringstream too_big("p cnf 2 1\n1 2 3 0\n");
  e = gsat::io::load_formula(too_big, clause_kind_t::ternary, f);
  assert(e.status == formula_status_t::variable_out_of_range);
  assert(e.where == 2);

  // The offending clause is the second one, ending on line 7.
  std::istringstream too_big_later(
      "c header first\n"
      "p cnf 3 2\n"
      "1 2 3 0\n"
      "\n"
      "c next clause spans two lines\n"
      "-1 4\n"
      "2 0\n");
  e = gsat::io::load_formula(too_big_later, clause_kind_t::ternary, f);
  assert(e.status == formula_status_t::variable_out_of_range);
  assert(e.where == 7);

  std::istringstream nothing("c only comments\n\n");
  e = gsat::io::load_formula(nothing, clause_kind_t::ternary, f);
  assert(e.status == formula_status_t::empty_input);

  std::istringstream binary("1 -2\n2 3\n");
  assert(gsat::io::load_formula(binary, clause_kind_t::binary, f).ok());
  assert(f.kind == clause_kind_t::binary && f.clause_count() == 2);
}

int main() {
  RUN_TEST(test_single_clause_gadget);
  RUN_TEST(test_sizes);
  RUN_TEST(test_malformed_rejected);
  RUN_TEST(test_isomorphic_up_to_aux_renaming);
  RUN_TEST(test_invariant);
  RUN_TEST(test_invariant_implies_phi);
  RUN_TEST(test_load_dimacs);
  RUN_TEST(test_load_simple);
  RUN_TEST(test_load_errors);
  return 0;
}
