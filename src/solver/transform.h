#pragma once
#include <array>
#include <vector>

#include "formula.h"

// Hands out fresh variable ids. Threaded explicitly through every call that
// needs one; there is no global counter.
struct aux_generator_t {
  variable_t next;
  explicit aux_generator_t(variable_t first) : next(first) {}
  variable_t fresh() { return next++; }
};

// Original clause index -> the auxiliary variable its gadget introduced.
struct auxiliary_map_t {
  std::vector<variable_t> aux;

  void add(size_t clause_index, variable_t a) {
    if (aux.size() <= clause_index) aux.resize(clause_index + 1, -1);
    aux[clause_index] = a;
  }
  variable_t operator[](size_t clause_index) const { return aux[clause_index]; }
  size_t size() const { return aux.size(); }
  auto begin() const { return aux.begin(); }
  auto end() const { return aux.end(); }

  bool is_auxiliary(variable_t v) const { return contains(aux, v); }
};

// The gadget for one clause (l1 l2 l3):
//   (-l1 a) (-l2 a) (a l3)
struct gadget_t {
  variable_t aux;
  std::array<clause_t, 3> clauses;
};

struct transform_result_t {
  formula_t psi;
  auxiliary_map_t aux_map;
};

namespace gsat {
namespace transform {
gadget_t apply_gadget(const clause_t &c, aux_generator_t &gen);

// Rejects a malformed phi (wrong arity, unknown variable) before touching it.
formula_error_t transform(const formula_t &phi, transform_result_t &out);
formula_error_t transform(const formula_t &phi, aux_generator_t &gen,
                          transform_result_t &out);

// The gadget admits one assignment with no counterpart in phi: l1 and l2
// false while a is true. True iff that pattern is absent for clause i.
bool respects_invariant(const assignment_t &a, const formula_t &phi,
                        const auxiliary_map_t &aux_map, size_t i);
bool respects_invariants(const assignment_t &a, const formula_t &phi,
                         const auxiliary_map_t &aux_map);
}  // namespace transform
}  // namespace gsat
