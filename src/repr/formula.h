#pragma once
// A formula is a clause family, a clause list, and the number of declared
// variables. Both phi (ternary) and psi (binary) are formula_t's.
#include <iosfwd>
#include <vector>

#include "assignment.h"
#include "clause.h"
#include "variable.h"

struct formula_t {
  clause_kind_t kind = clause_kind_t::ternary;
  variable_t var_count = 0;
  std::vector<clause_t> clauses;

  formula_t() = default;
  formula_t(clause_kind_t kind, variable_t var_count)
      : kind(kind), var_count(var_count) {}

  size_t clause_count() const { return clauses.size(); }
  void add_clause(clause_t c) { clauses.push_back(std::move(c)); }

  auto begin() const { return clauses.begin(); }
  auto end() const { return clauses.end(); }
  const clause_t &operator[](size_t i) const { return clauses[i]; }

  literal_range lit_range() const { return literal_range(var_count); }
};

enum class formula_status_t {
  ok,
  malformed_clause,       // wrong literal count for the family
  variable_out_of_range,  // literal names a variable >= var_count
  parse_error,
  empty_input,
};
const char *to_string(formula_status_t s);

// Where points at the offending clause (validate) or line (loaders).
struct formula_error_t {
  formula_status_t status = formula_status_t::ok;
  size_t where = 0;
  bool ok() const { return status == formula_status_t::ok; }
};

// DIMACS, with a "p cnf" header.
std::ostream &operator<<(std::ostream &o, const formula_t &f);

namespace gsat {
formula_error_t validate(const formula_t &f);
bool satisfies(const assignment_t &a, const formula_t &f);

namespace io {
// Detects DIMACS ("p cnf" header, or zero-terminated clauses) versus one
// clause per line with '#' comments.
formula_error_t load_formula(std::istream &in, clause_kind_t kind,
                             formula_t &f);
formula_error_t load_dimacs(std::istream &in, clause_kind_t kind,
                            formula_t &f);
formula_error_t load_simple(std::istream &in, clause_kind_t kind,
                            formula_t &f);
}  // namespace io
}  // namespace gsat
