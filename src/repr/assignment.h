#pragma once
#include <iosfwd>
#include <vector>

#include "clause.h"
#include "variable.h"

// A total assignment: one value per variable. Stored as chars (not
// vector<bool>) so workers can build and flip candidates cheaply.
struct assignment_t {
  std::vector<char> mem;

  assignment_t() = default;
  assignment_t(variable_t var_count) : mem(var_count, 0) {}

  variable_t var_count() const { return static_cast<variable_t>(mem.size()); }
  bool empty() const { return mem.empty(); }

  bool value(variable_t v) const { return mem[v]; }
  void set(variable_t v, bool b) { mem[v] = b; }
  void flip(variable_t v) { mem[v] = !mem[v]; }

  bool literal_true(literal_t l) const { return value(var(l)) == ispos(l); }
  bool literal_false(literal_t l) const { return !literal_true(l); }

  bool clause_sat(const clause_t &c) const {
    return std::any_of(std::begin(c), std::end(c),
                       [&](literal_t l) { return literal_true(l); });
  }

  bool operator==(const assignment_t &that) const { return mem == that.mem; }
  bool operator!=(const assignment_t &that) const { return mem != that.mem; }
};

// "v1=1 v2=0 ..."
std::ostream &operator<<(std::ostream &o, const assignment_t &a);
void print_certificate(const assignment_t &a);
