#pragma once
#include <algorithm>
#include <initializer_list>
#include <iosfwd>
#include <iterator>
#include <utility>
#include <vector>

#include "variable.h"

template <typename C, typename V>
bool contains(const C &c, const V &v) {
  return std::find(std::begin(c), std::end(c), v) != std::end(c);
}

// The two clause families we ever build. A 3-CNF input (phi) is made of
// ternary clauses, and the gadget rewrite (psi) only emits binary ones.
enum class clause_kind_t { ternary, binary };

constexpr size_t arity(clause_kind_t k) {
  return k == clause_kind_t::ternary ? 3 : 2;
}

struct clause_t {
  std::vector<literal_t> mem;
  clause_t() = default;
  clause_t(std::vector<literal_t> m) : mem(std::move(m)) {}
  clause_t(std::initializer_list<literal_t> m) : mem(m) {}

  auto begin() { return mem.begin(); }
  auto begin() const { return mem.begin(); }
  auto end() { return mem.end(); }
  auto end() const { return mem.end(); }
  auto size() const { return mem.size(); }
  auto empty() const { return mem.empty(); }
  auto &operator[](size_t i) { return mem[i]; }
  auto &operator[](size_t i) const { return mem[i]; }
  void push_back(literal_t l) { mem.push_back(l); }
  bool operator==(const clause_t &that) const { return mem == that.mem; }
  bool operator!=(const clause_t &that) const { return mem != that.mem; }

  bool has_arity(clause_kind_t k) const { return mem.size() == arity(k); }
};

std::ostream &operator<<(std::ostream &o, const clause_t &c);
