#pragma once
// This is the core interface that provides everything we'd ever want to know
// about variables (and literals) on their own.
//
// Variables are 0-based. Literal 2v is "v", literal 2v+1 is "not v", so the
// literals of a formula are exactly the nodes of its implication graph.

#include <algorithm>
#include <cstdint>
#include <vector>
#include "debug.h"

typedef int32_t literal_t;
typedef int32_t variable_t;

inline variable_t var(literal_t l) { return l >> 1; }
inline literal_t lit(variable_t v) { return v << 1; }
inline literal_t neg(literal_t l) { return l ^ 1; }
inline bool ispos(literal_t l) { return !(l & 1); }
inline literal_t make_literal(variable_t v, bool positive) {
  return positive ? lit(v) : neg(lit(v));
}

// DIMACS numbering is 1-based and signed.
literal_t dimacs_to_lit(int x);
int lit_to_dimacs(literal_t l);

struct variable_range {
  const variable_t var_count;
  variable_range(const variable_t var_count) : var_count(var_count) {}
  struct iterator {
    variable_t v;
    iterator &operator++() {
      v++;
      return *this;
    }
    variable_t operator*() const { return v; }
    bool operator==(const iterator &that) const { return this->v == that.v; }
    bool operator!=(const iterator &that) const { return this->v != that.v; }
  };
  iterator begin() const { return iterator{0}; }
  iterator end() const { return iterator{var_count}; }
};

struct literal_range {
  const variable_t var_count;
  literal_range(const variable_t var_count) : var_count(var_count) {}
  struct iterator {
    literal_t l;

    iterator &operator++() {
      l++;
      return *this;
    }

    literal_t operator*() const { return l; }

    bool operator==(const iterator &that) const { return this->l == that.l; }
    bool operator!=(const iterator &that) const { return this->l != that.l; }
  };
  iterator begin() const { return iterator{0}; }
  iterator end() const { return iterator{2 * var_count}; }
};

template <typename T>
struct literal_map_t {
  typedef std::vector<T> mem_t;
  mem_t mem;
  variable_t var_count = 0;

  // Initialize the size based on the variable count.
  void construct(variable_t m, const T &init = T{}) {
    var_count = m;
    mem.assign(2 * static_cast<size_t>(var_count), init);
  }
  literal_map_t() = default;
  literal_map_t(variable_t m) { construct(m); }

  T &operator[](literal_t l) { return mem[literal_to_index(l)]; }
  const T &operator[](literal_t l) const { return mem[literal_to_index(l)]; }

  auto begin() { return mem.begin(); }
  auto end() { return mem.end(); }
  auto begin() const { return mem.begin(); }
  auto end() const { return mem.end(); }
  size_t size() const { return mem.size(); }

  void clear() { mem.clear(); }

  size_t literal_to_index(literal_t l) const {
    GSAT_ASSERT(l >= 0 && static_cast<size_t>(l) < mem.size());
    return l;
  }
};

template <typename T>
struct var_map_t {
  typedef std::vector<T> mem_t;
  mem_t mem;
  variable_t var_count = 0;

  void construct(variable_t m, const T &init = T{}) {
    var_count = m;
    mem.assign(var_count, init);
  }
  size_t variable_to_index(variable_t v) const {
    GSAT_ASSERT(v >= 0 && v < var_count);
    return v;
  }
  size_t literal_to_index(literal_t l) const {
    return variable_to_index(var(l));
  }

  T &operator[](variable_t v) { return mem[variable_to_index(v)]; }
  const T &operator[](variable_t v) const { return mem[variable_to_index(v)]; }

  auto begin() { return mem.begin(); }
  auto end() { return mem.end(); }
  auto begin() const { return mem.begin(); }
  auto end() const { return mem.end(); }
  size_t size() const { return mem.size(); }
};

struct var_bitset_t {
  typedef std::vector<char> mem_t;
  mem_t mem;
  variable_t var_count = 0;

  void construct(variable_t m) {
    var_count = m;
    mem.assign(var_count, 0);
  }
  size_t variable_to_index(variable_t v) const { return v; }

  void set(variable_t v) { mem[variable_to_index(v)] = true; }
  void clear(variable_t v) { mem[variable_to_index(v)] = false; }
  bool get(variable_t v) const { return mem[variable_to_index(v)]; }

  void clear() { std::fill(mem.begin(), mem.end(), 0); }
};
