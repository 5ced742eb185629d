#include "clause.h"

#include <iostream>

std::ostream &operator<<(std::ostream &o, const clause_t &c) {
  for (auto l : c) {
    o << lit_to_dimacs(l) << " ";
  }
  return o;
}
