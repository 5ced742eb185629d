#include "variable.h"
#include <cstdlib>

literal_t dimacs_to_lit(int x) {
  GSAT_ASSERT(x != 0);
  bool is_neg = x < 0;
  literal_t l = std::abs(x) - 1;
  l <<= 1;
  if (is_neg) l++;
  return l;
}

int lit_to_dimacs(literal_t l) {
  int v = var(l) + 1;
  return ispos(l) ? v : -v;
}
