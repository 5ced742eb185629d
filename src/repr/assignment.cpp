#include "assignment.h"

#include <cstdio>
#include <iostream>

std::ostream &operator<<(std::ostream &o, const assignment_t &a) {
  for (variable_t v = 0; v < a.var_count(); v++) {
    if (v) o << " ";
    o << "v" << v + 1 << "=" << (a.value(v) ? '1' : '0');
  }
  return o;
}

void print_certificate(const assignment_t &a) {
  for (variable_t v = 0; v < a.var_count(); v++) {
    printf("%d\n", lit_to_dimacs(make_literal(v, a.value(v))));
  }
}
