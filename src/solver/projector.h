#pragma once
#include <map>

#include "transform.h"

typedef std::map<variable_t, bool> projection_t;

namespace gsat {
// Drop every auxiliary variable; what is left is an assignment of phi.
projection_t project(const assignment_t &a, const auxiliary_map_t &aux_map);
// The same, densely, for phi's variables 0..var_count-1.
assignment_t project_dense(const assignment_t &a,
                           const auxiliary_map_t &aux_map,
                           variable_t var_count);
}  // namespace gsat
