#include "projector.h"

#include "debug.h"
#include "measurements.h"

namespace gsat {

projection_t project(const assignment_t &a, const auxiliary_map_t &aux_map) {
  var_bitset_t is_aux;
  is_aux.construct(a.var_count());
  for (variable_t v : aux_map) {
    if (v >= 0 && v < a.var_count()) is_aux.set(v);
  }
  projection_t result;
  for (variable_t v = 0; v < a.var_count(); v++) {
    if (!is_aux.get(v)) result.emplace(v, a.value(v));
  }
  return result;
}

assignment_t project_dense(const assignment_t &a,
                           const auxiliary_map_t &aux_map,
                           variable_t var_count) {
  projection_t p = project(a, aux_map);
  assignment_t result(var_count);
  for (const auto &e : p) {
    if (e.first < var_count) result.set(e.first, e.second);
  }
  cond_log(settings::verbose, pipeline_action::projected, result);
  return result;
}

}  // namespace gsat
