#include "transform.h"

#include "debug.h"
#include "measurements.h"

namespace gsat {
namespace transform {

gadget_t apply_gadget(const clause_t &c, aux_generator_t &gen) {
  GSAT_ASSERT(c.has_arity(clause_kind_t::ternary));
  variable_t a = gen.fresh();
  literal_t al = lit(a);
  return {a, {clause_t{neg(c[0]), al}, clause_t{neg(c[1]), al},
              clause_t{al, c[2]}}};
}

formula_error_t transform(const formula_t &phi, transform_result_t &out) {
  aux_generator_t gen(phi.var_count);
  return transform(phi, gen, out);
}

formula_error_t transform(const formula_t &phi, aux_generator_t &gen,
                          transform_result_t &out) {
  if (phi.kind != clause_kind_t::ternary) {
    return {formula_status_t::malformed_clause, 0};
  }
  formula_error_t e = validate(phi);
  if (!e.ok()) {
    return e;
  }
  // Auxiliaries must not collide with phi's own variables.
  if (gen.next < phi.var_count) {
    return {formula_status_t::variable_out_of_range, 0};
  }
  cond_log(settings::verbose, pipeline_action::transform_start,
           phi.clause_count());

  out.psi = formula_t(clause_kind_t::binary, 0);
  out.psi.clauses.reserve(3 * phi.clause_count());
  out.aux_map = auxiliary_map_t{};
  for (size_t i = 0; i < phi.clause_count(); i++) {
    gadget_t g = apply_gadget(phi[i], gen);
    out.aux_map.add(i, g.aux);
    for (auto &c : g.clauses) {
      out.psi.add_clause(std::move(c));
    }
  }
  out.psi.var_count = gen.next;

  cond_log(settings::verbose, pipeline_action::transform_end,
           out.psi.var_count, out.psi.clause_count());
  return {};
}

bool respects_invariant(const assignment_t &a, const formula_t &phi,
                        const auxiliary_map_t &aux_map, size_t i) {
  const clause_t &c = phi[i];
  return !(a.literal_false(c[0]) && a.literal_false(c[1]) &&
           a.value(aux_map[i]));
}

bool respects_invariants(const assignment_t &a, const formula_t &phi,
                         const auxiliary_map_t &aux_map) {
  for (size_t i = 0; i < phi.clause_count(); i++) {
    if (!respects_invariant(a, phi, aux_map, i)) return false;
  }
  return true;
}

}  // namespace transform
}  // namespace gsat
