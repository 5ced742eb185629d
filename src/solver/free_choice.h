#pragma once
#include <vector>

#include "decide.h"

// A component pair whose value may differ from the canonical assignment in
// some satisfying assignment. All its variables flip together.
struct free_group_t {
  size_t true_component;   // true under the canonical assignment
  size_t false_component;
  std::vector<variable_t> variables;
  // Flipping this group alone, with everything else canonical, still
  // satisfies every clause.
  bool independent = false;
};

struct free_choice_set_t {
  // Independent groups first, then by smallest variable.
  std::vector<free_group_t> groups;
  // Variables with the same value in every satisfying assignment.
  std::vector<variable_t> forced;
  // Components visited by the reachability probes, for cost reporting.
  size_t probe_visits = 0;

  size_t size() const { return groups.size(); }
  bool empty() const { return groups.empty(); }
  size_t independent_count() const;
};

namespace gsat {
// A pair {C, dual(C)} is forced iff one reaches the other in the
// condensation. Every satisfying assignment of psi is the canonical one with
// some set of free groups flipped, so the groups span the solution space.
free_choice_set_t analyze_free_choices(const condensation_t &cond,
                                       const assignment_t &canonical);

// Flip every variable of the chosen groups.
void apply_flips(assignment_t &a, const free_choice_set_t &fcs,
                 const std::vector<size_t> &chosen);
}  // namespace gsat
