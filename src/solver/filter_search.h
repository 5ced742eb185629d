#pragma once
#include <cstdint>
#include <vector>

#include "free_choice.h"
#include "transform.h"

// Zero means "no limit". A search stopped by either limit reports
// budget_exceeded, never exhausted.
struct search_budget_t {
  uint64_t max_subsets = 0;
  uint64_t max_duration_ms = 0;
  unsigned threads = 1;
  // More than one keeps searching for assignments that differ on phi's
  // variables.
  size_t max_witnesses = 1;
};

enum class filter_status_t { found, exhausted, budget_exceeded };
const char *to_string(filter_status_t s);

struct witness_t {
  assignment_t assignment;
  // Position in the subset sequence (size 0 first, then size 1, ...).
  uint64_t subset_index;
  std::vector<size_t> flipped;
};

// The search is exponential in the number of free groups; these counters are
// what a caller studies.
struct search_stats_t {
  size_t free_groups = 0;
  uint64_t subset_space = 0;  // 2^free_groups, saturating
  uint64_t subsets_explored = 0;
  uint64_t candidates_consistent = 0;  // satisfied psi
  uint64_t candidates_spurious = 0;    // ... but hit the gadget's bad pattern
  size_t largest_subset = 0;
  unsigned workers = 1;
  // A budget stopped the search. With several witnesses requested, "found"
  // may then hold fewer than asked for.
  bool cut_short = false;
  double elapsed_seconds = 0;
};

struct filter_result_t {
  filter_status_t status = filter_status_t::exhausted;
  // Ascending subset_index.
  std::vector<witness_t> witnesses;
  search_stats_t stats;

  bool found() const { return status == filter_status_t::found; }
  const assignment_t &assignment() const {
    return witnesses.front().assignment;
  }
};

namespace gsat {
uint64_t subset_count(size_t k);

// Tries the canonical assignment with every subset of free groups flipped,
// smallest subsets first, until one satisfies psi and every clause invariant
// of phi.
filter_result_t filter_search(const formula_t &psi,
                              const assignment_t &canonical,
                              const free_choice_set_t &fcs,
                              const formula_t &phi,
                              const auxiliary_map_t &aux_map,
                              const search_budget_t &budget);
}  // namespace gsat
