#include "filter_search.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <limits>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

#include "debug.h"
#include "measurements.h"

const char *to_string(filter_status_t s) {
  switch (s) {
    case filter_status_t::found:
      return "found";
    case filter_status_t::exhausted:
      return "exhausted";
    case filter_status_t::budget_exceeded:
      return "budget exceeded";
  }
  return "unknown";
}

namespace gsat {

uint64_t subset_count(size_t k) {
  if (k >= 64) return std::numeric_limits<uint64_t>::max();
  return uint64_t{1} << k;
}

namespace {

using clock_type = std::chrono::steady_clock;
constexpr uint64_t nothing_found = std::numeric_limits<uint64_t>::max();

// Longer than this counts as no limit; now() + the duration must not overflow
// the clock's representation.
uint64_t longest_deadline_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             clock_type::duration::max())
             .count() /
         2;
}

// Never more workers than subsets, nor many more than the machine can run.
unsigned worker_count(unsigned requested, uint64_t subset_space) {
  unsigned hw = std::thread::hardware_concurrency();
  unsigned cap = std::max(4u, 2 * hw);
  uint64_t n = std::min<uint64_t>(std::max(1u, requested), cap);
  return static_cast<unsigned>(std::min<uint64_t>(n, subset_space));
}

// Walks all subsets of {0..k-1}: by size, then lexicographically.
struct subset_cursor_t {
  size_t k;
  std::vector<size_t> chosen;
  bool done = false;

  explicit subset_cursor_t(size_t k) : k(k) {}

  size_t size() const { return chosen.size(); }

  void next() {
    size_t s = chosen.size();
    for (size_t i = s; i-- > 0;) {
      if (chosen[i] < k - s + i) {
        chosen[i]++;
        for (size_t j = i + 1; j < s; j++) chosen[j] = chosen[j - 1] + 1;
        return;
      }
    }
    // Layer s is finished.
    if (s == k) {
      done = true;
      return;
    }
    chosen.resize(s + 1);
    for (size_t j = 0; j <= s; j++) chosen[j] = j;
  }
};

// Everything the workers share. Only "best" and the multi-witness pool are
// written during the search.
struct search_state_t {
  const formula_t &psi;
  const assignment_t &canonical;
  const free_choice_set_t &fcs;
  const formula_t &phi;
  const auxiliary_map_t &aux_map;
  const search_budget_t &budget;
  unsigned workers;
  bool has_deadline;
  clock_type::time_point deadline;
  var_bitset_t is_aux;

  // Lowest subset index found so far; a worker quits once its next index is
  // above it.
  std::atomic<uint64_t> best{nothing_found};

  std::mutex pool_mutex;
  std::set<std::vector<char>> projections;
  std::atomic<size_t> distinct_found{0};

  std::mutex log_mutex;
};

struct worker_result_t {
  search_stats_t stats;
  std::vector<witness_t> witnesses;
  bool out_of_budget = false;
};

void lower_best(std::atomic<uint64_t> &best, uint64_t g) {
  uint64_t cur = best.load();
  while (g < cur && !best.compare_exchange_weak(cur, g)) {
  }
}

std::vector<char> projection_key(const search_state_t &st,
                                 const assignment_t &a) {
  std::vector<char> key;
  for (variable_t v = 0; v < a.var_count(); v++) {
    if (!st.is_aux.get(v)) key.push_back(a.value(v));
  }
  return key;
}

// Workers interleave, so each traced line is written under the log lock.
template <typename... Rest>
void trace_search(search_state_t &st, const Rest &... rest) {
  if (!settings::trace_search) return;
  std::lock_guard<std::mutex> lock(st.log_mutex);
  log_pipeline_action(rest...);
}

void run_worker(search_state_t &st, unsigned w, worker_result_t &out) {
  const bool single = st.budget.max_witnesses <= 1;
  assignment_t candidate = st.canonical;
  subset_cursor_t cursor(st.fcs.size());
  size_t layer = 0;

  for (uint64_t g = 0; !cursor.done; cursor.next(), g++) {
    if (cursor.size() != layer || g == 0) {
      layer = cursor.size();
      if (w == 0) trace_search(st, pipeline_action::search_layer, layer, g);
    }
    if (g % st.workers != w) continue;
    if (single && g > st.best.load()) break;
    if (!single && st.distinct_found.load() >= st.budget.max_witnesses) break;
    if (st.budget.max_subsets && g >= st.budget.max_subsets) {
      out.out_of_budget = true;
      break;
    }
    if (st.has_deadline && clock_type::now() >= st.deadline) {
      out.out_of_budget = true;
      break;
    }

    out.stats.subsets_explored++;
    out.stats.largest_subset = std::max(out.stats.largest_subset, layer);
    apply_flips(candidate, st.fcs, cursor.chosen);

    if (!satisfies(candidate, st.psi)) {
      trace_search(st, pipeline_action::candidate_inconsistent, g,
                   cursor.chosen);
    } else if (!transform::respects_invariants(candidate, st.phi,
                                               st.aux_map)) {
      out.stats.candidates_consistent++;
      out.stats.candidates_spurious++;
      trace_search(st, pipeline_action::candidate_spurious, g, cursor.chosen);
    } else {
      out.stats.candidates_consistent++;
      trace_search(st, pipeline_action::candidate_found, g, cursor.chosen,
                   candidate);
      if (single) {
        out.witnesses.push_back({candidate, g, cursor.chosen});
        lower_best(st.best, g);
        break;
      }
      std::lock_guard<std::mutex> lock(st.pool_mutex);
      if (st.distinct_found.load() < st.budget.max_witnesses &&
          st.projections.insert(projection_key(st, candidate)).second) {
        out.witnesses.push_back({candidate, g, cursor.chosen});
        st.distinct_found++;
      }
    }
    apply_flips(candidate, st.fcs, cursor.chosen);
    SEARCH_ASSERT(candidate == st.canonical);
  }
}

}  // namespace

filter_result_t filter_search(const formula_t &psi,
                              const assignment_t &canonical,
                              const free_choice_set_t &fcs,
                              const formula_t &phi,
                              const auxiliary_map_t &aux_map,
                              const search_budget_t &budget) {
  GSAT_ASSERT(canonical.var_count() == psi.var_count);
  GSAT_ASSERT(aux_map.size() == phi.clause_count());
  auto start = clock_type::now();

  const bool has_deadline = budget.max_duration_ms != 0 &&
                            budget.max_duration_ms <= longest_deadline_ms();
  const auto duration = std::chrono::milliseconds(
      has_deadline ? static_cast<std::chrono::milliseconds::rep>(
                         budget.max_duration_ms)
                   : 0);
  search_state_t st{psi,
                    canonical,
                    fcs,
                    phi,
                    aux_map,
                    budget,
                    worker_count(budget.threads, subset_count(fcs.size())),
                    has_deadline,
                    start + duration};
  st.is_aux.construct(psi.var_count);
  for (variable_t a : aux_map) st.is_aux.set(a);

  std::vector<worker_result_t> partial(st.workers);
  if (st.workers == 1) {
    run_worker(st, 0, partial[0]);
  } else {
    std::vector<std::thread> pool;
    pool.reserve(st.workers);
    unsigned started = 0;
    for (; started < st.workers; started++) {
      try {
        pool.emplace_back(run_worker, std::ref(st), started,
                          std::ref(partial[started]));
      } catch (const std::system_error &) {
        cond_log(settings::verbose, pipeline_action::search_short_of_threads,
                 started, st.workers);
        break;
      }
    }
    // Worker slots we could not start still own their share of the subsets.
    for (unsigned w = started; w < st.workers; w++) {
      run_worker(st, w, partial[w]);
    }
    for (auto &t : pool) t.join();
  }

  filter_result_t result;
  result.stats.free_groups = fcs.size();
  result.stats.subset_space = subset_count(fcs.size());
  result.stats.workers = st.workers;
  bool out_of_budget = false;
  for (auto &p : partial) {
    result.stats.subsets_explored += p.stats.subsets_explored;
    result.stats.candidates_consistent += p.stats.candidates_consistent;
    result.stats.candidates_spurious += p.stats.candidates_spurious;
    result.stats.largest_subset =
        std::max(result.stats.largest_subset, p.stats.largest_subset);
    out_of_budget = out_of_budget || p.out_of_budget;
    for (auto &wit : p.witnesses) result.witnesses.push_back(std::move(wit));
  }
  std::sort(std::begin(result.witnesses), std::end(result.witnesses),
            [](const witness_t &a, const witness_t &b) {
              return a.subset_index < b.subset_index;
            });
  result.stats.cut_short = out_of_budget;
  size_t keep = std::max<size_t>(1, budget.max_witnesses);
  if (result.witnesses.size() > keep) result.witnesses.resize(keep);

  if (!result.witnesses.empty()) {
    result.status = filter_status_t::found;
  } else if (out_of_budget) {
    result.status = filter_status_t::budget_exceeded;
    cond_log(settings::trace_search, pipeline_action::search_budget_exceeded,
             result.stats.subsets_explored);
  } else {
    result.status = filter_status_t::exhausted;
    cond_log(settings::trace_search, pipeline_action::search_exhausted,
             result.stats.subsets_explored);
  }
  std::chrono::duration<double> elapsed = clock_type::now() - start;
  result.stats.elapsed_seconds = elapsed.count();
  GSAT_ASSERT(result.stats.subsets_explored <= result.stats.subset_space);
  return result;
}

}  // namespace gsat
