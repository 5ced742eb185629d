#pragma once
#include <chrono>
#include <cstdio>
#include <vector>
#include "assignment.h"
#include "clause.h"
#include "settings.h"

// Every traced event starts with one of these, so a trace can be grepped or
// post-processed by number.
enum class pipeline_action {
  transform_start,
  transform_end,
  graph_built,           // 2
  component_found,       // 3
  variable_resolved,     // 4
  decided_sat,
  decided_unsat,
  free_group,            // 7
  forced_variable,       // 8
  free_choices_done,
  search_layer,          // 10
  candidate_inconsistent,
  candidate_spurious,
  candidate_found,       // 13
  search_exhausted,
  search_budget_exceeded,
  search_short_of_threads,
  projected,
};

template <typename T>
void log_action_element(const T& t);

template <>
inline void log_action_element(
    const std::chrono::time_point<std::chrono::steady_clock>& c) {
  printf("%ldms ", static_cast<long>(
                       std::chrono::duration_cast<std::chrono::milliseconds>(
                           c.time_since_epoch())
                           .count()));
}
template <>
inline void log_action_element(const pipeline_action& a) {
  printf("%d ", static_cast<int>(a));
}
// Literals are always logged in their DIMACS form, callers convert.
template <>
inline void log_action_element(const int& l) {
  printf("%d ", l);
}
template <>
inline void log_action_element(const bool& b) {
  printf("%s ", b ? "true" : "false");
}
template <>
inline void log_action_element(const unsigned& l) {
  printf("%u ", l);
}
template <>
inline void log_action_element(const unsigned long& l) {
  printf("%lu ", l);
}
template <>
inline void log_action_element(const unsigned long long& l) {
  printf("%llu ", l);
}
template <>
inline void log_action_element(const double& d) {
  printf("%.3f ", d);
}
template <>
inline void log_action_element(const char& c) {
  printf("%c ", c);
}
template <>
inline void log_action_element(const clause_t& c) {
  printf("{ ");
  for (auto l : c) {
    printf("%d ", lit_to_dimacs(l));
  }
  printf("}");
}
template <>
inline void log_action_element(const std::vector<literal_t>& c) {
  printf("{ ");
  for (auto l : c) {
    printf("%d ", lit_to_dimacs(l));
  }
  printf("}");
}
template <>
inline void log_action_element(const std::vector<size_t>& s) {
  printf("[ ");
  for (auto i : s) {
    printf("%zu ", i);
  }
  printf("]");
}
template <>
inline void log_action_element(const assignment_t& a) {
  for (variable_t v = 0; v < a.var_count(); v++) {
    printf("%c", a.value(v) ? '1' : '0');
  }
  printf(" ");
}

inline void log_pipeline_action(void) { printf("\n"); }

template <typename T, typename... Rest>
inline void log_pipeline_action(const T& a, const Rest&... rest) {
  log_action_element(a);
  log_pipeline_action(rest...);
}
template <typename... Rest>
inline void cond_log(const bool f, const Rest&... rest) {
  if (f) {
    log_pipeline_action(rest...);
  }
}
