#pragma once
#include <vector>

#include "implication_graph.h"

// The strongly connected components of an implication graph, contracted into
// a DAG. Component ids are positions in reverse topological order: every
// condensation edge c -> d has d < c, so component 0 is a sink.
struct condensation_t {
  literal_map_t<size_t> component;
  std::vector<std::vector<literal_t>> members;
  // Deduplicated and ascending. A component is never its own successor.
  std::vector<std::vector<size_t>> successors;

  size_t size() const { return members.size(); }

  // The component holding the negations of c's members.
  size_t dual(size_t c) const { return component[neg(members[c][0])]; }
  bool contradictory(variable_t v) const {
    return component[lit(v)] == component[neg(lit(v))];
  }
};

namespace gsat {
// Tarjan's algorithm, iterative. Nodes are started in ascending order and
// edges followed in insertion order, so the result is deterministic.
condensation_t condense(const implication_graph_t &g);
}  // namespace gsat
