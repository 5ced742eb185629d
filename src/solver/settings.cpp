#include "settings.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
namespace settings {
bool print_parse = false;
bool print_psi = false;
bool print_certificate = false;
bool two_cnf = false;

bool trace_decide = false;
bool trace_free_choices = false;
bool trace_search = false;
bool report_metrics = false;
bool verbose = false;

bool debug_max = false;
bool help = false;

bool limit_subsets = false;
bool limit_duration = false;
bool parallel_search = false;
bool multiple_models = false;
bool read_file = false;
bool write_file = false;

constexpr uint64_t max_threads = 1024;
constexpr uint64_t max_models_limit = uint64_t{1} << 32;

struct flag_t {
  enum class param_t { none, number, text };
  std::string name;
  std::string description;
  bool& value;
  param_t param_kind = param_t::none;
  // Largest accepted value of a number parameter.
  uint64_t max_value = std::numeric_limits<uint64_t>::max();
  std::string param = "";
};
using param_t = flag_t::param_t;

std::vector<flag_t> options{
    {"input", "Read the formula from this file rather than stdin", read_file,
     param_t::text},
    {"out", "Write the projected models (or UNSAT marker) to this file",
     write_file, param_t::text},
    {"two-cnf", "Input is a 2-CNF formula: decide it directly", two_cnf},
    {"max-subsets", "Stop the filter search after this many candidates",
     limit_subsets, param_t::number},
    {"max-duration-ms", "Stop the filter search after this many milliseconds",
     limit_duration, param_t::number},
    {"threads", "Number of filter search workers (1 to 1024)",
     parallel_search, param_t::number, max_threads},
    {"max-models", "Collect up to this many distinct projected models",
     multiple_models, param_t::number, max_models_limit},
    {"print-parse", "Output the formula just after parsing (for debugging)",
     print_parse},
    {"print-psi", "Output the transformed 2-CNF formula", print_psi},
    {"print-certificate",
     "Output our solution (if sat) as DIMACS literals, one per line",
     print_certificate},
    {"trace-decide", "Trace the SCC condensation and canonical assignment",
     trace_decide},
    {"trace-free-choices", "Trace the free choice analysis",
     trace_free_choices},
    {"trace-search", "Trace every candidate of the filter search",
     trace_search},
    {"report-metrics", "Print pipeline counters and timings", report_metrics},
    {"verbose", "Say what the pipeline is doing", verbose},
    {"debug-max", "Run a lot more asserts", debug_max},
    {"help", "Print this message", help},
};

static const flag_t& find_flag(const char* name) {
  auto flag = std::find_if(std::begin(options), std::end(options),
                           [&](const flag_t& o) { return o.name == name; });
  return *flag;
}

static uint64_t number_param(const char* name) {
  return std::strtoull(find_flag(name).param.c_str(), nullptr, 10);
}

uint64_t max_subsets() { return limit_subsets ? number_param("max-subsets") : 0; }
uint64_t max_duration_ms() {
  return limit_duration ? number_param("max-duration-ms") : 0;
}
unsigned threads() {
  if (!parallel_search) return 1;
  uint64_t n = number_param("threads");
  return n ? static_cast<unsigned>(n) : 1;
}
size_t max_models() {
  return multiple_models ? static_cast<size_t>(number_param("max-models")) : 1;
}
const char* input_path() { return find_flag("input").param.c_str(); }
const char* output_path() { return find_flag("out").param.c_str(); }

static bool is_number(const std::string& s) {
  return !s.empty() && s.size() <= 19 &&
         std::all_of(std::begin(s), std::end(s),
                     [](char c) { return c >= '0' && c <= '9'; });
}

int parse(int argc, char* argv[]) {
  for (int i = 1; i < argc; i++) {
    char* arg = argv[i];
    auto n = strlen(arg);
    if (n < 3) {
      return i;  // error
    }
    if (arg[0] != '-' || arg[1] != '-') {
      return i;
    }
    arg++;
    arg++;

    char* argend = &arg[strlen(arg)];

    auto param_ptr = std::find(arg, argend, '=');
    std::string param_value = "";
    bool has_param = param_ptr != argend;
    if (has_param) {
      std::copy(param_ptr + 1, argend, std::back_inserter(param_value));
    }
    std::string name(arg, param_ptr);

    bool found = false;
    for (auto& p : options) {
      if (p.name != name) continue;
      found = true;
      if (p.param_kind == param_t::none) {
        if (has_param) return i;
        // This is a flag, flip it from default
        p.value = !p.value;
      } else {
        if (!has_param) return i;
        if (p.param_kind == param_t::number &&
            (!is_number(param_value) ||
             std::strtoull(param_value.c_str(), nullptr, 10) > p.max_value)) {
          return i;
        }
        p.value = true;
        p.param = param_value;
      }
      break;
    }
    if (!found) {
      return i;
    }
  }
  return 0;  // success
}

void print_help() {
  printf("Usage: gadgetsat [--flag | --flag=value]...\n");
  printf("Reads a 3-CNF formula (DIMACS or one clause per line) from stdin.\n\n");
  for (const auto& p : options) {
    std::string spelled = "--" + p.name;
    if (p.param_kind == param_t::number) spelled += "=N";
    if (p.param_kind == param_t::text) spelled += "=PATH";
    printf("  %-24s %s\n", spelled.c_str(), p.description.c_str());
  }
}
}  // namespace settings
