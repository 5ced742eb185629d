#pragma once
#include <cstdint>
#include <cstddef>

namespace settings {
extern bool print_parse;
extern bool print_psi;
extern bool print_certificate;
extern bool two_cnf;

extern bool trace_decide;
extern bool trace_free_choices;
extern bool trace_search;
extern bool report_metrics;
extern bool verbose;

extern bool debug_max;
extern bool help;

// These are set when the matching "--flag=value" is given.
extern bool limit_subsets;
extern bool limit_duration;
extern bool parallel_search;
extern bool multiple_models;
extern bool read_file;
extern bool write_file;

uint64_t max_subsets();
uint64_t max_duration_ms();
unsigned threads();
size_t max_models();
const char* input_path();
const char* output_path();

int parse(int argc, char* argv[]);
void print_help();
}  // namespace settings
