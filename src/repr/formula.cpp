#include "formula.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include "debug.h"

const char *to_string(formula_status_t s) {
  switch (s) {
    case formula_status_t::ok:
      return "ok";
    case formula_status_t::malformed_clause:
      return "malformed clause";
    case formula_status_t::variable_out_of_range:
      return "variable out of range";
    case formula_status_t::parse_error:
      return "parse error";
    case formula_status_t::empty_input:
      return "empty input";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &o, const formula_t &f) {
  o << "p cnf " << f.var_count << " " << f.clause_count() << "\n";
  std::for_each(std::begin(f), std::end(f),
                [&o](const clause_t &c) { o << c << "0\n"; });
  return o;
}

namespace gsat {

formula_error_t validate(const formula_t &f) {
  for (size_t i = 0; i < f.clause_count(); i++) {
    const clause_t &c = f[i];
    if (!c.has_arity(f.kind)) {
      return {formula_status_t::malformed_clause, i};
    }
    for (literal_t l : c) {
      if (l < 0 || var(l) >= f.var_count) {
        return {formula_status_t::variable_out_of_range, i};
      }
    }
  }
  return {};
}

bool satisfies(const assignment_t &a, const formula_t &f) {
  GSAT_ASSERT(a.var_count() >= f.var_count);
  return std::all_of(std::begin(f), std::end(f),
                     [&](const clause_t &c) { return a.clause_sat(c); });
}

namespace io {

namespace {

bool parse_int(const std::string &tok, long &out) {
  if (tok.empty()) return false;
  errno = 0;
  char *end = nullptr;
  out = std::strtol(tok.c_str(), &end, 10);
  return errno == 0 && *end == '\0' && out > -(1L << 30) && out < (1L << 30);
}

bool blank(const std::string &line) {
  return std::all_of(std::begin(line), std::end(line),
                     [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

// Either every variable was declared in a header, or the count is the largest
// variable mentioned. clause_lines[i] is the line that ended clause i.
formula_error_t finish(formula_t &f, bool has_header, variable_t max_seen,
                       const std::vector<size_t> &clause_lines) {
  if (!has_header) {
    f.var_count = max_seen;
    return {};
  }
  if (max_seen > f.var_count) {
    for (size_t i = 0; i < f.clause_count(); i++) {
      for (literal_t l : f[i]) {
        if (var(l) >= f.var_count) {
          return {formula_status_t::variable_out_of_range, clause_lines[i]};
        }
      }
    }
  }
  return {};
}

}  // namespace

formula_error_t load_dimacs(std::istream &in, clause_kind_t kind,
                            formula_t &f) {
  f = formula_t(kind, 0);
  bool has_header = false;
  variable_t max_seen = 0;
  std::vector<literal_t> next_clause_tmp;
  std::vector<size_t> clause_lines;

  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    line_no++;
    if (blank(line)) continue;
    std::istringstream iss(line);
    std::string tok;
    iss >> tok;
    if (tok[0] == 'c') continue;
    // SATLIB files end with a "%" line.
    if (tok[0] == '%') break;
    if (tok == "p") {
      std::string format, vars;
      iss >> format >> vars;
      long n;
      if (has_header || format != "cnf" || !parse_int(vars, n) || n < 0) {
        return {formula_status_t::parse_error, line_no};
      }
      has_header = true;
      f.var_count = static_cast<variable_t>(n);
      continue;
    }
    do {
      long x;
      if (!parse_int(tok, x)) {
        return {formula_status_t::parse_error, line_no};
      }
      if (x == 0) {
        if (next_clause_tmp.size() != arity(kind)) {
          return {formula_status_t::malformed_clause, line_no};
        }
        f.add_clause(next_clause_tmp);
        clause_lines.push_back(line_no);
        next_clause_tmp.clear();
        continue;
      }
      max_seen = std::max<variable_t>(max_seen, std::abs(x));
      next_clause_tmp.push_back(dimacs_to_lit(static_cast<int>(x)));
    } while (iss >> tok);
  }
  if (!next_clause_tmp.empty()) {
    // The last clause never saw its terminating 0.
    return {formula_status_t::parse_error, line_no};
  }
  return finish(f, has_header, max_seen, clause_lines);
}

formula_error_t load_simple(std::istream &in, clause_kind_t kind,
                            formula_t &f) {
  f = formula_t(kind, 0);
  variable_t max_seen = 0;

  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    line_no++;
    if (blank(line)) continue;
    std::istringstream iss(line);
    std::string tok;
    clause_t c;
    while (iss >> tok) {
      if (tok[0] == '#') break;
      long x;
      if (!parse_int(tok, x) || x == 0) {
        return {formula_status_t::parse_error, line_no};
      }
      max_seen = std::max<variable_t>(max_seen, std::abs(x));
      c.push_back(dimacs_to_lit(static_cast<int>(x)));
    }
    if (c.empty()) continue;  // a comment line
    if (!c.has_arity(kind)) {
      return {formula_status_t::malformed_clause, line_no};
    }
    f.add_clause(std::move(c));
  }
  return finish(f, false, max_seen, {});
}

formula_error_t load_formula(std::istream &in, clause_kind_t kind,
                             formula_t &f) {
  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string text = buffer.str();

  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (blank(line)) continue;
    std::istringstream iss(line);
    std::string first, last, tok;
    iss >> first;
    if (first[0] == 'c' || first[0] == '#') continue;
    last = first;
    while (iss >> tok) last = tok;

    std::istringstream whole(text);
    if (first == "p" || last == "0") {
      return load_dimacs(whole, kind, f);
    }
    return load_simple(whole, kind, f);
  }
  return {formula_status_t::empty_input, 0};
}

}  // namespace io
}  // namespace gsat
