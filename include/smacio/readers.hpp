#pragma once

// smacio: readers.hpp
// Readers for the files of a SMAC state-run folder. Each one takes a path,
// reads the whole file and returns plain records, or throws reader_error.

#include <smacio/json.hpp>
#include <smacio/stream.hpp>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <map>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace smacio {

enum class reader_errc {
  io_failed,
  format_mismatch
};

inline const char* to_string(reader_errc kind) noexcept {
  switch (kind) {
    case reader_errc::io_failed: return "cannot read file";
    case reader_errc::format_mismatch: return "format mismatch";
  }
  return "unknown error";
}

class reader_error : public std::runtime_error {
public:
  reader_error(reader_errc kind, std::string path, std::size_t line, const std::string& what)
      : std::runtime_error(make_message(kind, path, line, what)), kind_(kind), path_(std::move(path)), line_(line) {}

  reader_errc kind() const noexcept { return kind_; }
  const std::string& path() const noexcept { return path_; }
  // 1-based line of the offending record, 0 when the whole file is at fault.
  std::size_t line() const noexcept { return line_; }

private:
  static std::string make_message(reader_errc kind, const std::string& path, std::size_t line, const std::string& what) {
    std::string msg = "smacio: ";
    msg += to_string(kind);
    msg += ": " + path;
    if (line != 0) msg += ":" + std::to_string(line);
    if (!what.empty()) msg += ": " + what;
    return msg;
  }

  reader_errc kind_;
  std::string path_;
  std::size_t line_;
};

// Parameter name -> value exactly as written in the file, in file order.
// A repeated name keeps its first position and takes the last value.
class param_map {
public:
  using value_type = std::pair<std::string, std::string>;
  using const_iterator = std::vector<value_type>::const_iterator;

  void set(std::string name, std::string val) {
    for (auto& kv : entries_) {
      if (kv.first == name) {
        kv.second = std::move(val);
        return;
      }
    }
    entries_.emplace_back(std::move(name), std::move(val));
  }

  const std::string* find(std::string_view name) const noexcept {
    for (const auto& kv : entries_) {
      if (kv.first == name) return &kv.second;
    }
    return nullptr;
  }

  const std::string& at(std::string_view name) const {
    const std::string* v = find(name);
    if (!v) throw std::out_of_range("smacio: no parameter named '" + std::string(name) + "'");
    return *v;
  }

  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  const_iterator begin() const noexcept { return entries_.begin(); }
  const_iterator end() const noexcept { return entries_.end(); }

private:
  std::vector<value_type> entries_;
};

// Row-major table of doubles.
struct numeric_table {
  std::size_t rows{0};
  std::size_t cols{0};
  std::vector<double> data;

  double at(std::size_t r, std::size_t c) const {
    if (r >= rows || c >= cols) throw std::out_of_range("smacio: numeric_table index out of range");
    return data[r * cols + c];
  }
};

struct instance_features {
  std::vector<std::string> names;
  std::map<std::string, std::vector<double>> features;
};

namespace detail {

inline std::vector<std::string> read_lines(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw reader_error(reader_errc::io_failed, path, 0, {});

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
  }
  if (in.bad()) throw reader_error(reader_errc::io_failed, path, 0, {});
  return lines;
}

inline std::string_view trim(std::string_view s) noexcept {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && (is_ws(s[b]) || s[b] == '\f' || s[b] == '\v')) ++b;
  while (e > b && (is_ws(s[e - 1]) || s[e - 1] == '\f' || s[e - 1] == '\v')) --e;
  return s.substr(b, e - b);
}

inline std::string_view strip(std::string_view s, char c) noexcept {
  while (!s.empty() && s.front() == c) s.remove_prefix(1);
  while (!s.empty() && s.back() == c) s.remove_suffix(1);
  return s;
}

inline bool is_blank(std::string_view s) noexcept { return trim(s).empty(); }

inline std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> out;
  std::size_t begin = 0;
  for (;;) {
    const std::size_t end = s.find(sep, begin);
    if (end == std::string_view::npos) {
      out.push_back(s.substr(begin));
      return out;
    }
    out.push_back(s.substr(begin, end - begin));
    begin = end + 1;
  }
}

inline std::vector<std::string> split_ws(std::string_view s) {
  std::vector<std::string> out;
  std::istringstream in{std::string(s)};
  std::string tok;
  while (in >> tok) out.push_back(std::move(tok));
  return out;
}

// Whole-field decimal conversion; surrounding whitespace is allowed.
inline bool to_double(std::string_view field, double& out) {
  field = trim(field);
  if (field.empty()) return false;
  const std::string tmp(field);
  char* end = nullptr;
  out = std::strtod(tmp.c_str(), &end);
  return end == tmp.c_str() + tmp.size();
}

inline double field_to_double(std::string_view field, const std::string& path, std::size_t line_no) {
  double d = 0.0;
  if (!to_double(field, d)) {
    throw reader_error(reader_errc::format_mismatch, path, line_no, "not a number: '" + std::string(field) + "'");
  }
  return d;
}

} // namespace detail

// Streams a file of concatenated JSON values, such as live-rundata-*.json.
inline std::vector<value> read_json_stream_file(const std::string& path, stream_options opt = {}) {
  file_source src(path);
  if (!src.is_open()) throw reader_error(reader_errc::io_failed, path, 0, {});
  return parse_stream(src, opt);
}

// Numeric code of a run result: TIMEOUT 0, UNSAT 1, SAT 2, anything else
// (ABORT, CRASHED) -1. UNSAT is tested before SAT since it contains it.
inline double run_result_code(std::string_view result) noexcept {
  if (result.find("TIMEOUT") != std::string_view::npos) return 0.0;
  if (result.find("UNSAT") != std::string_view::npos) return 1.0;
  if (result.find("SAT") != std::string_view::npos) return 2.0;
  return -1.0;
}

// Reads runs_and_results-*.csv. Keeps file columns 1-13 and 15 (column 0 is
// the run number and column 14 is always empty); column 13 holds the run
// result and goes through run_result_code().
inline numeric_table read_runs_and_results_file(const std::string& path) {
  constexpr std::size_t kResultColumn = 13;
  constexpr std::size_t kLastColumn = 15;

  const std::vector<std::string> lines = detail::read_lines(path);

  numeric_table t;
  t.cols = kLastColumn - 1;
  for (std::size_t n = 1; n < lines.size(); ++n) {
    if (detail::is_blank(lines[n])) continue;
    const auto fields = detail::split(lines[n], ',');
    if (fields.size() <= kLastColumn) {
      throw reader_error(reader_errc::format_mismatch, path, n + 1,
                         "expected at least " + std::to_string(kLastColumn + 1) + " columns, got " + std::to_string(fields.size()));
    }
    for (std::size_t c = 1; c <= kResultColumn; ++c) {
      if (c == kResultColumn) t.data.push_back(run_result_code(fields[c]));
      else t.data.push_back(detail::field_to_double(fields[c], path, n + 1));
    }
    t.data.push_back(detail::field_to_double(fields[kLastColumn], path, n + 1));
    ++t.rows;
  }
  return t;
}

// Reads paramstrings-*.txt: one configuration per line, written as
// "<run id>: name1='v1', name2='v2', ...". Values stay strings.
inline std::vector<param_map> read_paramstrings_file(const std::string& path) {
  const std::vector<std::string> lines = detail::read_lines(path);

  std::vector<param_map> out;
  for (std::size_t n = 0; n < lines.size(); ++n) {
    if (detail::is_blank(lines[n])) continue;
    std::string_view body = lines[n];
    const std::size_t colon = body.find(':');
    if (colon != std::string_view::npos) body.remove_prefix(colon + 1);

    std::string unquoted;
    unquoted.reserve(body.size());
    for (char c : body) {
      if (c != '\'') unquoted.push_back(c);
    }

    param_map params;
    for (std::string_view pair : detail::split(unquoted, ',')) {
      const auto kv = detail::split(detail::trim(pair), '=');
      if (kv.size() != 2) {
        throw reader_error(reader_errc::format_mismatch, path, n + 1, "expected name=value, got '" + std::string(pair) + "'");
      }
      params.set(std::string(kv[0]), std::string(kv[1]));
    }
    out.push_back(std::move(params));
  }
  return out;
}

// Reads validationCallStrings-*.csv: a header, then lines whose second field
// is a quoted call string of "-name 'value'" pairs.
inline std::vector<param_map> read_validation_call_strings_file(const std::string& path) {
  const std::vector<std::string> lines = detail::read_lines(path);

  std::vector<param_map> out;
  for (std::size_t n = 1; n < lines.size(); ++n) {
    if (detail::is_blank(lines[n])) continue;
    const auto fields = detail::split(lines[n], ',');
    if (fields.size() < 2) {
      throw reader_error(reader_errc::format_mismatch, path, n + 1, "missing call string column");
    }

    const auto tokens = detail::split_ws(detail::strip(detail::trim(fields[1]), '"'));
    if (tokens.size() % 2 != 0) {
      throw reader_error(reader_errc::format_mismatch, path, n + 1, "flag without value in call string");
    }

    param_map params;
    for (std::size_t k = 0; k < tokens.size(); k += 2) {
      std::string_view flag = tokens[k];
      while (!flag.empty() && flag.front() == '-') flag.remove_prefix(1);
      params.set(std::string(flag), std::string(detail::strip(tokens[k + 1], '\'')));
    }
    out.push_back(std::move(params));
  }
  return out;
}

// Reads validationObjectiveMatrix-*.csv. The header has two leading columns
// followed by one column per configuration; each row is
// "id_<n>","<instance seed>","<score>",... with every field quoted.
inline std::map<int, std::vector<double>> read_validation_objective_matrix_file(const std::string& path) {
  const std::vector<std::string> lines = detail::read_lines(path);
  if (lines.empty()) throw reader_error(reader_errc::format_mismatch, path, 1, "missing header");

  const std::size_t header_fields = detail::split(lines[0], ',').size();
  if (header_fields < 2) throw reader_error(reader_errc::format_mismatch, path, 1, "header needs at least two columns");
  const std::size_t num_configs = header_fields - 2;

  std::string pattern = R"re("id_(\d*)"\s*,\s*"(\d*)")re";
  for (std::size_t k = 0; k < num_configs; ++k) pattern += R"re(\s*,\s*"([0-9.]*)")re";
  const std::regex row_re(pattern);

  std::map<int, std::vector<double>> out;
  for (std::size_t n = 1; n < lines.size(); ++n) {
    if (detail::is_blank(lines[n])) continue;
    std::smatch m;
    if (!std::regex_search(lines[n], m, row_re, std::regex_constants::match_continuous)) {
      throw reader_error(reader_errc::format_mismatch, path, n + 1, "row does not match the header layout");
    }

    int id = 0;
    try {
      id = std::stoi(m.str(1));
    } catch (const std::exception&) {
      throw reader_error(reader_errc::format_mismatch, path, n + 1, "bad id '" + m.str(1) + "'");
    }

    std::vector<double> scores;
    scores.reserve(num_configs);
    for (std::size_t k = 0; k < num_configs; ++k) scores.push_back(detail::field_to_double(m.str(3 + k), path, n + 1));
    out[id] = std::move(scores);
  }
  return out;
}

// Reads an instance file: per line the instance name, then any auxiliary
// tokens. Blank lines give empty entries.
inline std::vector<std::vector<std::string>> read_instances_file(const std::string& path) {
  const std::vector<std::string> lines = detail::read_lines(path);

  std::vector<std::vector<std::string>> out;
  out.reserve(lines.size());
  for (const auto& line : lines) out.push_back(detail::split_ws(line));
  return out;
}

// Reads an instance feature file: a header "instance,f1,f2,..." followed by
// one row of numbers per instance.
inline instance_features read_instance_features_file(const std::string& path) {
  const std::vector<std::string> lines = detail::read_lines(path);
  if (lines.empty()) throw reader_error(reader_errc::format_mismatch, path, 1, "missing header");

  instance_features out;
  const auto header = detail::split(lines[0], ',');
  for (std::size_t k = 1; k < header.size(); ++k) out.names.emplace_back(detail::trim(header[k]));

  for (std::size_t n = 1; n < lines.size(); ++n) {
    if (detail::is_blank(lines[n])) continue;
    const auto fields = detail::split(detail::trim(lines[n]), ',');
    if (fields.size() != out.names.size() + 1) {
      throw reader_error(reader_errc::format_mismatch, path, n + 1,
                         "expected " + std::to_string(out.names.size()) + " features, got " + std::to_string(fields.size() - 1));
    }

    std::vector<double> row;
    row.reserve(out.names.size());
    for (std::size_t k = 1; k < fields.size(); ++k) row.push_back(detail::field_to_double(fields[k], path, n + 1));
    out.features[std::string(detail::trim(fields[0]))] = std::move(row);
  }
  return out;
}

} // namespace smacio
