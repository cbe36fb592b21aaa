#pragma once

#include <smacio/smacio.hpp>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace smacio_test {

[[noreturn]] inline void fail(const char* expr, const char* file, int line, const char* msg = nullptr) {
  std::cerr << "TEST FAILED: " << (expr ? expr : "") << "\n  at " << file << ":" << line;
  if (msg && *msg) std::cerr << "\n  " << msg;
  std::cerr << "\n";
  std::abort();
}

inline void check(bool ok, const char* expr, const char* file, int line) {
  if (!ok) fail(expr, file, line);
}

template <class Fn>
inline void expect_throw(Fn&& fn, const char* expr, const char* file, int line) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  fail(expr, file, line, "expected exception, got none");
}

inline bool nearly_equal(double a, double b, double abs_eps = 1e-12, double rel_eps = 1e-12) {
  const double diff = std::fabs(a - b);
  if (diff <= abs_eps) return true;
  const double aa = std::fabs(a);
  const double bb = std::fabs(b);
  const double m = (aa > bb) ? aa : bb;
  return diff <= rel_eps * m;
}

} // namespace smacio_test

#define SMACIO_CHECK(expr) ::smacio_test::check(!!(expr), #expr, __FILE__, __LINE__)
#define SMACIO_EXPECT_THROW(expr) ::smacio_test::expect_throw([&] { (void)(expr); }, #expr, __FILE__, __LINE__)

namespace smacio_test {

inline void check_err(const smacio::error& e, smacio::error_code code) {
  ::smacio_test::check(static_cast<bool>(e), "static_cast<bool>(e)", __FILE__, __LINE__);
  ::smacio_test::check(e.code == code, "e.code == code", __FILE__, __LINE__);
}

// Structural equality; numbers compare by value within a small tolerance.
inline bool deep_equal(const smacio::value& a, const smacio::value& b) {
  using smacio::value;
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case value::kind::null: return true;
    case value::kind::boolean: return a.as_bool() == b.as_bool();
    case value::kind::number:
      if (a.is_int() && b.is_int()) return a.as_int() == b.as_int();
      return nearly_equal(a.as_double(), b.as_double(), 1e-9, 1e-9);
    case value::kind::string: return a.as_string() == b.as_string();
    case value::kind::array: {
      const auto& aa = a.as_array();
      const auto& ab = b.as_array();
      if (aa.size() != ab.size()) return false;
      for (std::size_t i = 0; i < aa.size(); ++i) {
        if (!deep_equal(aa[i], ab[i])) return false;
      }
      return true;
    }
    case value::kind::object: {
      const auto& oa = a.as_object();
      const auto& ob = b.as_object();
      if (oa.size() != ob.size()) return false;
      for (std::size_t i = 0; i < oa.size(); ++i) {
        if (oa[i].first != ob[i].first || !deep_equal(oa[i].second, ob[i].second)) return false;
      }
      return true;
    }
  }
  return false;
}

// Compact dumps of every value the stream yields, read `chunk` bytes at a time.
inline std::vector<std::string> stream_dumps(std::string_view text, std::size_t chunk) {
  smacio::string_source src(text);
  smacio::stream_options opt;
  opt.chunk_size = chunk;
  std::vector<std::string> out;
  smacio::for_each_value(src, [&out](smacio::value&& v) { out.push_back(smacio::dump(v)); }, opt);
  return out;
}

// Scratch file under the working directory, removed on destruction.
class temp_file {
public:
  temp_file(const std::string& name, std::string_view contents) : path_("smacio_test_" + name) {
    std::ofstream out(path_, std::ios::binary);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    check(static_cast<bool>(out), "write temp file", __FILE__, __LINE__);
  }
  ~temp_file() { std::remove(path_.c_str()); }

  temp_file(const temp_file&) = delete;
  temp_file& operator=(const temp_file&) = delete;

  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
};

} // namespace smacio_test
