#pragma once

// smacio: header-only C++17 readers for the output files of SMAC runs.
// json.hpp: strict JSON DOM and a prefix decoder that tells truncated input
// apart from malformed input, so callers can feed it a stream piecewise.

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cmath>
#if defined(_M_X64) || defined(__SSE2__)
  #if defined(_MSC_VER)
    #include <intrin.h>
  #endif
  #include <immintrin.h>
#endif
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace smacio {

// Config: floating-point parsing backend.
// Override by defining SMACIO_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef SMACIO_USE_FROM_CHARS_DOUBLE
  #define SMACIO_USE_FROM_CHARS_DOUBLE 0
#endif

enum class error_code {
  ok = 0,
  unexpected_eof,
  invalid_value,
  invalid_number,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf16_surrogate,
  expected_colon,
  expected_comma_or_end,
  expected_key_string,
  trailing_characters,
  nesting_too_deep
};

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_eof: return "unexpected end of input";
    case error_code::invalid_value: return "invalid value";
    case error_code::invalid_number: return "invalid number";
    case error_code::invalid_string: return "invalid string";
    case error_code::invalid_escape: return "invalid escape";
    case error_code::invalid_unicode_escape: return "invalid unicode escape";
    case error_code::invalid_utf16_surrogate: return "invalid utf-16 surrogate";
    case error_code::expected_colon: return "expected ':'";
    case error_code::expected_comma_or_end: return "expected ',' or closing bracket";
    case error_code::expected_key_string: return "expected object key string";
    case error_code::trailing_characters: return "trailing characters";
    case error_code::nesting_too_deep: return "nesting too deep";
  }
  return "unknown error";
}

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

// Running out of bytes is the only failure more input can repair.
constexpr bool is_truncation(error_code code) noexcept { return code == error_code::unexpected_eof; }

class parse_error : public std::runtime_error {
public:
  explicit parse_error(const error& e, std::string excerpt = {})
      : std::runtime_error(make_message(e, excerpt)), err_(e), excerpt_(std::move(excerpt)) {}

  const error& err() const noexcept { return err_; }
  // A few bytes of input starting at the failure, for diagnostics.
  const std::string& excerpt() const noexcept { return excerpt_; }

private:
  static std::string make_message(const error& e, const std::string& excerpt) {
    std::string msg = "smacio: ";
    msg += to_string(e.code);
    msg += " at line " + std::to_string(e.line) + ", column " + std::to_string(e.column);
    msg += " (offset " + std::to_string(e.offset) + ")";
    if (!excerpt.empty()) {
      msg += " near \"";
      msg += excerpt;
      msg += '"';
    }
    return msg;
  }

  error err_;
  std::string excerpt_;
};

namespace detail {

inline void advance_line_col(const char* p, std::size_t n, std::size_t& line, std::size_t& col) noexcept {
  for (std::size_t k = 0; k < n; ++k) {
    if (p[k] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline void skip_ws(const char* buf, std::size_t size, std::size_t& i) noexcept {
  // Concatenated run data is often pretty-printed; scan 16 bytes at a time where SSE2 exists.
#if defined(_M_X64) || defined(__SSE2__)
  while (i + 16 <= size) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
    const __m128i ws = _mm_or_si128(
        _mm_or_si128(_mm_cmpeq_epi8(v, _mm_set1_epi8(' ')), _mm_cmpeq_epi8(v, _mm_set1_epi8('\n'))),
        _mm_or_si128(_mm_cmpeq_epi8(v, _mm_set1_epi8('\r')), _mm_cmpeq_epi8(v, _mm_set1_epi8('\t'))));
    const unsigned non_ws = (~static_cast<unsigned>(_mm_movemask_epi8(ws))) & 0xFFFFu;
    if (non_ws != 0u) {
#if defined(_MSC_VER)
      unsigned long idx = 0;
      _BitScanForward(&idx, non_ws);
      i += static_cast<std::size_t>(idx);
#else
      i += static_cast<std::size_t>(__builtin_ctz(non_ws));
#endif
      return;
    }
    i += 16;
  }
#endif

  while (i < size && is_ws(buf[i])) ++i;
}

inline void skip_ws(std::string_view s, std::size_t& i) noexcept {
  skip_ws(s.data(), s.size(), i);
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline int hex_val(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

inline double parse_double(std::string_view token) {
#if SMACIO_USE_FROM_CHARS_DOUBLE && defined(__cpp_lib_to_chars)
  {
    double v = 0.0;
    const char* last = token.data() + token.size();
    auto r = std::from_chars(token.data(), last, v, std::chars_format::general);
    if (r.ec == std::errc{} && r.ptr == last) return v;
  }
#endif

  // strtod needs a terminator; short tokens go through a stack buffer.
  constexpr std::size_t kStackCap = 128;
  if (token.size() < kStackCap) {
    char buf[kStackCap];
    if (!token.empty()) std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
    return std::strtod(buf, nullptr);
  }
  return std::strtod(std::string(token).c_str(), nullptr);
}

struct number_value {
  bool is_int{false};
  std::int64_t i{0};
  double d{0.0};
  // Source token of a non-integer, kept so dump() reproduces it exactly. Empty for built values.
  std::string raw{};
};

struct value_access;

} // namespace detail

class value {
public:
  using array = std::vector<value>;
  using object = std::vector<std::pair<std::string, value>>;

  enum class kind { null, boolean, number, string, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  static value integer(std::int64_t i) {
    detail::number_value n;
    n.is_int = true;
    n.i = i;
    n.d = static_cast<double>(i);
    value v;
    v.data_ = std::move(n);
    return v;
  }

  static value number(double d) {
    detail::number_value n;
    n.d = d;
    value v;
    v.data_ = std::move(n);
    return v;
  }

  kind type() const noexcept {
    switch (data_.index()) {
      case 1: return kind::boolean;
      case 2: return kind::number;
      case 3: return kind::string;
      case 4: return kind::array;
      case 5: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<detail::number_value>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool is_int() const noexcept {
    const auto* n = std::get_if<detail::number_value>(&data_);
    return n != nullptr && n->is_int;
  }

  bool as_bool() const { return std::get<bool>(data_); }

  std::int64_t as_int() const {
    const auto& n = std::get<detail::number_value>(data_);
    if (!n.is_int) throw std::runtime_error("smacio: number is not int");
    return n.i;
  }

  double as_double() const { return std::get<detail::number_value>(data_).d; }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  std::string& as_string() { return std::get<std::string>(data_); }
  array& as_array() { return std::get<array>(data_); }
  object& as_object() { return std::get<object>(data_); }

  // First member named `key`, or nullptr. Duplicate keys keep their source order.
  const value* find(std::string_view key) const noexcept {
    if (!is_object()) return nullptr;
    for (const auto& kv : std::get<object>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    return const_cast<value*>(static_cast<const value&>(*this).find(key));
  }

private:
  // index: 0 null, 1 bool, 2 number, 3 string, 4 array, 5 object
  std::variant<std::monostate, bool, detail::number_value, std::string, array, object> data_;

  friend struct detail::value_access;
};

namespace detail {

struct value_access {
  static value from_number(number_value n) {
    value v;
    v.data_ = std::move(n);
    return v;
  }
  static const number_value& number_of(const value& v) { return std::get<number_value>(v.data_); }
};

} // namespace detail

struct decode_options {
  std::size_t max_depth{256};
  // No more bytes will follow the text. When false, a complete-looking number
  // that runs into the end of the text is reported as incomplete. Text cut off
  // mid-token is incomplete either way.
  bool final_input{true};
};

enum class decode_status { success, incomplete, malformed };

struct decode_result {
  decode_status status{decode_status::malformed};
  value val;
  // Bytes of the text making up the value, leading whitespace included.
  std::size_t consumed{0};
  error err;
};

namespace detail {

struct decoder {
  std::string_view s;
  std::size_t i{0};
  decode_options opt;

  decode_result run() {
    decode_result r;
    skip_ws(s, i);
    r.val = parse_value(0, r.err);
    if (r.err) {
      r.val = nullptr;
      r.status = is_truncation(r.err.code) ? decode_status::incomplete : decode_status::malformed;
      return r;
    }
    r.status = decode_status::success;
    r.consumed = i;
    return r;
  }

  void set_error(error& e, error_code code, std::size_t at = std::numeric_limits<std::size_t>::max()) {
    if (e) return;
    e.code = code;
    e.offset = (at == std::numeric_limits<std::size_t>::max()) ? i : at;
    e.line = 1;
    e.column = 1;
    advance_line_col(s.data(), std::min(e.offset, s.size()), e.line, e.column);
  }

  value parse_value(std::size_t depth, error& e) {
    if (depth > opt.max_depth) {
      set_error(e, error_code::nesting_too_deep);
      return nullptr;
    }
    if (i >= s.size()) {
      set_error(e, error_code::unexpected_eof);
      return nullptr;
    }

    const char c = s[i];
    switch (c) {
      case 'n': return parse_literal("null", 4, nullptr, e);
      case 't': return parse_literal("true", 4, value(true), e);
      case 'f': return parse_literal("false", 5, value(false), e);
      case '"': {
        std::string out;
        if (!parse_string(out, e)) return nullptr;
        return value(std::move(out));
      }
      case '[': return parse_array(depth + 1, e);
      case '{': return parse_object(depth + 1, e);
      default:
        if (c == '-' || is_digit(c)) return parse_number(e);
        set_error(e, error_code::invalid_value);
        return nullptr;
    }
  }

  value parse_literal(const char* lit, std::size_t len, value v, error& e) {
    const std::size_t avail = std::min(len, s.size() - i);
    if (std::memcmp(s.data() + i, lit, avail) != 0) {
      set_error(e, error_code::invalid_value);
      return nullptr;
    }
    if (avail < len) {
      set_error(e, error_code::unexpected_eof);
      return nullptr;
    }
    i += len;
    return v;
  }

  value parse_number(error& e) {
    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    const std::size_t start = i;
    const std::size_t n = s.size();

    bool neg = false;
    if (s[i] == '-') {
      neg = true;
      ++i;
      // A bare '-' at the end is a prefix of a number, final input or not.
      if (i >= n) {
        set_error(e, error_code::unexpected_eof, start);
        return nullptr;
      }
    }

    std::uint64_t acc = 0;
    bool overflow = false;
    if (s[i] == '0') {
      ++i;
      if (i < n && is_digit(s[i])) {
        set_error(e, error_code::invalid_number, start);
        return nullptr;
      }
    } else if (is_digit(s[i])) {
      while (i < n && is_digit(s[i])) {
        const std::uint64_t d = static_cast<std::uint64_t>(s[i] - '0');
        if (!overflow && acc > (std::numeric_limits<std::uint64_t>::max() - d) / 10u) overflow = true;
        if (!overflow) acc = acc * 10u + d;
        ++i;
      }
    } else {
      set_error(e, error_code::invalid_number, start);
      return nullptr;
    }

    bool is_int = true;
    if (i < n && s[i] == '.') {
      is_int = false;
      if (!scan_digits(start, e)) return nullptr;
    }
    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
      is_int = false;
      if (i + 1 < n && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
      if (!scan_digits(start, e)) return nullptr;
    }

    // More digits may still be on their way.
    if (i == n && !opt.final_input) {
      set_error(e, error_code::unexpected_eof, start);
      return nullptr;
    }

    number_value num;
    const std::string_view token = s.substr(start, i - start);
    const std::uint64_t int_limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (is_int && !overflow && acc <= int_limit + (neg ? 1u : 0u)) {
      num.is_int = true;
      if (neg) {
        num.i = (acc == int_limit + 1u) ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(acc);
      } else {
        num.i = static_cast<std::int64_t>(acc);
      }
      num.d = static_cast<double>(num.i);
    } else {
      num.d = parse_double(token);
      num.raw.assign(token.data(), token.size());
    }
    return value_access::from_number(std::move(num));
  }

  // Skips the '.', 'e' or sign at s[i] and then a non-empty digit run.
  bool scan_digits(std::size_t token_start, error& e) {
    ++i;
    if (i >= s.size()) {
      set_error(e, error_code::unexpected_eof, token_start);
      return false;
    }
    if (!is_digit(s[i])) {
      set_error(e, error_code::invalid_number, token_start);
      return false;
    }
    while (i < s.size() && is_digit(s[i])) ++i;
    return true;
  }

  // Reads XXXX after "\u". A short but so far valid tail is truncation.
  bool parse_hex4(std::uint32_t& cp, error& e) {
    cp = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      if (i + k >= s.size()) {
        set_error(e, error_code::unexpected_eof);
        return false;
      }
      const int h = hex_val(s[i + k]);
      if (h < 0) {
        set_error(e, error_code::invalid_unicode_escape);
        return false;
      }
      cp = (cp << 4) | static_cast<std::uint32_t>(h);
    }
    i += 4;
    return true;
  }

  bool parse_string(std::string& out, error& e) {
    const std::size_t quote_pos = i;
    ++i;
    out.clear();

    const std::size_t n = s.size();
    std::size_t chunk_begin = i;
    while (i < n) {
      const char c = s[i];
      if (c == '"') {
        out.append(s.data() + chunk_begin, i - chunk_begin);
        ++i;
        return true;
      }
      if (static_cast<unsigned char>(c) <= 0x1Fu) {
        set_error(e, error_code::invalid_string);
        return false;
      }
      if (c != '\\') {
        ++i;
        continue;
      }

      out.append(s.data() + chunk_begin, i - chunk_begin);
      if (++i >= n) break;
      const char esc = s[i++];
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!parse_hex4(cp, e)) return false;
          if (cp >= 0xDC00u && cp <= 0xDFFFu) {
            set_error(e, error_code::invalid_utf16_surrogate);
            return false;
          }
          if (cp >= 0xD800u && cp <= 0xDBFFu) {
            // A high surrogate must be followed by "\u" and a low surrogate.
            const std::string_view want = "\\u";
            const std::size_t avail = std::min<std::size_t>(2, n - i);
            if (s.compare(i, avail, want.substr(0, avail)) != 0) {
              set_error(e, error_code::invalid_utf16_surrogate);
              return false;
            }
            if (avail < 2) {
              set_error(e, error_code::unexpected_eof);
              return false;
            }
            i += 2;
            std::uint32_t low = 0;
            if (!parse_hex4(low, e)) return false;
            if (low < 0xDC00u || low > 0xDFFFu) {
              set_error(e, error_code::invalid_utf16_surrogate);
              return false;
            }
            cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
          }
          append_utf8(out, cp);
          break;
        }
        default:
          set_error(e, error_code::invalid_escape, i - 1);
          return false;
      }
      chunk_begin = i;
    }

    set_error(e, error_code::unexpected_eof, quote_pos);
    return false;
  }

  value parse_array(std::size_t depth, error& e) {
    ++i;
    value::array a;
    skip_ws(s, i);
    if (i < s.size() && s[i] == ']') {
      ++i;
      return value(std::move(a));
    }

    while (true) {
      skip_ws(s, i);
      value elem = parse_value(depth, e);
      if (e) return nullptr;
      a.emplace_back(std::move(elem));

      skip_ws(s, i);
      if (i >= s.size()) {
        set_error(e, error_code::unexpected_eof);
        return nullptr;
      }
      const char c = s[i++];
      if (c == ',') continue;
      if (c == ']') return value(std::move(a));
      set_error(e, error_code::expected_comma_or_end, i - 1);
      return nullptr;
    }
  }

  value parse_object(std::size_t depth, error& e) {
    ++i;
    value::object o;
    skip_ws(s, i);
    if (i < s.size() && s[i] == '}') {
      ++i;
      return value(std::move(o));
    }

    while (true) {
      skip_ws(s, i);
      if (i >= s.size()) {
        set_error(e, error_code::unexpected_eof);
        return nullptr;
      }
      if (s[i] != '"') {
        set_error(e, error_code::expected_key_string);
        return nullptr;
      }
      std::string key;
      if (!parse_string(key, e)) return nullptr;

      skip_ws(s, i);
      if (i >= s.size()) {
        set_error(e, error_code::unexpected_eof);
        return nullptr;
      }
      if (s[i] != ':') {
        set_error(e, error_code::expected_colon);
        return nullptr;
      }
      ++i;

      skip_ws(s, i);
      value v = parse_value(depth, e);
      if (e) return nullptr;
      o.emplace_back(std::move(key), std::move(v));

      skip_ws(s, i);
      if (i >= s.size()) {
        set_error(e, error_code::unexpected_eof);
        return nullptr;
      }
      const char c = s[i++];
      if (c == ',') continue;
      if (c == '}') return value(std::move(o));
      set_error(e, error_code::expected_comma_or_end, i - 1);
      return nullptr;
    }
  }
};

} // namespace detail

// Decodes the one JSON value at the front of `text`. Bytes after it are left
// alone; `consumed` says where it ended.
inline decode_result decode_prefix(std::string_view text, decode_options opt = {}) {
  detail::decoder d;
  d.s = text;
  d.opt = opt;
  return d.run();
}

struct parse_options {
  std::size_t max_depth{256};
  bool require_eof{true};
};

struct parse_result {
  value val;
  error err;
};

// Parses a complete document.
inline parse_result parse(std::string_view json, parse_options opt = {}) {
  detail::decoder d;
  d.s = json;
  d.opt.max_depth = opt.max_depth;
  d.opt.final_input = true;

  decode_result dr = d.run();
  parse_result r;
  r.err = dr.err;
  if (r.err) return r;

  detail::skip_ws(json, d.i);
  if (opt.require_eof && d.i != json.size()) {
    d.set_error(r.err, error_code::trailing_characters);
    return r;
  }
  r.val = std::move(dr.val);
  return r;
}

inline value parse_or_throw(std::string_view json, parse_options opt = {}) {
  auto r = parse(json, opt);
  if (r.err) throw parse_error(r.err);
  return std::move(r.val);
}

namespace detail {

inline void dump_escaped(std::string& out, std::string_view s) {
  static constexpr char hex[] = "0123456789abcdef";
  out.push_back('"');
  std::size_t chunk_begin = 0;
  for (std::size_t k = 0; k < s.size(); ++k) {
    const unsigned char uc = static_cast<unsigned char>(s[k]);
    if (uc != '"' && uc != '\\' && uc > 0x1Fu) continue;

    out.append(s.data() + chunk_begin, k - chunk_begin);
    chunk_begin = k + 1;
    switch (uc) {
      case '"': out.append("\\\"", 2); break;
      case '\\': out.append("\\\\", 2); break;
      case '\b': out.append("\\b", 2); break;
      case '\f': out.append("\\f", 2); break;
      case '\n': out.append("\\n", 2); break;
      case '\r': out.append("\\r", 2); break;
      case '\t': out.append("\\t", 2); break;
      default:
        out.append("\\u00", 4);
        out.push_back(hex[uc >> 4]);
        out.push_back(hex[uc & 0xF]);
        break;
    }
  }
  out.append(s.data() + chunk_begin, s.size() - chunk_begin);
  out.push_back('"');
}

inline void dump_int64(std::string& out, std::int64_t v) {
  char buf[32];
  auto r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc{}) throw std::runtime_error("smacio: failed to format integer");
  out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

inline void dump_double(std::string& out, double d) {
  if (!std::isfinite(d)) throw std::runtime_error("smacio: cannot dump NaN/Inf as JSON number");
  char buf[64];
  // Shortest round-trip form first; printf only if to_chars gives up.
  auto r = std::to_chars(buf, buf + sizeof(buf), d);
  if (r.ec == std::errc{}) {
    out.append(buf, static_cast<std::size_t>(r.ptr - buf));
    return;
  }
  const int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
  if (n <= 0 || static_cast<std::size_t>(n) >= sizeof(buf)) throw std::runtime_error("smacio: failed to format double");
  out.append(buf, static_cast<std::size_t>(n));
}

inline void dump_indent(std::string& out, int indent) {
  out.append(static_cast<std::size_t>(indent), ' ');
}

} // namespace detail

inline void dump_to(std::string& out, const value& v, bool pretty = false, int indent = 0) {
  switch (v.type()) {
    case value::kind::null:
      out += "null";
      return;
    case value::kind::boolean:
      out += v.as_bool() ? "true" : "false";
      return;
    case value::kind::number: {
      const auto& n = detail::value_access::number_of(v);
      if (n.is_int) detail::dump_int64(out, n.i);
      else if (!n.raw.empty()) out += n.raw;
      else detail::dump_double(out, n.d);
      return;
    }
    case value::kind::string:
      detail::dump_escaped(out, v.as_string());
      return;
    case value::kind::array: {
      const auto& a = v.as_array();
      out.push_back('[');
      for (std::size_t k = 0; k < a.size(); ++k) {
        if (k != 0) out.push_back(',');
        if (pretty) {
          out.push_back('\n');
          detail::dump_indent(out, indent + 2);
        }
        dump_to(out, a[k], pretty, indent + 2);
      }
      if (pretty && !a.empty()) {
        out.push_back('\n');
        detail::dump_indent(out, indent);
      }
      out.push_back(']');
      return;
    }
    case value::kind::object: {
      const auto& o = v.as_object();
      out.push_back('{');
      for (std::size_t k = 0; k < o.size(); ++k) {
        if (k != 0) out.push_back(',');
        if (pretty) {
          out.push_back('\n');
          detail::dump_indent(out, indent + 2);
        }
        detail::dump_escaped(out, o[k].first);
        if (pretty) out.append(": ", 2);
        else out.push_back(':');
        dump_to(out, o[k].second, pretty, indent + 2);
      }
      if (pretty && !o.empty()) {
        out.push_back('\n');
        detail::dump_indent(out, indent);
      }
      out.push_back('}');
      return;
    }
  }
}

inline std::string dump(const value& v, bool pretty = false) {
  std::string out;
  dump_to(out, v, pretty, 0);
  return out;
}

} // namespace smacio
