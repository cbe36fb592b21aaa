#include "test_common.hpp"

#include <string>

using namespace smacio;

static void test_common_syntax_errors() {
  {
    auto r = parse("{\"a\":1,}");
    smacio_test::check_err(r.err, error_code::expected_key_string);
  }
  {
    auto r = parse("[1 2]");
    smacio_test::check_err(r.err, error_code::expected_comma_or_end);
  }
  {
    auto r = parse("\"unterminated");
    smacio_test::check_err(r.err, error_code::unexpected_eof);
  }
  {
    auto r = parse("01");
    smacio_test::check_err(r.err, error_code::invalid_number);
  }
}

static void test_error_line_column_tracking() {
  const char* json = "{\n  \"a\": 1,\n  \"b\": 01\n}";
  auto r = parse(json);
  smacio_test::check_err(r.err, error_code::invalid_number);
  SMACIO_CHECK(r.err.offset == 19);
  SMACIO_CHECK(r.err.line == 3);
  SMACIO_CHECK(r.err.column == 8);
}

static void test_expected_colon_and_key_string() {
  {
    auto r = parse(R"({"a" 1})");
    smacio_test::check_err(r.err, error_code::expected_colon);
  }
  {
    auto r = parse(R"({a:1})");
    smacio_test::check_err(r.err, error_code::expected_key_string);
  }
}

static void test_truncation_versus_malformed() {
  // Prefixes of valid documents: more bytes could finish them.
  const char* incomplete[] = {"{", "[", "{\"a\"", "{\"a\":", "{\"a\":1", "{\"a\":1,", "[1,", "[true", "t", "fal", "nu", "  "};
  for (const char* s : incomplete) {
    auto r = decode_prefix(s);
    SMACIO_CHECK(r.status == decode_status::incomplete);
    SMACIO_CHECK(is_truncation(r.err.code));
    SMACIO_CHECK(r.val.is_null());
  }

  // Already broken: no continuation can fix them.
  const char* malformed[] = {"x", "}", "{1", "{\"a\" 1", "[1 2", "tx", "nul1", "{\"a\":1]", "[1,]"};
  for (const char* s : malformed) {
    auto r = decode_prefix(s);
    SMACIO_CHECK(r.status == decode_status::malformed);
    SMACIO_CHECK(!is_truncation(r.err.code));
  }
}

static void test_parse_or_throw_reports_position() {
  SMACIO_CHECK(parse_or_throw("[1]").as_array().size() == 1);
  try {
    (void)parse_or_throw("[1,\n x]");
    smacio_test::fail("parse_or_throw", __FILE__, __LINE__, "expected parse_error");
  } catch (const parse_error& e) {
    SMACIO_CHECK(e.err().code == error_code::invalid_value);
    SMACIO_CHECK(e.err().line == 2);
    SMACIO_CHECK(e.err().column == 2);
    SMACIO_CHECK(std::string(e.what()).find("invalid value at line 2, column 2") != std::string::npos);
  }
}

static void test_error_code_names() {
  SMACIO_CHECK(std::string(to_string(error_code::ok)) == "ok");
  SMACIO_CHECK(std::string(to_string(error_code::unexpected_eof)) == "unexpected end of input");
  SMACIO_CHECK(std::string(to_string(error_code::nesting_too_deep)) == "nesting too deep");
}

void test_errors() {
  test_common_syntax_errors();
  test_error_line_column_tracking();
  test_expected_colon_and_key_string();
  test_truncation_versus_malformed();
  test_parse_or_throw_reports_position();
  test_error_code_names();
}
