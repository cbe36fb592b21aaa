#pragma once

// smacio: stream.hpp
// Pull-based parser for byte streams holding many JSON values back to back,
// separated by nothing but whitespace (SMAC's live-rundata files, JSON lines).

#include <smacio/json.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <fstream>
#include <istream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Bytes requested from the source per read.
#ifndef SMACIO_DEFAULT_CHUNK_SIZE
  #define SMACIO_DEFAULT_CHUNK_SIZE 2048
#endif

namespace smacio {

// Sequential supplier of bytes. Borrowed by the parser, never owned.
class byte_source {
public:
  virtual ~byte_source() = default;

  // Writes at most `max` bytes to `dst` and returns how many. 0 means exhausted.
  virtual std::size_t read(char* dst, std::size_t max) = 0;
};

class string_source final : public byte_source {
public:
  // `max_read` caps each read below the requested size (0: no cap).
  explicit string_source(std::string_view text, std::size_t max_read = 0) noexcept
      : text_(text), max_read_(max_read) {}

  std::size_t read(char* dst, std::size_t max) override {
    std::size_t n = std::min(max, text_.size() - pos_);
    if (max_read_ != 0) n = std::min(n, max_read_);
    if (n != 0) std::memcpy(dst, text_.data() + pos_, n);
    pos_ += n;
    return n;
  }

private:
  std::string_view text_;
  std::size_t pos_{0};
  std::size_t max_read_{0};
};

class istream_source : public byte_source {
public:
  explicit istream_source(std::istream& in) noexcept : in_(&in) {}

  std::size_t read(char* dst, std::size_t max) override {
    if (max == 0 || !*in_) return 0;
    in_->read(dst, static_cast<std::streamsize>(max));
    if (in_->bad()) throw std::runtime_error("smacio: stream read failed");
    return static_cast<std::size_t>(in_->gcount());
  }

private:
  std::istream* in_;
};

class file_source final : public byte_source {
public:
  explicit file_source(const std::string& path) : file_(path, std::ios::binary), src_(file_) {}

  file_source(const file_source&) = delete;
  file_source& operator=(const file_source&) = delete;

  bool is_open() const { return file_.is_open(); }

  std::size_t read(char* dst, std::size_t max) override { return src_.read(dst, max); }

private:
  std::ifstream file_;
  istream_source src_;
};

// What to do when the source ends in the middle of a value.
enum class tail_policy {
  drop, // end the sequence quietly
  fail  // throw parse_error(unexpected_eof)
};

struct stream_options {
  std::size_t chunk_size{SMACIO_DEFAULT_CHUNK_SIZE};
  std::size_t max_depth{256};
  tail_policy on_truncated_tail{tail_policy::drop};
};

// Offset, line and column of a byte within the whole stream.
struct text_position {
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  void advance(const char* p, std::size_t n) noexcept {
    detail::advance_line_col(p, n, line, column);
    offset += n;
  }
};

// Splits a stream of concatenated JSON values into values.
//
// The working buffer holds only bytes not yet attributed to a value. Each
// step trims leading whitespace and tries to decode one value from the
// buffer front; a truncated attempt pulls one more chunk and retries, a
// successful one hands the value out without touching the source again.
// Single pass: once next() returns false or throws, the parser is spent.
class stream_parser {
public:
  class iterator;

  explicit stream_parser(byte_source& src, stream_options opt = {}) : src_(&src), opt_(opt) {
    if (opt_.chunk_size == 0) throw std::invalid_argument("smacio: chunk_size must be positive");
  }

  stream_parser(const stream_parser&) = delete;
  stream_parser& operator=(const stream_parser&) = delete;

  // Stores the next value in `out`. Returns false at the end of the
  // sequence; throws parse_error on malformed input.
  bool next(value& out) {
    if (done_) return false;

    for (;;) {
      trim();
      if (head_ < buf_.size()) {
        decode_options dopt;
        dopt.max_depth = opt_.max_depth;
        dopt.final_input = eof_;
        decode_result r = decode_prefix(pending(), dopt);

        if (r.status == decode_status::success) {
          consume(r.consumed);
          ++emitted_;
          out = std::move(r.val);
          return true;
        }
        if (r.status == decode_status::malformed) {
          done_ = true;
          fail(r.err);
        }
        if (eof_) {
          done_ = true;
          if (opt_.on_truncated_tail == tail_policy::fail) fail(r.err);
          dropped_ = buf_.size() - head_;
          reset_buffer();
          return false;
        }
      } else if (eof_) {
        done_ = true;
        reset_buffer();
        return false;
      }

      if (!fill()) eof_ = true;
    }
  }

  iterator begin();
  iterator end() noexcept;

  // Bytes read but not yet part of an emitted value. After a parse_error
  // this still holds the offending input.
  std::string_view pending() const noexcept { return std::string_view(buf_.data() + head_, buf_.size() - head_); }

  // Stream position of the first pending byte.
  const text_position& position() const noexcept { return pos_; }

  std::size_t values_emitted() const noexcept { return emitted_; }
  std::size_t bytes_read() const noexcept { return bytes_read_; }
  // Size of the truncated fragment discarded at the end, if any.
  std::size_t bytes_dropped() const noexcept { return dropped_; }
  bool source_exhausted() const noexcept { return eof_; }
  bool done() const noexcept { return done_; }

private:
  bool fill() {
    // Compact once the consumed prefix is at least as large as what is left.
    if (head_ != 0 && head_ >= buf_.size() - head_) {
      buf_.erase(0, head_);
      head_ = 0;
    }

    const std::size_t old = buf_.size();
    buf_.resize(old + opt_.chunk_size);
    const std::size_t n = src_->read(&buf_[old], opt_.chunk_size);
    if (n > opt_.chunk_size) throw std::runtime_error("smacio: byte source overran its chunk");
    buf_.resize(old + n);
    bytes_read_ += n;
    return n != 0;
  }

  void trim() {
    std::size_t i = head_;
    detail::skip_ws(buf_.data(), buf_.size(), i);
    consume(i - head_);
  }

  void consume(std::size_t n) {
    pos_.advance(buf_.data() + head_, n);
    head_ += n;
    if (head_ == buf_.size()) reset_buffer();
  }

  void reset_buffer() noexcept {
    buf_.clear();
    head_ = 0;
  }

  // `e` is relative to pending(); rebase it onto the whole stream.
  [[noreturn]] void fail(const error& e) {
    const std::string_view rest = pending();
    const std::size_t at = std::min(e.offset, rest.size());

    text_position where = pos_;
    where.advance(rest.data(), at);

    error abs;
    abs.code = e.code;
    abs.offset = where.offset;
    abs.line = where.line;
    abs.column = where.column;

    constexpr std::size_t kExcerpt = 32;
    throw parse_error(abs, std::string(rest.substr(at, kExcerpt)));
  }

  byte_source* src_;
  stream_options opt_;
  std::string buf_;
  std::size_t head_{0};
  text_position pos_;
  std::size_t emitted_{0};
  std::size_t bytes_read_{0};
  std::size_t dropped_{0};
  bool eof_{false};
  bool done_{false};
};

// Single-pass input iterator over a stream_parser. Incrementing pulls the
// next value, so it may throw parse_error.
class stream_parser::iterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = smacio::value;
  using difference_type = std::ptrdiff_t;
  using pointer = value_type*;
  using reference = value_type&;

  iterator() noexcept = default;

  reference operator*() noexcept { return cur_; }
  pointer operator->() noexcept { return &cur_; }

  iterator& operator++() {
    if (p_ && !p_->next(cur_)) p_ = nullptr;
    return *this;
  }

  // Sentinel comparison only: all live iterators share the parser.
  bool operator==(const iterator& o) const noexcept { return p_ == o.p_; }
  bool operator!=(const iterator& o) const noexcept { return p_ != o.p_; }

private:
  friend class stream_parser;
  explicit iterator(stream_parser* p) : p_(p) { ++*this; }

  stream_parser* p_{nullptr};
  value_type cur_;
};

inline stream_parser::iterator stream_parser::begin() { return iterator(this); }
inline stream_parser::iterator stream_parser::end() noexcept { return iterator(); }

// Calls `fn(value&&)` for every value of the stream; returns how many there were.
template <class Fn>
std::size_t for_each_value(byte_source& src, Fn&& fn, stream_options opt = {}) {
  stream_parser p(src, opt);
  value v;
  while (p.next(v)) fn(std::move(v));
  return p.values_emitted();
}

inline std::vector<value> parse_stream(byte_source& src, stream_options opt = {}) {
  std::vector<value> out;
  for_each_value(src, [&out](value&& v) { out.push_back(std::move(v)); }, opt);
  return out;
}

} // namespace smacio
