#include <smacio/smacio.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// nlohmann/json
#include <nlohmann/json.hpp>

// RapidJSON
#include <rapidjson/document.h>
#include <rapidjson/memorystream.h>

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

std::string make_payload(std::size_t n_objects) {
  static const char* const statuses[] = {"SAT", "UNSAT", "TIMEOUT"};
  std::string s;
  s.reserve(n_objects * 128);
  for (std::size_t i = 0; i < n_objects; ++i) {
    s += "{\"run\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"instance\":\"inst/i";
    s += std::to_string(static_cast<std::uint64_t>(i % 37));
    s += ".cnf\",\"cost\":";
    s += (i % 3 == 0) ? "3.141592653589793" : "1e-3";
    s += ",\"tags\":[1,2,3],\"status\":\"";
    s += statuses[i % 3];
    s += "\"}\n";
  }
  return s;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
  std::size_t values{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<bench_result> all;
  all.reserve(runs);
  for (std::size_t r = 0; r < runs; ++r) all.push_back(fn());
  std::nth_element(all.begin(), all.begin() + (all.size() / 2), all.end(),
                   [](const bench_result& a, const bench_result& b) { return a.seconds < b.seconds; });
  return all[all.size() / 2];
}

void print_mbps(const char* name, const bench_result& r) {
  const double mib = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mibps = (r.seconds > 0.0) ? (mib / r.seconds) : 0.0;
  std::cout << name << ": " << mibps << " MiB/s (" << r.seconds << " s, " << r.values << " values)" << "\n";
}

bench_result bench_smacio(std::string_view text, std::size_t iters) {
  std::size_t values = 0;
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    smacio::string_source src(text);
    values = smacio::for_each_value(src, [](smacio::value&& v) { do_not_optimize(v.type()); });
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), text.size() * iters, values};
}

bench_result bench_nlohmann(const std::string& text, std::size_t iters) {
  std::size_t values = 0;
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    std::istringstream in(text);
    values = 0;
    while (in >> std::ws && in.peek() != std::char_traits<char>::eof()) {
      nlohmann::json j;
      in >> j;
      do_not_optimize(j.type());
      ++values;
    }
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), text.size() * iters, values};
}

std::size_t skip_ws(std::string_view text, std::size_t pos) {
  while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\n' || text[pos] == '\r' || text[pos] == '\t')) ++pos;
  return pos;
}

bench_result bench_rapidjson(std::string_view text, std::size_t iters) {
  std::size_t values = 0;
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    values = 0;
    std::size_t pos = skip_ws(text, 0);
    while (pos < text.size()) {
      rapidjson::MemoryStream ms(text.data() + pos, text.size() - pos);
      rapidjson::Document d;
      d.ParseStream<rapidjson::kParseStopWhenDoneFlag>(ms);
      if (d.HasParseError()) {
        std::cerr << "rapidjson: input parse failed\n";
        std::exit(1);
      }
      do_not_optimize(d.GetType());
      pos = skip_ws(text, pos + ms.Tell());
      ++values;
    }
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), text.size() * iters, values};
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  std::cout << "sizeof(smacio::value): " << sizeof(smacio::value) << "\n";
  std::cout << "sizeof(rapidjson::Value): " << sizeof(rapidjson::Value) << "\n";

  const std::string payload = make_payload(n_objects);
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up
  {
    smacio::string_source src(payload);
    do_not_optimize(smacio::parse_stream(src).size());
  }

  const auto a = run_median(runs, [&] { return bench_smacio(payload, iters); });
  const auto b = run_median(runs, [&] { return bench_nlohmann(payload, iters); });
  const auto c = run_median(runs, [&] { return bench_rapidjson(payload, iters); });
  print_mbps("smacio stream", a);
  print_mbps("nlohmann >>", b);
  print_mbps("rapidjson stop-when-done", c);

  if (a.values != b.values || a.values != c.values) {
    std::cerr << "value counts differ\n";
    return 1;
  }
  return 0;
}
