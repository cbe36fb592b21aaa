#include <smacio/smacio.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

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

// One run record per line, the way a live-rundata log grows.
std::string make_payload(std::size_t n_objects) {
  std::mt19937_64 rng(1234567);
  std::uniform_real_distribution<double> cost(0.0, 300.0);
  static const char* const statuses[] = {"SAT", "UNSAT", "TIMEOUT", "CRASHED"};

  std::string s;
  s.reserve(n_objects * 160);
  for (std::size_t i = 0; i < n_objects; ++i) {
    s += "{\"run\":";
    s += std::to_string(static_cast<std::uint64_t>(i));
    s += ",\"config\":{\"alpha\":\"0.5\",\"beta\":\"on\",\"gamma\":";
    s += std::to_string(static_cast<std::uint64_t>(rng() % 100));
    s += "},\"instance\":\"inst/i";
    s += std::to_string(static_cast<std::uint64_t>(i % 37));
    s += ".cnf\",\"seed\":";
    s += std::to_string(static_cast<std::int64_t>(rng() % 100000) - 1);
    s += ",\"cost\":";
    s += std::to_string(cost(rng));
    s += ",\"status\":\"";
    s += statuses[i % 4];
    s += "\"}\n";
  }
  return s;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

bench_result bench_stream(std::string_view text, std::size_t iters, std::size_t chunk_size) {
  smacio::stream_options opt;
  opt.chunk_size = chunk_size;

  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    smacio::string_source src(text);
    smacio::stream_parser p(src, opt);
    smacio::value v;
    while (p.next(v)) do_not_optimize(v.type());
    do_not_optimize(p.values_emitted());
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), text.size() * iters};
}

bench_result bench_stream_and_sum_costs(std::string_view text, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    smacio::string_source src(text);
    double sum = 0.0;
    smacio::for_each_value(src, [&sum](smacio::value&& v) {
      if (const auto* c = v.find("cost")) sum += c->as_double();
    });
    do_not_optimize(sum);
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), text.size() * iters};
}

bench_result bench_dump(std::string_view text, std::size_t iters) {
  smacio::string_source src(text);
  const auto values = smacio::parse_stream(src);

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    for (const auto& v : values) {
      auto out = smacio::dump(v);
      bytes += out.size();
      do_not_optimize(out.size());
    }
  }
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), bytes};
}

void print_mbps(const std::string& name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_objects = 2000;
  std::size_t iters = 50;
  std::size_t runs = 5;

  if (argc >= 2) n_objects = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_objects);
  std::cout << "payload bytes: " << payload.size() << " (" << n_objects << " values)\n";

  // Warm-up
  {
    smacio::string_source src(payload);
    do_not_optimize(smacio::parse_stream(src).size());
  }

  const std::size_t chunks[] = {64, 512, SMACIO_DEFAULT_CHUNK_SIZE, 16384, 262144};
  for (const std::size_t chunk : chunks) {
    print_mbps("stream(chunk=" + std::to_string(chunk) + ")",
               run_median(runs, [&] { return bench_stream(payload, iters, chunk); }));
  }
  print_mbps("stream +sum(cost)", run_median(runs, [&] { return bench_stream_and_sum_costs(payload, iters); }));
  print_mbps("dump", run_median(runs, [&] { return bench_dump(payload, iters); }));

  return 0;
}
