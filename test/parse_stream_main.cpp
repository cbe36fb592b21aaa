#include <smacio/smacio.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

namespace {

struct cli_options {
  smacio::stream_options stream;
  bool dump_values{false};
};

// 0 ok, 1 parse error, 2 I/O error.
int parse_one(const char* path, const cli_options& cli, bool report) {
  smacio::file_source src(path);
  if (!src.is_open()) {
    if (report) std::cerr << "failed to read file: " << path << "\n";
    return 2;
  }

  smacio::stream_parser p(src, cli.stream);
  try {
    smacio::value v;
    while (p.next(v)) {
      if (cli.dump_values) std::cout << smacio::dump(v) << "\n";
    }
  } catch (const smacio::parse_error& e) {
    if (report) {
      std::cerr << "parse failed: " << path << "\n";
      std::cerr << "  code=" << static_cast<int>(e.err().code)
                << " offset=" << e.err().offset
                << " line=" << e.err().line
                << " column=" << e.err().column << "\n";
      std::cerr << "  " << e.what() << "\n";
    }
    return 1;
  } catch (const std::runtime_error& e) {
    if (report) std::cerr << "read failed: " << path << ": " << e.what() << "\n";
    return 2;
  }

  if (report && !cli.dump_values) {
    std::cout << path << "\t" << p.values_emitted() << " values\n";
    if (p.bytes_dropped() != 0) std::cout << path << "\tdropped " << p.bytes_dropped() << " trailing bytes\n";
  }
  return 0;
}

void usage() {
  std::cerr << "usage: smacio_parse_stream [--chunk N] [--strict-tail] [--dump] <file.json>\n";
  std::cerr << "       smacio_parse_stream [--chunk N] [--strict-tail] --list <paths.txt>\n";
}

} // namespace

int main(int argc, char** argv) {
  cli_options cli;
  const char* list_path = nullptr;
  const char* path = nullptr;

  for (int k = 1; k < argc; ++k) {
    const std::string_view arg{argv[k]};
    if (arg == "--chunk" && k + 1 < argc) {
      char* end = nullptr;
      const unsigned long long n = std::strtoull(argv[++k], &end, 10);
      if (*end != '\0' || n == 0) {
        std::cerr << "--chunk needs a positive integer\n";
        return 2;
      }
      cli.stream.chunk_size = static_cast<std::size_t>(n);
    } else if (arg == "--strict-tail") {
      cli.stream.on_truncated_tail = smacio::tail_policy::fail;
    } else if (arg == "--dump") {
      cli.dump_values = true;
    } else if (arg == "--list" && k + 1 < argc) {
      list_path = argv[++k];
    } else if (!path && !arg.empty() && arg[0] != '-') {
      path = argv[k];
    } else {
      usage();
      return 2;
    }
  }

  if (list_path) {
    std::ifstream in(list_path);
    if (!in) {
      std::cerr << "failed to read list file: " << list_path << "\n";
      return 2;
    }

    bool any_fail = false;
    bool any_io_fail = false;
    std::string line;
    while (std::getline(in, line)) {
      if (line.empty()) continue;
      const int rc = parse_one(line.c_str(), cli, /*report=*/false);
      std::cout << line << (rc == 0 ? "\tOK\n" : "\tFAIL\n");
      any_fail = any_fail || rc != 0;
      any_io_fail = any_io_fail || rc == 2;
    }
    return any_io_fail ? 2 : (any_fail ? 1 : 0);
  }

  if (!path) {
    usage();
    return 2;
  }
  return parse_one(path, cli, /*report=*/true);
}
