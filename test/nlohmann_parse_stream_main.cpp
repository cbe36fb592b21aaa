#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

// Counts the values of a concatenated-JSON file with nlohmann/json, whose
// stream extraction stops after one value. Used to cross-check smacio.

static int parse_one(const char* path, std::size_t& count) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return 2;

  count = 0;
  try {
    while (in >> std::ws && in.peek() != std::char_traits<char>::eof()) {
      nlohmann::json j;
      in >> j;
      ++count;
    }
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "parse failed: " << path << "\n  " << e.what() << "\n";
    return 1;
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc == 3 && std::string_view{argv[1]} == "--list") {
    std::ifstream in(argv[2]);
    if (!in) {
      std::cerr << "failed to read list file: " << argv[2] << "\n";
      return 2;
    }

    bool any_fail = false;
    bool any_io_fail = false;
    std::string path;
    while (std::getline(in, path)) {
      if (path.empty()) continue;
      std::size_t count = 0;
      const int rc = parse_one(path.c_str(), count);
      if (rc == 0) {
        std::cout << path << "\t" << count << " values\n";
      } else {
        std::cout << path << "\tFAIL\n";
        any_fail = true;
        if (rc == 2) any_io_fail = true;
      }
    }
    return any_io_fail ? 2 : (any_fail ? 1 : 0);
  }

  if (argc != 2) {
    std::cerr << "usage: nlohmann_parse_stream <file.json>\n";
    std::cerr << "       nlohmann_parse_stream --list <paths.txt>\n";
    return 2;
  }

  std::size_t count = 0;
  const int rc = parse_one(argv[1], count);
  if (rc == 2) std::cerr << "read failed: " << argv[1] << "\n";
  if (rc == 0) std::cout << argv[1] << "\t" << count << " values\n";
  return rc;
}
