#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/memorystream.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

// Counts the values of a concatenated-JSON file with RapidJSON's
// stop-when-done mode. Used to cross-check smacio.

namespace {

std::size_t skip_ws(const std::string& text, std::size_t pos) {
  while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\n' || text[pos] == '\r' || text[pos] == '\t')) ++pos;
  return pos;
}

} // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: rapidjson_parse_stream <file.json>\n";
    return 2;
  }

  std::ifstream in(argv[1], std::ios::binary);
  if (!in) {
    std::cerr << "read failed: " << argv[1] << "\n";
    return 2;
  }
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  std::size_t count = 0;
  std::size_t pos = skip_ws(text, 0);
  while (pos < text.size()) {
    rapidjson::MemoryStream ms(text.data() + pos, text.size() - pos);
    rapidjson::Document d;
    d.ParseStream<rapidjson::kParseStopWhenDoneFlag>(ms);
    if (d.HasParseError()) {
      std::cerr << "parse failed: " << argv[1] << "\n";
      std::cerr << "  code=" << static_cast<int>(d.GetParseError())
                << " offset=" << (pos + d.GetErrorOffset())
                << " (" << rapidjson::GetParseError_En(d.GetParseError()) << ")\n";
      return 1;
    }
    pos = skip_ws(text, pos + ms.Tell());
    ++count;
  }

  std::cout << argv[1] << "\t" << count << " values\n";
  return 0;
}
