#include "manifest_version.hpp"

#include <fstream>
#include <regex>

namespace prepush::lane {

std::string ReadManifestVersion(const std::filesystem::path& manifest) {
  static const std::regex kVersionLine(R"re(^version\s*=\s*"([^"]+)")re");

  std::ifstream in(manifest);
  if (!in) return "unknown";

  std::string line;
  while (std::getline(in, line)) {
    std::smatch match;
    if (std::regex_search(line, match, kVersionLine)) {
      return match[1].str();
    }
  }
  return "unknown";
}

} // namespace prepush::lane
