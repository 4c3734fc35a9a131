#pragma once

#include <filesystem>
#include <string>

namespace prepush::lane {

// Value of the first `version = "..."` line, or "unknown".
std::string ReadManifestVersion(const std::filesystem::path& manifest);

} // namespace prepush::lane
