#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "posarg/cases/decode_case.hpp"

namespace posarg::cases {

// Load every case in one YAML case file. Unknown keys, unknown extractors
// and malformed literals are errors reported as "<path>:<line>: message".
auto LoadCaseFile(const std::filesystem::path& path)
    -> std::expected<std::vector<DecodeCase>, std::string>;

// Expand files and directories (recursively, *.yaml and *.yml) into a sorted
// list of case files. Missing paths are errors.
auto DiscoverCaseFiles(const std::vector<std::filesystem::path>& paths)
    -> std::expected<std::vector<std::filesystem::path>, std::string>;

}  // namespace posarg::cases
