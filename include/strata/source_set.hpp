#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace strata {

// One layer of sources contributing to a variant (main, a build type, a flavor).
struct SourceSet {
    std::string name;
    std::filesystem::path manifest;
    std::optional<std::filesystem::path> resources;
    std::vector<std::filesystem::path> compile_classpath;
};

} // namespace strata
