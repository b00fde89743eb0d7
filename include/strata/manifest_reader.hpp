#pragma once

#include <strata/result.hpp>
#include <string>
#include <filesystem>

namespace strata {

// Reads the package name declared by a module manifest.
// Implementations must be stateless so variants can be resolved in parallel.
class ManifestReader {
public:
    virtual ~ManifestReader() = default;

    virtual Result<std::string> get_package(const std::filesystem::path& manifest) const = 0;
};

// Manifest stored as TOML:
//
//   [manifest]
//   package = "com.example.app"
class TomlManifestReader : public ManifestReader {
public:
    Result<std::string> get_package(const std::filesystem::path& manifest) const override;

    // Parse manifest text directly; `origin` is only used in error messages
    static Result<std::string> parse_package(const std::string& toml_str,
                                             const std::string& origin);
};

} // namespace strata
