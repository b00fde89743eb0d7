#include <strata/manifest_reader.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace strata {

Result<std::string> TomlManifestReader::parse_package(const std::string& toml_str,
                                                      const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return StrataError{StrataError::Parse,
            "manifest TOML parse error: " + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    auto pkg = doc["manifest"]["package"].value<std::string>();
    if (!pkg || pkg->empty()) {
        return StrataError{StrataError::UnresolvedPackage,
            "manifest declares no package name",
            "add `package = \"...\"` under [manifest]",
            origin, 0};
    }
    return Result<std::string>::ok(std::move(*pkg));
}

Result<std::string> TomlManifestReader::get_package(const std::filesystem::path& manifest) const {
    std::ifstream file(manifest);
    if (!file.is_open()) {
        return StrataError{StrataError::IO,
            "cannot open manifest file: " + manifest.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_package(ss.str(), manifest.string());
}

} // namespace strata
