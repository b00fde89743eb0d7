#pragma once

#include <string>
#include <vector>
#include <optional>

namespace strata {

// A named bag of scalar overrides. A field is "set" when its optional is
// engaged; merge_over() takes set fields from the receiver and everything
// else from the base.
struct FlavorConfig {
    std::string name;
    std::optional<std::string> package_name;
    std::optional<int> version_code;
    std::optional<std::string> version_name;
    std::optional<int> min_sdk_version;
    std::optional<int> target_sdk_version;
    std::optional<std::string> test_package_name;
    std::optional<std::string> test_instrumentation_runner;

    // Returns a new flavor where each field comes from *this if set,
    // else from base. The result keeps this flavor's name.
    FlavorConfig merge_over(const FlavorConfig& base) const;
};

// Per-build-type overrides (debug, release, ...).
struct BuildTypeConfig {
    std::string name;
    std::string package_name_suffix;
    std::string version_name_suffix;
    bool debuggable = false;
};

// Fold flavors over default in declaration order; the last flavor wins.
FlavorConfig merge_flavors(const std::vector<FlavorConfig>& flavors,
                           const FlavorConfig& default_config);

// "com.example" + ".debug" or "debug" -> "com.example.debug".
// An empty suffix leaves the base untouched.
std::string compose_package_name(const std::string& base,
                                 const std::string& suffix);

} // namespace strata
