#include <strata/flavor.hpp>

namespace strata {

template<typename T>
static std::optional<T> pick(const std::optional<T>& over,
                             const std::optional<T>& base) {
    return over.has_value() ? over : base;
}

FlavorConfig FlavorConfig::merge_over(const FlavorConfig& base) const {
    FlavorConfig merged;
    merged.name = name;
    merged.package_name = pick(package_name, base.package_name);
    merged.version_code = pick(version_code, base.version_code);
    merged.version_name = pick(version_name, base.version_name);
    merged.min_sdk_version = pick(min_sdk_version, base.min_sdk_version);
    merged.target_sdk_version = pick(target_sdk_version, base.target_sdk_version);
    merged.test_package_name = pick(test_package_name, base.test_package_name);
    merged.test_instrumentation_runner =
        pick(test_instrumentation_runner, base.test_instrumentation_runner);
    return merged;
}

FlavorConfig merge_flavors(const std::vector<FlavorConfig>& flavors,
                           const FlavorConfig& default_config) {
    FlavorConfig result = default_config;
    for (const auto& flavor : flavors) {
        result = flavor.merge_over(result);
    }
    return result;
}

std::string compose_package_name(const std::string& base,
                                 const std::string& suffix) {
    if (suffix.empty()) return base;
    if (suffix[0] == '.') return base + suffix;
    return base + "." + suffix;
}

} // namespace strata
