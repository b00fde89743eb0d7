#pragma once

#include <strata/result.hpp>
#include <strata/flavor.hpp>
#include <strata/source_set.hpp>
#include <strata/library.hpp>
#include <strata/variant.hpp>
#include <strata/log.hpp>

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <filesystem>

namespace strata {

// [build-types.<name>] section
struct BuildTypeEntry {
    BuildTypeConfig config;
    std::optional<SourceSet> sources;
};

// [flavors.<name>] section
struct FlavorEntry {
    FlavorConfig config;
    SourceSet sources;
};

// [libraries.<name>] section
struct LibrarySpec {
    std::string name;
    std::filesystem::path manifest;
    std::filesystem::path res;
    std::filesystem::path artifact;
    std::vector<std::string> dependencies;
};

// A Strata.toml variant descriptor: everything needed to build the
// VariantConfigs of one module. Relative paths are resolved against the
// descriptor's directory.
struct Descriptor {
    std::filesystem::path base_dir;
    std::optional<log::Level> log_level;

    FlavorConfig default_config;
    SourceSet default_sources;
    std::unordered_map<std::string, BuildTypeEntry> build_types;
    std::unordered_map<std::string, FlavorEntry> flavors;
    // [test] section: default config and sources of test variants
    std::optional<FlavorEntry> test;
    // [output] artifact of a library module
    std::optional<std::filesystem::path> output_artifact;

    std::vector<LibrarySpec> libraries;         // declaration order
    std::vector<std::string> direct_libraries;  // [dependencies] libraries
    std::vector<JarDependency> jars;            // [dependencies] jars

    static Result<Descriptor> parse(const std::string& toml_str,
                                    const std::filesystem::path& base_dir);
    static Result<Descriptor> load(const std::filesystem::path& path);

    // Build the immutable library graph, leaf libraries first.
    // Unknown names -> NotFound, cycles -> Cycle.
    Result<std::unordered_map<std::string, LibraryPtr>> build_libraries() const;

    // Build a Default or Library variant from a build type and flavors
    // (flavors in priority order, lowest first). Library variants get
    // their output set when an [output] artifact is declared.
    Result<VariantConfig> make_variant(const std::string& build_type,
                                       const std::vector<std::string>& flavor_names,
                                       std::shared_ptr<const ManifestReader> reader,
                                       VariantType type = VariantType::Default) const;

    // Build the test variant of `tested` from the [test] section, with the
    // tested variant's flavors applied on top in the same order.
    Result<VariantConfig> make_test_variant(const std::string& build_type,
                                            std::shared_ptr<const ManifestReader> reader,
                                            std::shared_ptr<const VariantConfig> tested) const;

    // Direct library dependencies as a tree rooted at `root_label`
    Result<std::string> dependency_tree(const std::string& root_label) const;
};

} // namespace strata
