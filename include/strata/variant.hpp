#pragma once

#include <strata/result.hpp>
#include <strata/flavor.hpp>
#include <strata/source_set.hpp>
#include <strata/library.hpp>
#include <strata/manifest_reader.hpp>

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <optional>
#include <variant>
#include <filesystem>

namespace strata {

enum class VariantType { Default, Library, Test };

const char* variant_type_name(VariantType type);

// Used when no flavor overrides the test instrumentation runner
inline constexpr const char* DEFAULT_TEST_RUNNER = "android.test.InstrumentationTestRunner";

// The resolved configuration of one build variant: default config, build
// type and any number of flavors, plus library dependencies.
//
// A variant is built once, then mutated only by add_flavor(),
// set_jar_dependencies(), set_library_dependencies() and set_output()
// while the build is being configured. After that it is read-only.
// No internal synchronization.
class VariantConfig {
public:
    struct DefaultKind {};
    struct LibraryKind {
        LibraryPtr output;  // set post-construction by set_output()
    };
    struct TestKind {
        std::shared_ptr<const VariantConfig> tested;
    };
    using Kind = std::variant<DefaultKind, LibraryKind, TestKind>;

    // Build a Default or Library variant. Fails with MissingManifest if the
    // default source set's manifest is not a regular file, and with
    // Invariant if asked for a Test variant (use create_test()).
    static Result<VariantConfig> create(FlavorConfig default_config,
                                        SourceSet default_source_set,
                                        BuildTypeConfig build_type,
                                        std::optional<SourceSet> build_type_source_set,
                                        std::shared_ptr<const ManifestReader> reader,
                                        VariantType type = VariantType::Default);

    // Build a Test variant for `tested`. The manifest is not validated.
    static Result<VariantConfig> create_test(FlavorConfig default_config,
                                             SourceSet default_source_set,
                                             BuildTypeConfig build_type,
                                             std::optional<SourceSet> build_type_source_set,
                                             std::shared_ptr<const ManifestReader> reader,
                                             std::shared_ptr<const VariantConfig> tested);

    // Flavors added later take priority for scalar overrides; for resource
    // overlays, earlier added flavors win.
    void add_flavor(FlavorConfig flavor, SourceSet source_set);

    void set_jar_dependencies(std::vector<JarDependency> jars);

    // Replace the direct library dependencies and recompute the flat list.
    // On error the previous dependencies are kept.
    Status set_library_dependencies(std::vector<LibraryPtr> direct);

    // Only legal on Library variants.
    Status set_output(LibraryPtr output);

    // --- Inputs ---
    VariantType type() const;
    const FlavorConfig& default_config() const { return default_config_; }
    const SourceSet& default_source_set() const { return default_source_set_; }
    const BuildTypeConfig& build_type() const { return build_type_; }
    const std::optional<SourceSet>& build_type_source_set() const { return build_type_source_set_; }
    bool has_flavors() const { return !flavor_configs_.empty(); }
    const std::vector<FlavorConfig>& flavor_configs() const { return flavor_configs_; }
    const std::vector<SourceSet>& flavor_source_sets() const { return flavor_source_sets_; }
    const std::vector<JarDependency>& jar_dependencies() const { return jars_; }
    // Null unless this is a Test variant
    const VariantConfig* tested_config() const;
    // Null unless this is a Library variant whose output has been set
    LibraryPtr output() const;

    // --- Derived state ---
    const FlavorConfig& merged_flavor() const { return merged_flavor_; }
    bool has_libraries() const { return !direct_libraries_.empty(); }
    const std::vector<LibraryPtr>& direct_libraries() const { return direct_libraries_; }
    const std::vector<LibraryPtr>& flat_libraries() const { return flat_libraries_; }

    // Direct libraries, followed by the tested library's output and its
    // direct libraries when this variant tests a library.
    Result<std::vector<LibraryPtr>> full_direct_dependencies() const;

    // --- Resolution ---
    Result<std::string> package_name() const;
    // Absent unless this is a Test variant
    Result<std::optional<std::string>> tested_package_name() const;
    // Package from flavor overrides and the build-type suffix; absent when
    // neither applies
    Result<std::optional<std::string>> package_override() const;
    Result<std::string> package_from_manifest() const;
    std::string instrumentation_runner() const;
    // Merged version name plus the build type's version suffix
    std::optional<std::string> version_name() const;
    // Colon-separated packages of the flat libraries, absent when there are none
    Result<std::optional<std::string>> library_packages() const;

    // Resource folders, highest overlay priority first.
    std::vector<std::filesystem::path> resource_inputs() const;
    Result<std::set<std::filesystem::path>> compile_classpath() const;

private:
    VariantConfig(FlavorConfig default_config,
                  SourceSet default_source_set,
                  BuildTypeConfig build_type,
                  std::optional<SourceSet> build_type_source_set,
                  std::shared_ptr<const ManifestReader> reader,
                  Kind kind);

    Status validate() const;
    // Tested Library variant, or null when this variant does not test a library
    const VariantConfig* tested_library() const;

    FlavorConfig default_config_;
    SourceSet default_source_set_;
    BuildTypeConfig build_type_;
    std::optional<SourceSet> build_type_source_set_;
    std::shared_ptr<const ManifestReader> reader_;
    Kind kind_;

    std::vector<FlavorConfig> flavor_configs_;
    std::vector<SourceSet> flavor_source_sets_;
    FlavorConfig merged_flavor_;

    std::vector<JarDependency> jars_;
    std::vector<LibraryPtr> direct_libraries_;
    std::vector<LibraryPtr> flat_libraries_;
};

} // namespace strata
