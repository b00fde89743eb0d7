#include <strata/variant.hpp>
#include <strata/log.hpp>

namespace strata {

namespace fs = std::filesystem;

const char* variant_type_name(VariantType type) {
    switch (type) {
        case VariantType::Default: return "default";
        case VariantType::Library: return "library";
        case VariantType::Test:    return "test";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

VariantConfig::VariantConfig(FlavorConfig default_config,
                             SourceSet default_source_set,
                             BuildTypeConfig build_type,
                             std::optional<SourceSet> build_type_source_set,
                             std::shared_ptr<const ManifestReader> reader,
                             Kind kind)
    : default_config_(std::move(default_config)),
      default_source_set_(std::move(default_source_set)),
      build_type_(std::move(build_type)),
      build_type_source_set_(std::move(build_type_source_set)),
      reader_(std::move(reader)),
      kind_(std::move(kind)),
      merged_flavor_(default_config_) {}

Result<VariantConfig> VariantConfig::create(FlavorConfig default_config,
                                            SourceSet default_source_set,
                                            BuildTypeConfig build_type,
                                            std::optional<SourceSet> build_type_source_set,
                                            std::shared_ptr<const ManifestReader> reader,
                                            VariantType type) {
    if (!reader) {
        return StrataError{StrataError::InvalidArg, "variant needs a manifest reader"};
    }

    Kind kind;
    switch (type) {
        case VariantType::Default: kind = DefaultKind{}; break;
        case VariantType::Library: kind = LibraryKind{}; break;
        case VariantType::Test:
            return StrataError{StrataError::Invariant,
                "test variant created without a tested variant",
                "use VariantConfig::create_test()"};
    }

    VariantConfig cfg(std::move(default_config), std::move(default_source_set),
                      std::move(build_type), std::move(build_type_source_set),
                      std::move(reader), std::move(kind));
    STRATA_TRY(cfg.validate());

    log::debug("created %s variant (build type '%s')",
               variant_type_name(type), cfg.build_type_.name.c_str());
    return Result<VariantConfig>::ok(std::move(cfg));
}

Result<VariantConfig> VariantConfig::create_test(FlavorConfig default_config,
                                                 SourceSet default_source_set,
                                                 BuildTypeConfig build_type,
                                                 std::optional<SourceSet> build_type_source_set,
                                                 std::shared_ptr<const ManifestReader> reader,
                                                 std::shared_ptr<const VariantConfig> tested) {
    if (!reader) {
        return StrataError{StrataError::InvalidArg, "variant needs a manifest reader"};
    }
    if (!tested) {
        return StrataError{StrataError::Invariant,
            "test variant created without a tested variant"};
    }

    VariantConfig cfg(std::move(default_config), std::move(default_source_set),
                      std::move(build_type), std::move(build_type_source_set),
                      std::move(reader), TestKind{std::move(tested)});
    STRATA_TRY(cfg.validate());

    log::debug("created test variant for %s variant (build type '%s')",
               variant_type_name(cfg.tested_config()->type()),
               cfg.build_type_.name.c_str());
    return Result<VariantConfig>::ok(std::move(cfg));
}

Status VariantConfig::validate() const {
    if (type() == VariantType::Test) return ok_status();

    const fs::path& manifest = default_source_set_.manifest;
    std::error_code ec;
    if (!fs::is_regular_file(manifest, ec)) {
        fs::path shown = fs::absolute(manifest, ec);
        if (ec) shown = manifest;
        return StrataError{StrataError::MissingManifest,
            "main manifest missing from " + shown.string(),
            "the default source set must point at an existing manifest file"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Configuration phase
// ---------------------------------------------------------------------------

void VariantConfig::add_flavor(FlavorConfig flavor, SourceSet source_set) {
    merged_flavor_ = flavor.merge_over(merged_flavor_);
    log::debug("added flavor '%s' (%zu total)",
               flavor.name.c_str(), flavor_configs_.size() + 1);
    flavor_configs_.push_back(std::move(flavor));
    flavor_source_sets_.push_back(std::move(source_set));
}

void VariantConfig::set_jar_dependencies(std::vector<JarDependency> jars) {
    jars_ = std::move(jars);
}

Status VariantConfig::set_library_dependencies(std::vector<LibraryPtr> direct) {
    std::vector<LibraryPtr> previous = std::move(direct_libraries_);
    direct_libraries_ = std::move(direct);

    auto full = full_direct_dependencies();
    if (full.is_err()) {
        direct_libraries_ = std::move(previous);
        return std::move(full).error();
    }

    auto flat = flatten_libraries(full.value());
    if (flat.is_err()) {
        direct_libraries_ = std::move(previous);
        return std::move(flat).error();
    }

    flat_libraries_ = std::move(flat).value();
    log::debug("%zu direct libraries flattened to %zu",
               direct_libraries_.size(), flat_libraries_.size());
    return ok_status();
}

Status VariantConfig::set_output(LibraryPtr output) {
    auto* lib = std::get_if<LibraryKind>(&kind_);
    if (!lib) {
        return StrataError{StrataError::Invariant,
            std::string("output artifact set on a ") + variant_type_name(type()) +
            " variant", "only library variants produce an output artifact"};
    }
    if (!output) {
        return StrataError{StrataError::InvalidArg, "library output must not be null"};
    }
    lib->output = std::move(output);
    return ok_status();
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

VariantType VariantConfig::type() const {
    if (std::holds_alternative<LibraryKind>(kind_)) return VariantType::Library;
    if (std::holds_alternative<TestKind>(kind_)) return VariantType::Test;
    return VariantType::Default;
}

const VariantConfig* VariantConfig::tested_config() const {
    if (auto* test = std::get_if<TestKind>(&kind_)) return test->tested.get();
    return nullptr;
}

LibraryPtr VariantConfig::output() const {
    if (auto* lib = std::get_if<LibraryKind>(&kind_)) return lib->output;
    return nullptr;
}

const VariantConfig* VariantConfig::tested_library() const {
    const VariantConfig* tested = tested_config();
    if (tested && tested->type() == VariantType::Library) return tested;
    return nullptr;
}

Result<std::vector<LibraryPtr>> VariantConfig::full_direct_dependencies() const {
    const VariantConfig* tested = tested_library();
    if (!tested) {
        return Result<std::vector<LibraryPtr>>::ok(direct_libraries_);
    }

    LibraryPtr tested_output = tested->output();
    if (!tested_output) {
        return StrataError{StrataError::Invariant,
            "tested library variant has no output artifact",
            "call set_output() on the library variant before resolving its test"};
    }

    // The tested library is merged in as a regular dependency
    std::vector<LibraryPtr> list;
    list.reserve(direct_libraries_.size() + tested->direct_libraries_.size() + 1);
    list.insert(list.end(), direct_libraries_.begin(), direct_libraries_.end());
    list.push_back(std::move(tested_output));
    list.insert(list.end(), tested->direct_libraries_.begin(),
                tested->direct_libraries_.end());
    return Result<std::vector<LibraryPtr>>::ok(std::move(list));
}

// ---------------------------------------------------------------------------
// Package names
// ---------------------------------------------------------------------------

Result<std::string> VariantConfig::package_from_manifest() const {
    const fs::path& manifest = default_source_set_.manifest;
    auto pkg = reader_->get_package(manifest);
    if (pkg.is_err()) {
        if (pkg.error().code == StrataError::UnresolvedPackage) {
            return std::move(pkg).error();
        }
        return StrataError{StrataError::UnresolvedPackage,
            "cannot read package name: " + pkg.error().message,
            "set a package name on the default config or a flavor",
            manifest.string(), 0};
    }
    if (pkg.value().empty()) {
        return StrataError{StrataError::UnresolvedPackage,
            "manifest declares no package name",
            "set a package name on the default config or a flavor",
            manifest.string(), 0};
    }
    return pkg;
}

Result<std::optional<std::string>> VariantConfig::package_override() const {
    std::optional<std::string> package_name = merged_flavor_.package_name;
    const std::string& suffix = build_type_.package_name_suffix;

    if (!suffix.empty()) {
        if (!package_name) {
            auto from_manifest = package_from_manifest();
            STRATA_TRY(from_manifest);
            package_name = std::move(from_manifest).value();
        }
        package_name = compose_package_name(*package_name, suffix);
    }

    return Result<std::optional<std::string>>::ok(std::move(package_name));
}

Result<std::string> VariantConfig::package_name() const {
    if (const VariantConfig* tested = tested_config()) {
        if (merged_flavor_.test_package_name) {
            return Result<std::string>::ok(*merged_flavor_.test_package_name);
        }
        auto tested_pkg = tested->package_name();
        STRATA_TRY(tested_pkg);
        return Result<std::string>::ok(tested_pkg.value() + ".test");
    }

    auto override_pkg = package_override();
    STRATA_TRY(override_pkg);
    if (override_pkg.value()) {
        return Result<std::string>::ok(*override_pkg.value());
    }
    return package_from_manifest();
}

Result<std::optional<std::string>> VariantConfig::tested_package_name() const {
    const VariantConfig* tested = tested_config();
    if (!tested) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    // A library test is packaged into the test app itself
    auto pkg = tested->type() == VariantType::Library
        ? package_name()
        : tested->package_name();
    STRATA_TRY(pkg);
    return Result<std::optional<std::string>>::ok(std::move(pkg).value());
}

std::string VariantConfig::instrumentation_runner() const {
    return merged_flavor_.test_instrumentation_runner.value_or(DEFAULT_TEST_RUNNER);
}

std::optional<std::string> VariantConfig::version_name() const {
    if (!merged_flavor_.version_name) return std::nullopt;
    return *merged_flavor_.version_name + build_type_.version_name_suffix;
}

Result<std::optional<std::string>> VariantConfig::library_packages() const {
    if (flat_libraries_.empty()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    std::string packages;
    for (const auto& lib : flat_libraries_) {
        auto pkg = reader_->get_package(lib->manifest());
        if (pkg.is_err()) {
            return StrataError{StrataError::UnresolvedPackage,
                "cannot read package of library '" + lib->name() + "': " +
                pkg.error().message, "", lib->manifest().string(), 0};
        }
        if (!packages.empty()) packages += ':';
        packages += pkg.value();
    }
    return Result<std::optional<std::string>>::ok(std::move(packages));
}

// ---------------------------------------------------------------------------
// Resources and classpath
// ---------------------------------------------------------------------------

std::vector<fs::path> VariantConfig::resource_inputs() const {
    std::vector<fs::path> inputs;

    if (build_type_source_set_ && build_type_source_set_->resources) {
        inputs.push_back(*build_type_source_set_->resources);
    }

    for (const auto& source_set : flavor_source_sets_) {
        if (source_set.resources) {
            inputs.push_back(*source_set.resources);
        }
    }

    if (default_source_set_.resources) {
        inputs.push_back(*default_source_set_.resources);
    }

    for (const auto& lib : flat_libraries_) {
        if (!lib->res_folder().empty()) {
            inputs.push_back(lib->res_folder());
        }
    }

    return inputs;
}

Result<std::set<fs::path>> VariantConfig::compile_classpath() const {
    std::set<fs::path> classpath(default_source_set_.compile_classpath.begin(),
                                 default_source_set_.compile_classpath.end());

    if (build_type_source_set_) {
        classpath.insert(build_type_source_set_->compile_classpath.begin(),
                         build_type_source_set_->compile_classpath.end());
    }

    for (const auto& source_set : flavor_source_sets_) {
        classpath.insert(source_set.compile_classpath.begin(),
                         source_set.compile_classpath.end());
    }

    if (const VariantConfig* tested = tested_library()) {
        LibraryPtr tested_output = tested->output();
        if (!tested_output) {
            return StrataError{StrataError::Invariant,
                "tested library variant has no output artifact",
                "call set_output() on the library variant before resolving its test"};
        }
        // The tested library is compiled into the test app, so its output
        // and its own classpath are needed as well
        classpath.insert(tested_output->jar_file());
        auto tested_classpath = tested->compile_classpath();
        STRATA_TRY(tested_classpath);
        classpath.insert(tested_classpath.value().begin(), tested_classpath.value().end());
    }

    return Result<std::set<fs::path>>::ok(std::move(classpath));
}

} // namespace strata
