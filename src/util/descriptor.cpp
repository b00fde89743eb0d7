#include <strata/descriptor.hpp>
#include <strata/graph.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <limits>

namespace strata {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static fs::path resolve_path(const fs::path& base_dir, const std::string& raw) {
    fs::path p(raw);
    if (p.is_absolute() || base_dir.empty()) return p.lexically_normal();
    return (base_dir / p).lexically_normal();
}

static Result<std::vector<std::string>> string_array(const toml::table& tbl,
                                                     const std::string& key,
                                                     const std::string& context) {
    std::vector<std::string> out;
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::vector<std::string>>::ok(std::move(out));

    auto arr = node->as_array();
    if (!arr) {
        return StrataError{StrataError::Config,
            context + ": '" + key + "' must be an array of strings"};
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return StrataError{StrataError::Config,
                context + ": '" + key + "' must contain only strings"};
        }
        out.push_back(std::move(*s));
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

static Result<std::optional<int>> int_field(const toml::table& tbl, const char* key,
                                            const std::string& context) {
    auto v = tbl[key].value<int64_t>();
    if (!v) return Result<std::optional<int>>::ok(std::nullopt);
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
        return StrataError{StrataError::Config,
            context + ": '" + key + "' is out of range: " + std::to_string(*v)};
    }
    return Result<std::optional<int>>::ok(static_cast<int>(*v));
}

static Result<FlavorConfig> parse_flavor(const std::string& name, const toml::table& tbl) {
    FlavorConfig fc;
    fc.name = name;
    std::string context = "flavor '" + name + "'";
    if (auto v = tbl["package"].value<std::string>()) fc.package_name = *v;
    if (auto v = tbl["version-name"].value<std::string>()) fc.version_name = *v;
    if (auto v = tbl["test-package"].value<std::string>()) fc.test_package_name = *v;
    if (auto v = tbl["test-runner"].value<std::string>()) fc.test_instrumentation_runner = *v;

    auto version_code = int_field(tbl, "version-code", context);
    STRATA_TRY(version_code);
    fc.version_code = version_code.value();
    auto min_sdk = int_field(tbl, "min-sdk", context);
    STRATA_TRY(min_sdk);
    fc.min_sdk_version = min_sdk.value();
    auto target_sdk = int_field(tbl, "target-sdk", context);
    STRATA_TRY(target_sdk);
    fc.target_sdk_version = target_sdk.value();
    return Result<FlavorConfig>::ok(std::move(fc));
}

static Result<SourceSet> parse_source_set(const std::string& name,
                                          const toml::table& tbl,
                                          const fs::path& base_dir) {
    SourceSet ss;
    ss.name = name;
    if (auto v = tbl["manifest"].value<std::string>()) {
        ss.manifest = resolve_path(base_dir, *v);
    }
    if (auto v = tbl["res"].value<std::string>()) {
        ss.resources = resolve_path(base_dir, *v);
    }
    auto classpath = string_array(tbl, "classpath", "source set '" + name + "'");
    STRATA_TRY(classpath);
    for (const auto& entry : classpath.value()) {
        ss.compile_classpath.push_back(resolve_path(base_dir, entry));
    }
    return Result<SourceSet>::ok(std::move(ss));
}

// A [default]/[flavors.x]/[test] style section with an optional .sources subtable
static Result<FlavorEntry> parse_flavor_entry(const std::string& name,
                                              const toml::table& tbl,
                                              const fs::path& base_dir) {
    FlavorEntry entry;
    auto config = parse_flavor(name, tbl);
    STRATA_TRY(config);
    entry.config = std::move(config).value();
    entry.sources.name = name;
    if (auto src = tbl["sources"].as_table()) {
        auto ss = parse_source_set(name, *src, base_dir);
        STRATA_TRY(ss);
        entry.sources = std::move(ss).value();
    }
    return Result<FlavorEntry>::ok(std::move(entry));
}

static Result<BuildTypeEntry> parse_build_type(const std::string& name,
                                               const toml::table& tbl,
                                               const fs::path& base_dir) {
    BuildTypeEntry entry;
    entry.config.name = name;
    if (auto v = tbl["package-suffix"].value<std::string>()) entry.config.package_name_suffix = *v;
    if (auto v = tbl["version-suffix"].value<std::string>()) entry.config.version_name_suffix = *v;
    if (auto v = tbl["debuggable"].value<bool>()) entry.config.debuggable = *v;
    if (auto src = tbl["sources"].as_table()) {
        auto ss = parse_source_set(name, *src, base_dir);
        STRATA_TRY(ss);
        entry.sources = std::move(ss).value();
    }
    return Result<BuildTypeEntry>::ok(std::move(entry));
}

static Result<LibrarySpec> parse_library(const std::string& name,
                                         const toml::table& tbl,
                                         const fs::path& base_dir) {
    LibrarySpec lib;
    lib.name = name;
    if (auto v = tbl["manifest"].value<std::string>()) lib.manifest = resolve_path(base_dir, *v);
    if (auto v = tbl["res"].value<std::string>()) lib.res = resolve_path(base_dir, *v);
    if (auto v = tbl["artifact"].value<std::string>()) {
        lib.artifact = resolve_path(base_dir, *v);
    } else {
        return StrataError{StrataError::Config,
            "library '" + name + "' has no artifact",
            "add `artifact = \"path/to/" + name + ".jar\"`"};
    }
    auto deps = string_array(tbl, "dependencies", "library '" + name + "'");
    STRATA_TRY(deps);
    lib.dependencies = std::move(deps).value();
    return Result<LibrarySpec>::ok(std::move(lib));
}

// ---------------------------------------------------------------------------
// Descriptor::parse / load
// ---------------------------------------------------------------------------

Result<Descriptor> Descriptor::parse(const std::string& toml_str, const fs::path& base_dir) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StrataError{StrataError::Parse,
            "descriptor TOML parse error: " + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Descriptor d;
    d.base_dir = base_dir;

    // [settings]
    if (auto settings = doc["settings"].as_table()) {
        if (auto v = (*settings)["log-level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            STRATA_TRY(lvl);
            d.log_level = lvl.value();
        }
    }

    // [default]
    auto def = doc["default"].as_table();
    if (!def) {
        return StrataError{StrataError::Config,
            "descriptor has no [default] section",
            "declare the main manifest under [default.sources]"};
    }
    auto def_entry = parse_flavor_entry("main", *def, base_dir);
    STRATA_TRY(def_entry);
    d.default_config = std::move(def_entry.value().config);
    d.default_sources = std::move(def_entry.value().sources);

    // [build-types.<name>]
    if (auto bts = doc["build-types"].as_table()) {
        for (const auto& [key, val] : *bts) {
            std::string name(key.str());
            auto tbl = val.as_table();
            if (!tbl) {
                return StrataError{StrataError::Config,
                    "build type '" + name + "' must be a table"};
            }
            auto bt = parse_build_type(name, *tbl, base_dir);
            STRATA_TRY(bt);
            d.build_types[name] = std::move(bt).value();
        }
    }

    // [flavors.<name>]
    if (auto fls = doc["flavors"].as_table()) {
        for (const auto& [key, val] : *fls) {
            std::string name(key.str());
            auto tbl = val.as_table();
            if (!tbl) {
                return StrataError{StrataError::Config,
                    "flavor '" + name + "' must be a table"};
            }
            auto fe = parse_flavor_entry(name, *tbl, base_dir);
            STRATA_TRY(fe);
            d.flavors[name] = std::move(fe).value();
        }
    }

    // [test]
    if (auto test = doc["test"].as_table()) {
        auto te = parse_flavor_entry("test", *test, base_dir);
        STRATA_TRY(te);
        d.test = std::move(te).value();
    }

    // [output]
    if (auto out = doc["output"].as_table()) {
        if (auto v = (*out)["artifact"].value<std::string>()) {
            d.output_artifact = resolve_path(base_dir, *v);
        }
    }

    // [libraries.<name>]
    if (auto libs = doc["libraries"].as_table()) {
        for (const auto& [key, val] : *libs) {
            std::string name(key.str());
            auto tbl = val.as_table();
            if (!tbl) {
                return StrataError{StrataError::Config,
                    "library '" + name + "' must be a table"};
            }
            auto lib = parse_library(name, *tbl, base_dir);
            STRATA_TRY(lib);
            d.libraries.push_back(std::move(lib).value());
        }
    }

    // [dependencies]
    if (auto deps = doc["dependencies"].as_table()) {
        auto libs = string_array(*deps, "libraries", "[dependencies]");
        STRATA_TRY(libs);
        d.direct_libraries = std::move(libs).value();

        auto jars = string_array(*deps, "jars", "[dependencies]");
        STRATA_TRY(jars);
        for (const auto& jar : jars.value()) {
            d.jars.push_back(JarDependency{resolve_path(base_dir, jar), true, true});
        }
    }

    return Result<Descriptor>::ok(std::move(d));
}

Result<Descriptor> Descriptor::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StrataError{StrataError::IO,
            "cannot open descriptor: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto d = Descriptor::parse(ss.str(), path.parent_path());
    if (d.is_err() && d.error().file.empty()) {
        d.error().file = path.string();
    }
    return d;
}

// ---------------------------------------------------------------------------
// Library graph
// ---------------------------------------------------------------------------

Result<std::unordered_map<std::string, LibraryPtr>> Descriptor::build_libraries() const {
    std::unordered_map<std::string, const LibrarySpec*> specs;
    GraphMap graph;
    for (const auto& lib : libraries) {
        specs[lib.name] = &lib;
        graph.add_node(lib.name);
    }
    for (const auto& lib : libraries) {
        for (const auto& dep : lib.dependencies) {
            if (!specs.count(dep)) {
                return StrataError{StrataError::NotFound,
                    "library '" + lib.name + "' depends on unknown library '" + dep + "'",
                    "declare it under [libraries." + dep + "]"};
            }
            graph.add_edge(lib.name, dep);
        }
    }

    auto order = graph.topological_sort();
    STRATA_TRY(order);

    // Dependents come first in the order, so build from the back
    std::unordered_map<std::string, LibraryPtr> built;
    const auto& names = order.value();
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        const LibrarySpec& spec = *specs.at(*it);
        std::vector<LibraryPtr> deps;
        deps.reserve(spec.dependencies.size());
        for (const auto& dep : spec.dependencies) {
            deps.push_back(built.at(dep));
        }
        built[spec.name] = LibraryDependency::make(
            spec.name, spec.manifest, spec.res, spec.artifact, std::move(deps));
    }

    log::debug("built %zu libraries", built.size());
    return Result<std::unordered_map<std::string, LibraryPtr>>::ok(std::move(built));
}

static Result<std::vector<LibraryPtr>> lookup_libraries(
    const std::unordered_map<std::string, LibraryPtr>& built,
    const std::vector<std::string>& names)
{
    std::vector<LibraryPtr> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        auto it = built.find(name);
        if (it == built.end()) {
            return StrataError{StrataError::NotFound,
                "unknown library dependency '" + name + "'",
                "declare it under [libraries." + name + "]"};
        }
        out.push_back(it->second);
    }
    return Result<std::vector<LibraryPtr>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Variant construction
// ---------------------------------------------------------------------------

Result<VariantConfig> Descriptor::make_variant(const std::string& build_type,
                                               const std::vector<std::string>& flavor_names,
                                               std::shared_ptr<const ManifestReader> reader,
                                               VariantType type) const {
    auto bt = build_types.find(build_type);
    if (bt == build_types.end()) {
        return StrataError{StrataError::NotFound,
            "unknown build type '" + build_type + "'"};
    }

    auto variant = VariantConfig::create(default_config, default_sources,
                                         bt->second.config, bt->second.sources,
                                         std::move(reader), type);
    STRATA_TRY(variant);
    VariantConfig& cfg = variant.value();

    for (const auto& name : flavor_names) {
        auto fl = flavors.find(name);
        if (fl == flavors.end()) {
            return StrataError{StrataError::NotFound, "unknown flavor '" + name + "'"};
        }
        cfg.add_flavor(fl->second.config, fl->second.sources);
    }

    cfg.set_jar_dependencies(jars);

    auto built = build_libraries();
    STRATA_TRY(built);
    auto direct = lookup_libraries(built.value(), direct_libraries);
    STRATA_TRY(direct);

    if (type == VariantType::Library && output_artifact) {
        fs::path res = default_sources.resources.value_or(fs::path());
        STRATA_TRY(cfg.set_output(LibraryDependency::make(
            default_config.package_name.value_or(default_sources.name),
            default_sources.manifest, res, *output_artifact, direct.value())));
    }

    STRATA_TRY(cfg.set_library_dependencies(std::move(direct).value()));
    return variant;
}

Result<VariantConfig> Descriptor::make_test_variant(const std::string& build_type,
                                                    std::shared_ptr<const ManifestReader> reader,
                                                    std::shared_ptr<const VariantConfig> tested) const {
    auto bt = build_types.find(build_type);
    if (bt == build_types.end()) {
        return StrataError{StrataError::NotFound,
            "unknown build type '" + build_type + "'"};
    }

    FlavorEntry entry;
    if (test) {
        entry = *test;
    } else {
        entry.config.name = "test";
        entry.sources.name = "test";
    }

    const VariantConfig* tested_cfg = tested.get();
    auto variant = VariantConfig::create_test(entry.config, entry.sources,
                                              bt->second.config, bt->second.sources,
                                              std::move(reader), std::move(tested));
    STRATA_TRY(variant);

    // The test variant follows the tested flavors so their test package and
    // runner overrides apply. Flavor sources stay with the tested variant.
    for (const auto& flavor : tested_cfg->flavor_configs()) {
        SourceSet sources;
        sources.name = "test-" + flavor.name;
        variant.value().add_flavor(flavor, std::move(sources));
    }

    STRATA_TRY(variant.value().set_library_dependencies({}));
    return variant;
}

Result<std::string> Descriptor::dependency_tree(const std::string& root_label) const {
    GraphMap graph;
    graph.add_node(root_label);
    for (const auto& name : direct_libraries) {
        graph.add_edge(root_label, name);
    }
    for (const auto& lib : libraries) {
        for (const auto& dep : lib.dependencies) {
            graph.add_edge(lib.name, dep);
        }
    }
    STRATA_TRY(graph.topological_sort());
    return Result<std::string>::ok(graph.tree_display(root_label));
}

} // namespace strata
