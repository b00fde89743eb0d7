// strata_resolve.cpp
//
// Resolve one variant described by a Strata.toml and print everything a
// packaging step would consume:
//
//     ./strata_resolve Strata.toml debug                 # default variant
//     ./strata_resolve Strata.toml release free arm      # with flavors
//     ./strata_resolve Strata.toml debug --library --test
//
// Errors are printed in StrataError::format() form and exit with 1.

#include <strata/descriptor.hpp>
#include <strata/log.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace strata;

struct Options {
    std::string descriptor;
    std::string build_type;
    std::vector<std::string> flavors;
    bool library = false;
    bool test = false;
    bool verbose = false;
};

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--library") {
            opts.library = true;
        } else if (arg == "--test") {
            opts.test = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return StrataError{StrataError::InvalidArg, "unknown option: " + arg};
        } else {
            positional.push_back(std::move(arg));
        }
    }

    if (positional.size() < 2) {
        return StrataError{StrataError::InvalidArg,
            "missing descriptor or build type",
            "usage: strata_resolve <Strata.toml> <build-type> [flavor...] "
            "[--library] [--test] [-v]"};
    }
    opts.descriptor = positional[0];
    opts.build_type = positional[1];
    opts.flavors.assign(positional.begin() + 2, positional.end());
    return Result<Options>::ok(std::move(opts));
}

static Status print_variant(const VariantConfig& cfg) {
    auto pkg = cfg.package_name();
    STRATA_TRY(pkg);
    std::cout << "type:            " << variant_type_name(cfg.type()) << "\n";
    std::cout << "package:         " << pkg.value() << "\n";

    auto tested = cfg.tested_package_name();
    STRATA_TRY(tested);
    if (tested.value()) {
        std::cout << "tested package:  " << *tested.value() << "\n";
        std::cout << "runner:          " << cfg.instrumentation_runner() << "\n";
    }

    if (auto version = cfg.version_name()) {
        std::cout << "version name:    " << *version << "\n";
    }
    if (cfg.merged_flavor().version_code) {
        std::cout << "version code:    " << *cfg.merged_flavor().version_code << "\n";
    }

    std::cout << "resources:\n";
    for (const auto& dir : cfg.resource_inputs()) {
        std::cout << "  " << dir.string() << "\n";
    }

    auto classpath = cfg.compile_classpath();
    STRATA_TRY(classpath);
    std::cout << "classpath:\n";
    for (const auto& entry : classpath.value()) {
        std::cout << "  " << entry.string() << "\n";
    }

    std::cout << "libraries:\n";
    for (const auto& lib : cfg.flat_libraries()) {
        std::cout << "  " << lib->name() << " (" << lib->jar_file().string() << ")\n";
    }

    auto packages = cfg.library_packages();
    STRATA_TRY(packages);
    if (packages.value()) {
        std::cout << "library packages: " << *packages.value() << "\n";
    }
    return ok_status();
}

static Status run(const Options& opts) {
    auto descriptor = Descriptor::load(opts.descriptor);
    STRATA_TRY(descriptor);
    const Descriptor& d = descriptor.value();

    if (d.log_level) log::set_level(*d.log_level);
    log::init_from_env();
    if (opts.verbose) log::set_level(log::Debug);

    if (log::get_level() <= log::Debug) {
        auto tree = d.dependency_tree("<" + opts.build_type + ">");
        STRATA_TRY(tree);
        log::debug("library tree:\n%s", tree.value().c_str());
    }

    auto reader = std::make_shared<const TomlManifestReader>();
    VariantType type = opts.library ? VariantType::Library : VariantType::Default;

    auto variant = d.make_variant(opts.build_type, opts.flavors, reader, type);
    STRATA_TRY(variant);

    if (!opts.test) {
        return print_variant(variant.value());
    }

    auto tested = std::make_shared<const VariantConfig>(std::move(variant).value());
    auto test_variant = d.make_test_variant(opts.build_type, reader, tested);
    STRATA_TRY(test_variant);
    return print_variant(test_variant.value());
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 1;
    }

    auto status = run(opts.value());
    if (status.is_err()) {
        log::error("variant resolution failed");
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
