#include <catch2/catch.hpp>
#include <strata/descriptor.hpp>
#include "temp_dir.hpp"
#include <algorithm>

using namespace strata;
namespace fs = std::filesystem;

static const char* kDescriptor = R"(
[settings]
log-level = "debug"

[default]
package = "com.example.app"
version-code = 3
version-name = "1.0"
min-sdk = 14

[default.sources]
manifest = "src/main/Manifest.toml"
res = "src/main/res"
classpath = ["libs/main.jar"]

[build-types.debug]
package-suffix = ".debug"
version-suffix = "-dbg"
debuggable = true

[build-types.debug.sources]
res = "src/debug/res"

[build-types.release]

[flavors.free]
version-name = "1.0-free"
[flavors.free.sources]
res = "src/free/res"
classpath = ["libs/ads.jar"]

[flavors.arm]
min-sdk = 16

[test]
test-runner = "com.example.Runner"

[output]
artifact = "build/app.jar"

[libraries.ui]
manifest = "libs/ui/Manifest.toml"
res = "libs/ui/res"
artifact = "libs/ui.jar"
dependencies = ["base"]

[libraries.net]
artifact = "libs/net.jar"
dependencies = ["base"]

[libraries.base]
res = "libs/base/res"
artifact = "libs/base.jar"

[dependencies]
libraries = ["ui", "net"]
jars = ["libs/gson.jar"]
)";

static std::vector<std::string> names(const std::vector<LibraryPtr>& libs) {
    std::vector<std::string> out;
    for (const auto& l : libs) out.push_back(l->name());
    return out;
}

struct DescriptorFixture {
    TempDir tmp;
    fs::path path;
    std::shared_ptr<const ManifestReader> reader = std::make_shared<TomlManifestReader>();

    DescriptorFixture() {
        path = tmp.write_file("Strata.toml", kDescriptor);
        tmp.write_file("src/main/Manifest.toml", "[manifest]\npackage = \"com.example.manifest\"\n");
    }

    Descriptor load() const {
        auto r = Descriptor::load(path);
        REQUIRE(r.is_ok());
        return std::move(r).value();
    }
};

// ===== Parsing =====

TEST_CASE("parse descriptor sections", "[descriptor]") {
    DescriptorFixture fx;
    auto d = fx.load();

    REQUIRE(d.log_level == std::optional<log::Level>(log::Debug));
    REQUIRE(d.default_config.package_name == std::optional<std::string>("com.example.app"));
    REQUIRE(d.default_config.version_code == std::optional<int>(3));
    REQUIRE(d.default_sources.manifest == fx.tmp.path / "src/main/Manifest.toml");
    REQUIRE(d.default_sources.compile_classpath == std::vector<fs::path>{fx.tmp.path / "libs/main.jar"});

    REQUIRE(d.build_types.size() == 2);
    const auto& debug = d.build_types.at("debug");
    REQUIRE(debug.config.package_name_suffix == ".debug");
    REQUIRE(debug.config.version_name_suffix == "-dbg");
    REQUIRE(debug.config.debuggable);
    REQUIRE(debug.sources.has_value());
    REQUIRE_FALSE(d.build_types.at("release").sources.has_value());

    REQUIRE(d.flavors.size() == 2);
    REQUIRE(d.flavors.at("arm").config.min_sdk_version == std::optional<int>(16));
    REQUIRE(d.flavors.at("arm").sources.name == "arm");
    REQUIRE_FALSE(d.flavors.at("arm").sources.resources.has_value());

    REQUIRE(d.test.has_value());
    REQUIRE(d.output_artifact == std::optional<fs::path>(fx.tmp.path / "build/app.jar"));
    REQUIRE(d.libraries.size() == 3);
    REQUIRE(d.direct_libraries == std::vector<std::string>{"ui", "net"});
    REQUIRE(d.jars.size() == 1);
}

TEST_CASE("descriptor requires a default section", "[descriptor]") {
    auto r = Descriptor::parse("[build-types.debug]\n", "");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Config);
}

TEST_CASE("descriptor rejects invalid TOML", "[descriptor]") {
    auto r = Descriptor::parse("[default\n", "");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Parse);
}

TEST_CASE("descriptor rejects unknown log level", "[descriptor]") {
    auto r = Descriptor::parse("[settings]\nlog-level = \"loud\"\n[default]\n", "");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Config);
}

TEST_CASE("library without artifact is a config error", "[descriptor]") {
    auto r = Descriptor::parse("[default]\n[libraries.ui]\nres = \"res\"\n", "");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Config);
    REQUIRE(r.error().message.find("ui") != std::string::npos);
}

TEST_CASE("non-string classpath entry is a config error", "[descriptor]") {
    auto r = Descriptor::parse("[default.sources]\nclasspath = [1, 2]\n", "");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Config);
}

TEST_CASE("integer fields reject values outside int range", "[descriptor]") {
    auto r = Descriptor::parse("[default]\nversion-code = 4294967297\n", "");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Config);
    REQUIRE(r.error().message.find("version-code") != std::string::npos);

    auto fl = Descriptor::parse("[default]\n[flavors.arm]\nmin-sdk = -3000000000\n", "");
    REQUIRE(fl.is_err());
    REQUIRE(fl.error().code == StrataError::Config);
    REQUIRE(fl.error().message.find("flavor 'arm'") != std::string::npos);
}

TEST_CASE("missing descriptor file is an IO error", "[descriptor]") {
    TempDir tmp;
    auto r = Descriptor::load(tmp.path / "Strata.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::IO);
}

// ===== Library graph =====

TEST_CASE("library graph shares nodes", "[descriptor]") {
    DescriptorFixture fx;
    auto built = fx.load().build_libraries();
    REQUIRE(built.is_ok());
    const auto& libs = built.value();
    REQUIRE(libs.size() == 3);
    REQUIRE(libs.at("ui")->dependencies()[0] == libs.at("base"));
    REQUIRE(libs.at("net")->dependencies()[0] == libs.at("base"));
    REQUIRE(libs.at("net")->res_folder().empty());
}

TEST_CASE("library graph rejects unknown dependencies", "[descriptor]") {
    auto d = Descriptor::parse(R"(
[default]
[libraries.ui]
artifact = "ui.jar"
dependencies = ["ghost"]
)", "");
    REQUIRE(d.is_ok());
    auto r = d.value().build_libraries();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::NotFound);
}

TEST_CASE("library graph rejects cycles", "[descriptor]") {
    auto d = Descriptor::parse(R"(
[default]
[libraries.a]
artifact = "a.jar"
dependencies = ["b"]
[libraries.b]
artifact = "b.jar"
dependencies = ["a"]
)", "");
    REQUIRE(d.is_ok());
    auto r = d.value().build_libraries();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Cycle);
}

TEST_CASE("dependency tree lists direct libraries", "[descriptor]") {
    DescriptorFixture fx;
    auto tree = fx.load().dependency_tree("app");
    REQUIRE(tree.is_ok());
    REQUIRE(tree.value().find("app\n") == 0);
    REQUIRE(tree.value().find("base (*)") != std::string::npos);
}

// ===== Variants =====

TEST_CASE("make_variant resolves a flavored debug variant", "[descriptor]") {
    DescriptorFixture fx;
    auto d = fx.load();
    auto r = d.make_variant("debug", {"free", "arm"}, fx.reader);
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();

    REQUIRE(cfg.package_name().value() == "com.example.app.debug");
    REQUIRE(cfg.version_name() == std::optional<std::string>("1.0-free-dbg"));
    REQUIRE(cfg.merged_flavor().min_sdk_version == std::optional<int>(16));
    REQUIRE(names(cfg.flat_libraries()) == std::vector<std::string>{"ui", "net", "base"});
    REQUIRE(cfg.jar_dependencies().size() == 1);

    std::vector<fs::path> res = {
        fx.tmp.path / "src/debug/res",
        fx.tmp.path / "src/free/res",
        fx.tmp.path / "src/main/res",
        fx.tmp.path / "libs/ui/res",
        fx.tmp.path / "libs/base/res"};
    REQUIRE(cfg.resource_inputs() == res);

    auto cp = cfg.compile_classpath();
    REQUIRE(cp.is_ok());
    REQUIRE(cp.value().count(fx.tmp.path / "libs/ads.jar") == 1);
}

TEST_CASE("make_variant rejects unknown build types and flavors", "[descriptor]") {
    DescriptorFixture fx;
    auto d = fx.load();
    auto bt = d.make_variant("staging", {}, fx.reader);
    REQUIRE(bt.is_err());
    REQUIRE(bt.error().code == StrataError::NotFound);
    auto fl = d.make_variant("debug", {"paid"}, fx.reader);
    REQUIRE(fl.is_err());
    REQUIRE(fl.error().code == StrataError::NotFound);
}

TEST_CASE("make_variant fails when the main manifest is missing", "[descriptor]") {
    DescriptorFixture fx;
    auto d = fx.load();
    fs::remove(fx.tmp.path / "src/main/Manifest.toml");
    auto r = d.make_variant("release", {}, fx.reader);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::MissingManifest);
}

TEST_CASE("library variant test pulls in the library output", "[descriptor]") {
    DescriptorFixture fx;
    auto d = fx.load();
    auto lib = d.make_variant("release", {}, fx.reader, VariantType::Library);
    REQUIRE(lib.is_ok());
    REQUIRE(lib.value().output() != nullptr);
    REQUIRE(lib.value().output()->jar_file() == fx.tmp.path / "build/app.jar");

    auto tested = std::make_shared<const VariantConfig>(std::move(lib).value());
    auto test = d.make_test_variant("release", fx.reader, tested);
    REQUIRE(test.is_ok());
    REQUIRE(test.value().package_name().value() == "com.example.app.test");
    REQUIRE(test.value().instrumentation_runner() == "com.example.Runner");
    REQUIRE(names(test.value().flat_libraries()) ==
            std::vector<std::string>{"com.example.app", "ui", "net", "base"});

    auto cp = test.value().compile_classpath();
    REQUIRE(cp.is_ok());
    REQUIRE(cp.value().count(fx.tmp.path / "build/app.jar") == 1);
}

TEST_CASE("test variant applies the tested variant's flavors", "[descriptor]") {
    DescriptorFixture fx;
    fx.tmp.write_file("Strata.toml", std::string(kDescriptor) + R"(
[flavors.paid]
test-package = "com.example.paid.tests"
test-runner = "com.example.PaidRunner"
[flavors.paid.sources]
res = "src/paid/res"
)");
    auto d = fx.load();

    auto app = d.make_variant("debug", {"paid"}, fx.reader);
    REQUIRE(app.is_ok());
    auto tested = std::make_shared<const VariantConfig>(std::move(app).value());

    auto test = d.make_test_variant("debug", fx.reader, tested);
    REQUIRE(test.is_ok());
    const auto& cfg = test.value();
    REQUIRE(cfg.flavor_configs().size() == 1);
    REQUIRE(cfg.flavor_configs()[0].name == "paid");
    REQUIRE(cfg.package_name().value() == "com.example.paid.tests");
    REQUIRE(cfg.instrumentation_runner() == "com.example.PaidRunner");

    auto res = cfg.resource_inputs();
    REQUIRE(std::find(res.begin(), res.end(), fx.tmp.path / "src/paid/res") == res.end());

    // Without flavor overrides the [test] runner still applies.
    auto plain = d.make_variant("debug", {"free"}, fx.reader);
    REQUIRE(plain.is_ok());
    auto free_test = d.make_test_variant(
        "debug", fx.reader, std::make_shared<const VariantConfig>(std::move(plain).value()));
    REQUIRE(free_test.is_ok());
    REQUIRE(free_test.value().instrumentation_runner() == "com.example.Runner");
    REQUIRE(free_test.value().package_name().value() == "com.example.app.debug.test");
}
