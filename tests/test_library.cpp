#include <catch2/catch.hpp>
#include <strata/library.hpp>

using namespace strata;

static LibraryPtr lib(const std::string& name, std::vector<LibraryPtr> deps = {}) {
    return LibraryDependency::make(name, name + "/Manifest.toml", name + "/res",
                                   name + ".jar", std::move(deps));
}

static std::vector<std::string> names(const std::vector<LibraryPtr>& libs) {
    std::vector<std::string> out;
    for (const auto& l : libs) out.push_back(l->name());
    return out;
}

static std::vector<std::string> flat_names(const std::vector<LibraryPtr>& direct) {
    auto r = flatten_libraries(direct);
    REQUIRE(r.is_ok());
    return names(r.value());
}

using Names = std::vector<std::string>;

TEST_CASE("library exposes its paths and dependencies", "[library]") {
    auto b = lib("b");
    auto a = lib("a", {b});
    REQUIRE(a->name() == "a");
    REQUIRE(a->manifest() == std::filesystem::path("a/Manifest.toml"));
    REQUIRE(a->res_folder() == std::filesystem::path("a/res"));
    REQUIRE(a->jar_file() == std::filesystem::path("a.jar"));
    REQUIRE(a->dependencies().size() == 1);
    REQUIRE(a->dependencies()[0] == b);
}

TEST_CASE("flatten empty list", "[library]") {
    REQUIRE(flat_names({}).empty());
}

TEST_CASE("flatten chain", "[library]") {
    auto c = lib("C");
    auto b = lib("B", {c});
    auto a = lib("A", {b});
    REQUIRE(flat_names({a}) == Names{"A", "B", "C"});
}

TEST_CASE("flatten diamond keeps the shared library once", "[library]") {
    auto d = lib("D");
    auto b = lib("B", {d});
    auto c = lib("C", {d});
    auto a = lib("A", {b, c});
    // C is visited first, so D is placed right behind C and B goes in front
    REQUIRE(flat_names({a}) == Names{"A", "B", "C", "D"});
}

TEST_CASE("flatten multiple top-level libraries keeps declaration order", "[library]") {
    auto a = lib("A");
    auto b = lib("B");
    REQUIRE(flat_names({a, b}) == Names{"A", "B"});
}

TEST_CASE("flatten interleaves transitive dependencies behind their owner", "[library]") {
    auto a2 = lib("A2");
    auto a1 = lib("A1", {a2});
    auto b1 = lib("B1");
    auto a = lib("A", {a1});
    auto b = lib("B", {b1});
    REQUIRE(flat_names({a, b}) == Names{"A", "A1", "A2", "B", "B1"});
}

TEST_CASE("flatten shared dependency keeps its first insertion rank", "[library]") {
    auto d = lib("D");
    auto a = lib("A", {d});
    auto b = lib("B", {d});
    // B is processed first and places D; A does not move it
    REQUIRE(flat_names({a, b}) == Names{"A", "B", "D"});
}

TEST_CASE("flatten library that is both direct and transitive", "[library]") {
    auto c = lib("C");
    auto a = lib("A", {c});
    REQUIRE(flat_names({a, c}) == Names{"A", "C"});
    // A is processed first and places C behind it; the direct C entry
    // is already present and keeps that rank
    REQUIRE(flat_names({c, a}) == Names{"A", "C"});
}

TEST_CASE("flatten is by identity, not by name", "[library]") {
    auto first = lib("same");
    auto second = lib("same");
    auto r = flatten_libraries({first, second});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0] == first);
    REQUIRE(r.value()[1] == second);
}

TEST_CASE("flatten duplicate direct entries collapse", "[library]") {
    auto a = lib("A");
    REQUIRE(flat_names({a, a, a}) == Names{"A"});
}

TEST_CASE("flatten output is stable when fed back in", "[library]") {
    auto d = lib("D");
    auto b = lib("B", {d});
    auto c = lib("C", {d});
    auto a = lib("A", {b, c});
    auto once = flatten_libraries({a, c});
    REQUIRE(once.is_ok());
    auto twice = flatten_libraries(once.value());
    REQUIRE(twice.is_ok());
    REQUIRE(names(twice.value()) == names(once.value()));
}

TEST_CASE("flatten deep chain does not overflow", "[library]") {
    LibraryPtr tail = lib("n0");
    for (int i = 1; i < 10000; ++i) {
        tail = lib("n" + std::to_string(i), {tail});
    }
    auto r = flatten_libraries({tail});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 10000);
    REQUIRE(r.value().front()->name() == "n9999");
    REQUIRE(r.value().back()->name() == "n0");
}

TEST_CASE("flatten rejects null entries", "[library]") {
    auto r = flatten_libraries({lib("A"), nullptr});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::InvalidArg);
}
