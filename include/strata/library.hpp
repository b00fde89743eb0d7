#pragma once

#include <strata/result.hpp>
#include <string>
#include <vector>
#include <memory>
#include <filesystem>

namespace strata {

class LibraryDependency;
using LibraryPtr = std::shared_ptr<const LibraryDependency>;

// A library module in the dependency DAG. Nodes are immutable once built
// and are compared by identity: two libraries are the same only if they
// are the same object.
class LibraryDependency {
public:
    LibraryDependency(std::string name,
                      std::filesystem::path manifest,
                      std::filesystem::path res_folder,
                      std::filesystem::path jar_file,
                      std::vector<LibraryPtr> dependencies = {});

    static LibraryPtr make(std::string name,
                           std::filesystem::path manifest,
                           std::filesystem::path res_folder,
                           std::filesystem::path jar_file,
                           std::vector<LibraryPtr> dependencies = {});

    const std::string& name() const { return name_; }
    const std::filesystem::path& manifest() const { return manifest_; }
    // Empty when the library ships no resources
    const std::filesystem::path& res_folder() const { return res_folder_; }
    const std::filesystem::path& jar_file() const { return jar_file_; }
    const std::vector<LibraryPtr>& dependencies() const { return dependencies_; }

private:
    std::string name_;
    std::filesystem::path manifest_;
    std::filesystem::path res_folder_;
    std::filesystem::path jar_file_;
    std::vector<LibraryPtr> dependencies_;
};

// A plain jar on the classpath.
struct JarDependency {
    std::filesystem::path path;
    bool compiled = true;
    bool packaged = true;
};

// Flatten direct library dependencies into one duplicate-free list ordered
// by resource-overlay priority (first entry wins).
//
// The order is that of the following recursion, run over `direct`:
//
//   for i from last to first:
//       flatten(direct[i].dependencies)
//       if direct[i] is not in the output, insert it at the front
//
// so the first declared library ends up first, each library's transitive
// dependencies sit right behind it, and a library reached by several paths
// keeps the position of its first insertion. The traversal runs on an
// explicit stack. Nodes receive their dependencies at construction, so the
// graph is always acyclic.
Result<std::vector<LibraryPtr>> flatten_libraries(const std::vector<LibraryPtr>& direct);

} // namespace strata
