#include <strata/library.hpp>
#include <strata/log.hpp>
#include <deque>
#include <unordered_set>

namespace strata {

LibraryDependency::LibraryDependency(std::string name,
                                     std::filesystem::path manifest,
                                     std::filesystem::path res_folder,
                                     std::filesystem::path jar_file,
                                     std::vector<LibraryPtr> dependencies)
    : name_(std::move(name)),
      manifest_(std::move(manifest)),
      res_folder_(std::move(res_folder)),
      jar_file_(std::move(jar_file)),
      dependencies_(std::move(dependencies)) {}

LibraryPtr LibraryDependency::make(std::string name,
                                   std::filesystem::path manifest,
                                   std::filesystem::path res_folder,
                                   std::filesystem::path jar_file,
                                   std::vector<LibraryPtr> dependencies) {
    return std::make_shared<const LibraryDependency>(
        std::move(name), std::move(manifest), std::move(res_folder),
        std::move(jar_file), std::move(dependencies));
}

namespace {

// One pending call of the recursion: `owner` is inserted once all of
// `list` (walked from the back) has been processed. The root frame has
// no owner.
struct Frame {
    LibraryPtr owner;
    const std::vector<LibraryPtr>* list;
    size_t remaining;
};

} // namespace

Result<std::vector<LibraryPtr>> flatten_libraries(const std::vector<LibraryPtr>& direct) {
    std::deque<LibraryPtr> flat;
    std::unordered_set<const LibraryDependency*> placed;

    std::vector<Frame> stack;
    stack.push_back(Frame{nullptr, &direct, direct.size()});

    while (!stack.empty()) {
        Frame& top = stack.back();

        if (top.remaining > 0) {
            --top.remaining;
            const LibraryPtr& lib = (*top.list)[top.remaining];
            if (!lib) {
                return StrataError{StrataError::InvalidArg,
                    "null library in dependency list"};
            }
            // Placed libraries already have their whole closure in the
            // output, so walking them again cannot change the order.
            if (placed.count(lib.get())) continue;
            stack.push_back(Frame{lib, &lib->dependencies(), lib->dependencies().size()});
            continue;
        }

        LibraryPtr owner = std::move(top.owner);
        stack.pop_back();
        if (!owner) continue;

        if (placed.insert(owner.get()).second) {
            log::trace("flatten: placing '%s' at front", owner->name().c_str());
            flat.push_front(std::move(owner));
        }
    }

    return Result<std::vector<LibraryPtr>>::ok(
        std::vector<LibraryPtr>(flat.begin(), flat.end()));
}

} // namespace strata
