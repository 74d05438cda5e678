#pragma once

#include <string>
#include <utility>

namespace ferry::storage {
class Handle;
}

namespace ferry::transfer {

// Picks a name that does not exist in a folder yet, the way desktop file
// managers do: "report.pdf", "report (1).pdf", "report (2).pdf", ...
class UniqueNameAllocator {
public:
    static constexpr unsigned MAX_SUFFIX = 999;

    // Throws NameSpaceExhausted once "(999)" is taken as well.
    [[nodiscard]] static std::string allocate(const storage::Handle& folder, const std::string& candidate);

    // {"report", ".pdf"}; dotfiles and names without a dot have no extension.
    [[nodiscard]] static std::pair<std::string, std::string> splitExtension(const std::string& name);
};

}
