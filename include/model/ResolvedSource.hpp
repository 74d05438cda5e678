#pragma once

#include "model/Location.hpp"

#include <string>

namespace ferry::model {

// Exactly one of isDirectoryMatch / isFileMatch is set by a successful resolve.
struct ResolvedSource {
    Location directory;
    std::string filePattern = "*";
    bool isDirectoryMatch = false;
    bool isFileMatch = false;
};

}
