#pragma once

#include <filesystem>
#include <string>

namespace ferry::device {

struct Device {
    std::string name;                     // display name, e.g. "SAMSUNG Android"
    std::string id;                       // mount entry name, e.g. "mtp:host=SAMSUNG_Android_R58M"
    std::filesystem::path mountPoint;
};

}
