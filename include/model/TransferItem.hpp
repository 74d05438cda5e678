#pragma once

#include "storage/Handle.hpp"

#include <memory>
#include <string>

namespace ferry::model {

struct TransferItem {
    std::string name;
    std::shared_ptr<storage::Handle> folder;   // where the item lives
    std::shared_ptr<storage::Handle> item;
    bool isFolder = false;
};

}
