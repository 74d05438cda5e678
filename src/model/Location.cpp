#include "model/Location.hpp"

namespace ferry::model {

std::string to_string(const LocationKind kind) {
    switch (kind) {
        case LocationKind::Host: return "host";
        case LocationKind::DeviceStore: return "device";
        case LocationKind::Ambiguous: return "ambiguous";
        default: return "unknown";
    }
}

}
