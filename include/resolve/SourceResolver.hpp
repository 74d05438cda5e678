#pragma once

#include "model/Location.hpp"
#include "model/ResolvedSource.hpp"

#include <string>
#include <vector>

namespace ferry::storage {
class HostEngine;
class DeviceEngine;
}

namespace ferry::resolve {

class PathClassifier;

// Turns user-supplied paths into canonical locations. Every failure throws
// ferry::Error with the matching ErrorCode.
class SourceResolver {
public:
    SourceResolver(PathClassifier& classifier, const storage::HostEngine& host);

    // device may be null for a host-only run.
    [[nodiscard]] model::ResolvedSource resolve(const std::string& rawPath,
                                                const storage::DeviceEngine* device,
                                                const std::vector<std::string>& filenamePatterns,
                                                bool skipAmbiguityCheck) const;

    // Destinations must name a folder. Missing folders are created when
    // createMissing is set.
    [[nodiscard]] model::Location resolveDestination(const std::string& rawPath,
                                                     storage::DeviceEngine* device,
                                                     bool skipAmbiguityCheck,
                                                     bool createMissing) const;

    // Anything other than no pattern or a lone "*".
    static bool hasExplicitPatterns(const std::vector<std::string>& patterns);

private:
    PathClassifier& classifier_;
    const storage::HostEngine& host_;

    model::Location classify(const std::string& path, const storage::DeviceEngine* device, bool skipAmbiguityCheck) const;

    model::ResolvedSource resolveOnDevice(const std::string& path, const storage::DeviceEngine& device,
                                          const std::vector<std::string>& patterns) const;
    model::ResolvedSource resolveOnHost(const std::string& path, const std::vector<std::string>& patterns) const;
};

}
