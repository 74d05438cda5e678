#include "resolve/SourceResolver.hpp"
#include "resolve/PathClassifier.hpp"
#include "storage/HostEngine.hpp"
#include "storage/DeviceEngine.hpp"
#include "error/Error.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <optional>

#include <fmt/format.h>

using namespace ferry::model;

namespace ferry::resolve {

namespace {

void rejectDirectoryWildcards(const std::vector<std::string>& segments, const std::string& path) {
    for (size_t i = 0; i + 1 < segments.size(); ++i)
        if (util::hasWildcard(segments[i]))
            throw Error(ErrorCode::WildcardInDirectory,
                        fmt::format("[SourceResolver] Wildcards are only allowed in the last segment: '{}'", path));
}

// "a/b/c" -> "a/b", "c" -> ".", "/c" -> "/"
std::string parentOf(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string leafOf(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

ResolvedSource directoryMatch(LocationKind kind, std::string path) {
    return {{kind, std::move(path)}, "*", true, false};
}

ResolvedSource fileMatch(LocationKind kind, std::string path, std::string pattern,
                         const std::vector<std::string>& patterns) {
    if (SourceResolver::hasExplicitPatterns(patterns))
        throw Error(ErrorCode::PatternConflict,
                    fmt::format("[SourceResolver] '{}' already names files, drop the extra --pattern", pattern));
    return {{kind, std::move(path)}, std::move(pattern), false, true};
}

}

SourceResolver::SourceResolver(PathClassifier& classifier, const storage::HostEngine& host)
    : classifier_(classifier), host_(host) {}

bool SourceResolver::hasExplicitPatterns(const std::vector<std::string>& patterns) {
    if (patterns.empty()) return false;
    return !(patterns.size() == 1 && util::trim(patterns.front()) == "*");
}

Location SourceResolver::classify(const std::string& path, const storage::DeviceEngine* device,
                                  const bool skipAmbiguityCheck) const {
    std::optional<device::Device> dev;
    if (device) dev = device->device();

    auto location = classifier_.classify(path, dev);
    if (location.kind != LocationKind::Ambiguous) return location;

    if (!skipAmbiguityCheck)
        throw Error(ErrorCode::AmbiguousPath,
                    fmt::format("[SourceResolver] '{}' exists both on '{}' and in the current directory; "
                                "prefix it with ./ for the host or pass --skip-ambiguity-check for the device",
                                path, device->displayName()));

    log::Registry::resolve()->info("[SourceResolver] '{}' is ambiguous, using the device as requested", path);
    location.kind = LocationKind::DeviceStore;
    return location;
}

ResolvedSource SourceResolver::resolve(const std::string& rawPath,
                                       const storage::DeviceEngine* device,
                                       const std::vector<std::string>& filenamePatterns,
                                       const bool skipAmbiguityCheck) const {
    auto path = util::trim(rawPath);
    if (path.empty()) throw Error(ErrorCode::InvalidArgument, "[SourceResolver] Source path is empty");
    if (path == "*") path = ".";

    const auto location = classify(path, device, skipAmbiguityCheck);

    auto resolved = location.isDevice() ? resolveOnDevice(path, *device, filenamePatterns)
                                        : resolveOnHost(path, filenamePatterns);

    log::Registry::resolve()->debug("[SourceResolver] '{}' -> {} '{}' pattern '{}' ({} match)",
                                    rawPath, to_string(resolved.directory.kind), resolved.directory.path,
                                    resolved.filePattern, resolved.isDirectoryMatch ? "directory" : "file");
    return resolved;
}

ResolvedSource SourceResolver::resolveOnDevice(const std::string& path, const storage::DeviceEngine& device,
                                               const std::vector<std::string>& patterns) const {
    if (path.find('\\') != std::string::npos)
        throw Error(ErrorCode::InvalidPathSeparator,
                    fmt::format("[SourceResolver] Device paths use '/' only: '{}'", path));

    const auto trailing = util::hasTrailingSeparator(path);
    const auto segments = util::splitSegments(path);
    rejectDirectoryWildcards(segments, path);

    auto current = device.root();
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        const bool last = i + 1 == segments.size();

        if (!last) {
            current = current->resolveChild(segment);
            if (!current || !current->isFolder())
                throw Error(ErrorCode::NotFound,
                            fmt::format("[SourceResolver] No folder '{}' on '{}'",
                                        util::joinSegments(segments, i + 1), device.displayName()));
            continue;
        }

        if (!util::hasWildcard(segment)) {
            const auto child = current->resolveChild(segment);
            if (child && child->isFolder()) return directoryMatch(LocationKind::DeviceStore, util::joinSegments(segments));
        }

        if (trailing)
            throw Error(ErrorCode::NotFound,
                        fmt::format("[SourceResolver] No folder '{}' on '{}'", util::joinSegments(segments),
                                    device.displayName()));

        return fileMatch(LocationKind::DeviceStore, util::joinSegments(segments, i), segment, patterns);
    }

    return directoryMatch(LocationKind::DeviceStore, {});
}

ResolvedSource SourceResolver::resolveOnHost(const std::string& rawPath, const std::vector<std::string>& patterns) const {
    const auto trailing = util::hasTrailingSeparator(rawPath);
    const auto path = util::stripTrailingSeparators(util::normalizeSeparators(rawPath));
    rejectDirectoryWildcards(util::splitSegments(path), path);

    if (host_.isDirectory(path)) return directoryMatch(LocationKind::Host, path);

    if (trailing)
        throw Error(ErrorCode::NotFound, fmt::format("[SourceResolver] No directory '{}' on the host", path));

    const auto parent = parentOf(path);
    const auto leaf = leafOf(path);

    if (!host_.isDirectory(parent))
        throw Error(ErrorCode::NotFound, fmt::format("[SourceResolver] No directory '{}' on the host", parent));

    if (!util::hasWildcard(leaf) && !host_.exists(path))
        throw Error(ErrorCode::NotFound, fmt::format("[SourceResolver] '{}' does not exist", path));

    return fileMatch(LocationKind::Host, parent, leaf, patterns);
}

Location SourceResolver::resolveDestination(const std::string& rawPath,
                                            storage::DeviceEngine* device,
                                            const bool skipAmbiguityCheck,
                                            const bool createMissing) const {
    const auto path = util::trim(rawPath);
    if (path.empty()) throw Error(ErrorCode::InvalidArgument, "[SourceResolver] Destination path is empty");

    if (util::hasWildcard(path))
        throw Error(ErrorCode::WildcardInDirectory,
                    fmt::format("[SourceResolver] Destination cannot contain wildcards: '{}'", path));

    const auto location = classify(path, device, skipAmbiguityCheck);

    if (location.isDevice()) {
        if (path.find('\\') != std::string::npos)
            throw Error(ErrorCode::InvalidPathSeparator,
                        fmt::format("[SourceResolver] Device paths use '/' only: '{}'", path));

        const auto segments = util::splitSegments(path);
        auto current = device->root();
        for (size_t i = 0; i < segments.size(); ++i) {
            auto child = current->resolveChild(segments[i]);
            if (!child && createMissing) {
                child = device->createFolder(*current, segments[i]);
                log::Registry::resolve()->info("[SourceResolver] Created '{}' on '{}'",
                                               util::joinSegments(segments, i + 1), device->displayName());
            }
            if (!child || !child->isFolder())
                throw Error(ErrorCode::NotFound,
                            fmt::format("[SourceResolver] No folder '{}' on '{}'",
                                        util::joinSegments(segments, i + 1), device->displayName()));
            current = child;
        }

        return {LocationKind::DeviceStore, util::joinSegments(segments)};
    }

    const auto hostPath = util::stripTrailingSeparators(util::normalizeSeparators(path));
    if (host_.isDirectory(hostPath)) return {LocationKind::Host, hostPath};

    if (host_.exists(hostPath))
        throw Error(ErrorCode::NotFound, fmt::format("[SourceResolver] '{}' is not a directory", hostPath));

    if (!createMissing)
        throw Error(ErrorCode::NotFound,
                    fmt::format("[SourceResolver] No directory '{}' on the host (use --create-destination)", hostPath));

    host_.createDirectories(hostPath);
    return {LocationKind::Host, hostPath};
}

}
