#include "pathgate/sandbox/path_validator.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace pathgate::sandbox {

namespace {

std::string ToForwardSlashes(std::string value) {
    std::replace(value.begin(), value.end(), '\\', '/');
    return value;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string FormatPrefixes(const std::vector<std::string>& prefixes) {
    std::string out = "[";
    for (size_t i = 0; i < prefixes.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += "'" + prefixes[i] + "'";
    }
    out += "]";
    return out;
}

}  // namespace

Platform HostPlatform() {
#ifdef _WIN32
    return Platform::kWindows;
#else
    return Platform::kPosix;
#endif
}

core::Result<Platform> ParsePlatform(const std::string& name) {
    if (name == "host") {
        return HostPlatform();
    }
    if (name == "posix") {
        return Platform::kPosix;
    }
    if (name == "windows") {
        return Platform::kWindows;
    }
    return core::Error{core::ErrorCode::kInvalidArgument, "unknown platform: " + name};
}

bool PathValidator::IsWindowsDriveAbsolute(const std::string& path, Platform platform) {
    if (platform != Platform::kWindows || path.size() < 3) {
        return false;
    }
    return std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':' &&
           (path[2] == '/' || path[2] == '\\');
}

std::string PathValidator::NormalizeLexically(const std::string& path) {
    const bool absolute = !path.empty() && path.front() == '/';
    std::vector<std::string> segments;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (item.empty() || item == ".") {
            continue;
        }
        if (item == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(item);
    }

    std::string out = absolute ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            out += '/';
        }
        out += segments[i];
    }
    if (out.empty()) {
        return ".";
    }
    return out;
}

PathValidator::PathValidator(Platform platform, std::vector<std::string> allowed_prefixes)
    : platform_(platform), allowed_prefixes_(std::move(allowed_prefixes)) {}

core::Result<std::string> PathValidator::Validate(const std::string& raw_path) const {
    // The drive token is split off before separator rewriting so "C:" stays intact.
    std::string drive;
    std::string remainder;
    if (IsWindowsDriveAbsolute(raw_path, platform_)) {
        drive = raw_path.substr(0, 2);
        remainder = ToForwardSlashes(raw_path.substr(2));
    } else {
        remainder = ToForwardSlashes(raw_path);
    }

    if (StartsWith(remainder, "..") || StartsWith(remainder, "~")) {
        return core::Error{core::ErrorCode::kPathTraversal,
                           "Path traversal not allowed: " + raw_path};
    }

    std::string canonical;
    if (!drive.empty()) {
        // Remainder always starts with '/', so this yields "<letter>:/" for a bare drive root.
        canonical = drive + NormalizeLexically(remainder);
    } else if (StartsWith(remainder, "/")) {
        canonical = NormalizeLexically(remainder);
    } else {
        // Anchor after normalizing, without a second pass: "" becomes "/." rather than "/".
        canonical = "/" + NormalizeLexically(remainder);
    }

    if (!allowed_prefixes_.empty()) {
        const bool allowed =
            std::any_of(allowed_prefixes_.begin(), allowed_prefixes_.end(),
                        [&canonical](const std::string& prefix) {
                            return StartsWith(canonical, prefix);
                        });
        if (!allowed) {
            return core::Error{core::ErrorCode::kPrefixViolation,
                               "Path must start with one of " +
                                   FormatPrefixes(allowed_prefixes_) + ": " + canonical};
        }
    }
    return canonical;
}

core::Result<std::string> ValidatePath(
    const std::string& raw_path, Platform platform,
    const std::optional<std::vector<std::string>>& allowed_prefixes) {
    return PathValidator(platform, allowed_prefixes.value_or(std::vector<std::string>{}))
        .Validate(raw_path);
}

}  // namespace pathgate::sandbox
