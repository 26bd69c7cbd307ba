#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pathgate/core/result.h"

namespace pathgate::sandbox {

/// @brief Path dialect used to interpret drive-letter prefixes.
enum class Platform {
    kPosix,
    kWindows,
};

/// @brief The platform this binary was compiled for.
Platform HostPlatform();

/// @brief Map a configuration string ("host", "posix", "windows") to a platform.
core::Result<Platform> ParsePlatform(const std::string& name);

/// @brief Turn an untrusted path string into a canonical, root-anchored sandbox path.
///
/// Backslashes become forward slashes, "." and ".." segments are resolved lexically and the
/// result is anchored at "/". Under Platform::kWindows a leading "<letter>:" followed by a
/// separator is kept as a drive root ("C:\\x" -> "C:/x"). Inputs that begin with ".." or "~"
/// are rejected with ErrorCode::kPathTraversal before any normalization. When
/// @p allowed_prefixes is present and non-empty the canonical path must start with one of
/// its entries, otherwise ErrorCode::kPrefixViolation is returned.
///
/// An empty input yields "/." (the relative path is normalized to "." and then anchored).
///
/// Pure: no filesystem access, no symlink resolution.
core::Result<std::string> ValidatePath(
    const std::string& raw_path, Platform platform = HostPlatform(),
    const std::optional<std::vector<std::string>>& allowed_prefixes = std::nullopt);

/// @brief ValidatePath bound to a fixed platform and allow-list.
class PathValidator {
public:
    explicit PathValidator(Platform platform = HostPlatform(),
                           std::vector<std::string> allowed_prefixes = {});

    core::Result<std::string> Validate(const std::string& raw_path) const;

    Platform platform() const { return platform_; }
    const std::vector<std::string>& allowed_prefixes() const { return allowed_prefixes_; }

    static bool IsWindowsDriveAbsolute(const std::string& path, Platform platform);
    /// Collapse separators and resolve "." / ".." with a segment stack. A ".." with nothing
    /// left to pop is dropped. Returns "." for an empty relative result and "/" for an
    /// empty absolute one.
    static std::string NormalizeLexically(const std::string& path);

private:
    Platform platform_;
    std::vector<std::string> allowed_prefixes_;
};

}  // namespace pathgate::sandbox
