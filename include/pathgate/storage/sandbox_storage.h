#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "pathgate/core/error.h"
#include "pathgate/core/result.h"
#include "pathgate/sandbox/path_validator.h"

namespace pathgate::storage {

/// @brief Directory entry reported with its virtual (sandbox) path.
struct FileInfo {
    std::string path;
    bool is_dir{false};
    std::uint64_t size_bytes{0};
    std::string modified_at;
};

/// @brief Attributes of a file after a write.
struct StoredFile {
    std::string path;
    std::string etag;
    std::uint64_t size_bytes{0};
};

/// @brief File operations confined to a host directory that backs the virtual root "/".
///
/// Every operation runs its raw path argument through the PathValidator first and returns
/// the validator's error unchanged when the path is rejected.
class SandboxStorage {
public:
    SandboxStorage(std::string root_path, sandbox::PathValidator validator);

    core::Result<std::vector<FileInfo>> List(const std::string& path) const;
    core::Result<std::string> Read(const std::string& path) const;
    /// Create a new file. Fails with kAlreadyExists when the target exists.
    core::Result<StoredFile> Write(const std::string& path, const std::string& content);
    /// Overwrite an existing file. Fails with kNotFound when the target is missing.
    core::Result<StoredFile> Replace(const std::string& path, const std::string& content);
    core::Result<void> Delete(const std::string& path);
    /// All regular files below a directory, as sorted virtual paths.
    core::Result<std::vector<std::string>> Walk(const std::string& path) const;

    /// Validate without touching the filesystem.
    core::Result<std::string> Resolve(const std::string& path) const {
        return validator_.Validate(path);
    }

    const std::string& root_path() const { return root_path_; }

    /// "/a/b" -> <root>/a/b, "/." -> <root>, "C:/x" -> <root>/C/x. Fails when a segment
    /// would re-root the host path or the result would leave the root.
    static core::Result<std::filesystem::path> ToHostPath(const std::string& root_path,
                                                          const std::string& canonical);
    /// Append a relative generic path to a canonical directory ("/." and "/" both mean root).
    static std::string JoinVirtual(const std::string& canonical_dir, const std::string& relative);

private:
    core::Result<StoredFile> WriteAtomically(const std::string& canonical,
                                             const std::filesystem::path& target,
                                             const std::string& content);

    std::string root_path_;
    sandbox::PathValidator validator_;
};

}  // namespace pathgate::storage
