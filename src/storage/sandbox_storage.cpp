#include "pathgate/storage/sandbox_storage.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

#include <Poco/DigestEngine.h>
#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/SHA2Engine.h>

#include "pathgate/core/ids.h"
#include "pathgate/core/logger.h"
#include "pathgate/core/time.h"

namespace pathgate::storage {

namespace fs = std::filesystem;

namespace {

core::Error IoError(const std::string& what, const std::string& path, const std::error_code& ec) {
    return core::Error{core::ErrorCode::kIoError, what + " '" + path + "': " + ec.message()};
}

core::Error NotFound(const std::string& path) {
    return core::Error{core::ErrorCode::kNotFound, "File '" + path + "' not found"};
}

// Host names containing a backslash re-validate to a different virtual path, so they cannot
// be reached through the sandbox and are left out of listings.
bool Addressable(const std::string& generic_name) {
    if (generic_name.find('\\') == std::string::npos) {
        return true;
    }
    core::LogDebug("skipping unaddressable host entry: " + generic_name);
    return false;
}

std::string ModifiedAt(const fs::path& path) {
    try {
        return core::FormatIso8601(Poco::File(path.string()).getLastModified());
    } catch (const Poco::Exception&) {
        return "";
    }
}

}  // namespace

SandboxStorage::SandboxStorage(std::string root_path, sandbox::PathValidator validator)
    : root_path_(std::move(root_path)), validator_(std::move(validator)) {
    fs::create_directories(root_path_);
}

core::Result<fs::path> SandboxStorage::ToHostPath(const std::string& root_path,
                                                  const std::string& canonical) {
    const fs::path root(root_path);
    fs::path host = root;
    std::string relative;
    if (canonical.size() >= 2 && canonical[1] == ':') {
        // Drive paths live under a top-level directory named after the letter.
        host /= canonical.substr(0, 1);
        relative = canonical.substr(2);
    } else {
        relative = canonical;
    }
    size_t start = 0;
    while (start <= relative.size()) {
        const auto end = relative.find('/', start);
        const auto segment =
            relative.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!segment.empty() && segment != ".") {
            // A segment such as "C:" carries a root name on Windows and would replace the
            // whole path when appended.
            const fs::path part(segment);
            if (part.has_root_name() || part.has_root_directory()) {
                return core::Error{core::ErrorCode::kInvalidArgument,
                                   "path segment '" + segment + "' is not allowed: " + canonical};
            }
            host /= part;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    const auto inside = host.lexically_normal().lexically_relative(root.lexically_normal());
    if (inside.empty() || *inside.begin() == "..") {
        return core::Error{core::ErrorCode::kPathTraversal,
                           "Path traversal not allowed: " + canonical};
    }
    return host;
}

std::string SandboxStorage::JoinVirtual(const std::string& canonical_dir,
                                        const std::string& relative) {
    std::string base = canonical_dir == "/." ? "/" : canonical_dir;
    if (relative.empty()) {
        return base;
    }
    if (base.back() != '/') {
        base += '/';
    }
    return base + relative;
}

core::Result<std::vector<FileInfo>> SandboxStorage::List(const std::string& path) const {
    auto canonical = validator_.Validate(path);
    if (!canonical.ok()) {
        return canonical.error();
    }
    auto host = ToHostPath(root_path_, canonical.value());
    if (!host.ok()) {
        return host.error();
    }
    const auto& dir = host.value();
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return core::Error{core::ErrorCode::kNotFound,
                           "Directory '" + canonical.value() + "' not found"};
    }
    if (!fs::is_directory(dir, ec)) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "'" + canonical.value() + "' is not a directory"};
    }

    std::vector<FileInfo> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().generic_string();
        if (!Addressable(name)) {
            continue;
        }
        FileInfo info;
        info.path = JoinVirtual(canonical.value(), name);
        info.is_dir = it->is_directory(ec);
        if (info.is_dir) {
            info.path += '/';
        } else {
            info.size_bytes = static_cast<std::uint64_t>(it->file_size(ec));
        }
        info.modified_at = ModifiedAt(it->path());
        entries.push_back(std::move(info));
    }
    if (ec) {
        return IoError("failed to list", canonical.value(), ec);
    }
    std::sort(entries.begin(), entries.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.path < b.path; });
    return entries;
}

core::Result<std::string> SandboxStorage::Read(const std::string& path) const {
    auto canonical = validator_.Validate(path);
    if (!canonical.ok()) {
        return canonical.error();
    }
    auto host = ToHostPath(root_path_, canonical.value());
    if (!host.ok()) {
        return host.error();
    }
    const auto& file = host.value();
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return NotFound(canonical.value());
    }
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to open '" + canonical.value() + "'"};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

core::Result<StoredFile> SandboxStorage::Write(const std::string& path,
                                               const std::string& content) {
    auto canonical = validator_.Validate(path);
    if (!canonical.ok()) {
        return canonical.error();
    }
    auto host = ToHostPath(root_path_, canonical.value());
    if (!host.ok()) {
        return host.error();
    }
    const auto& target = host.value();
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return IoError("failed to create parent of", canonical.value(), ec);
    }

    // Exclusive create reserves the name; the rename below replaces the empty reservation.
    bool reserved = false;
    try {
        reserved = Poco::File(target.string()).createFile();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to create '" + canonical.value() + "': " + ex.displayText()};
    }
    if (!reserved) {
        return core::Error{core::ErrorCode::kAlreadyExists,
                           "Cannot write to " + canonical.value() +
                               " because it already exists. Read and then make an edit to "
                               "the file instead."};
    }

    auto stored = WriteAtomically(canonical.value(), target, content);
    if (!stored.ok()) {
        fs::remove(target, ec);
    }
    return stored;
}

core::Result<StoredFile> SandboxStorage::Replace(const std::string& path,
                                                 const std::string& content) {
    auto canonical = validator_.Validate(path);
    if (!canonical.ok()) {
        return canonical.error();
    }
    auto host = ToHostPath(root_path_, canonical.value());
    if (!host.ok()) {
        return host.error();
    }
    const auto& target = host.value();
    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        return NotFound(canonical.value());
    }
    return WriteAtomically(canonical.value(), target, content);
}

core::Result<void> SandboxStorage::Delete(const std::string& path) {
    auto canonical = validator_.Validate(path);
    if (!canonical.ok()) {
        return canonical.error();
    }
    auto host = ToHostPath(root_path_, canonical.value());
    if (!host.ok()) {
        return host.error();
    }
    const auto& target = host.value();
    std::error_code ec;
    if (!fs::exists(target, ec)) {
        return NotFound(canonical.value());
    }
    if (fs::is_directory(target, ec)) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "'" + canonical.value() + "' is a directory"};
    }
    if (!fs::remove(target, ec) || ec) {
        return IoError("failed to delete", canonical.value(), ec);
    }
    return core::Ok();
}

core::Result<std::vector<std::string>> SandboxStorage::Walk(const std::string& path) const {
    auto canonical = validator_.Validate(path);
    if (!canonical.ok()) {
        return canonical.error();
    }
    auto host = ToHostPath(root_path_, canonical.value());
    if (!host.ok()) {
        return host.error();
    }
    const auto& dir = host.value();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return core::Error{core::ErrorCode::kNotFound,
                           "Directory '" + canonical.value() + "' not found"};
    }

    std::vector<std::string> files;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const auto relative = it->path().lexically_relative(dir).generic_string();
        if (!Addressable(relative)) {
            continue;
        }
        files.push_back(JoinVirtual(canonical.value(), relative));
    }
    if (ec) {
        return IoError("failed to walk", canonical.value(), ec);
    }
    std::sort(files.begin(), files.end());
    return files;
}

core::Result<StoredFile> SandboxStorage::WriteAtomically(const std::string& canonical,
                                                         const fs::path& target,
                                                         const std::string& content) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return IoError("failed to create parent of", canonical, ec);
    }

    // Write to a temp file beside the target, then rename into place.
    const auto temp_path =
        target.parent_path() / core::GenerateTempName(target.filename().string());
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Error{core::ErrorCode::kIoError,
                               "failed to open temp file for '" + canonical + "'"};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp_path, ec);
            return core::Error{core::ErrorCode::kIoError,
                               "failed to write '" + canonical + "'"};
        }
    }
    fs::rename(temp_path, target, ec);
    if (ec) {
        const auto rename_ec = ec;
        fs::remove(temp_path, ec);
        return IoError("failed to move into place", canonical, rename_ec);
    }

    Poco::SHA2Engine256 sha256;
    sha256.update(content.data(), static_cast<unsigned int>(content.size()));

    StoredFile stored;
    stored.path = canonical;
    stored.size_bytes = static_cast<std::uint64_t>(content.size());
    stored.etag = Poco::DigestEngine::digestToHex(sha256.digest());
    return stored;
}

}  // namespace pathgate::storage
