#include "pathgate/tools/file_tools.h"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>

#include <Poco/Dynamic/Var.h>
#include <Poco/Exception.h>
#include <Poco/Glob.h>
#include <Poco/Types.h>

#include "pathgate/core/logger.h"
#include "pathgate/observability/metrics.h"

namespace pathgate::tools {

namespace {

core::Error MissingArgument(const std::string& key) {
    return core::Error{core::ErrorCode::kInvalidArgument, "missing required argument '" + key + "'"};
}

core::Error WrongType(const std::string& key, const std::string& type) {
    return core::Error{core::ErrorCode::kInvalidArgument,
                       "argument '" + key + "' must be a " + type};
}

core::Error OutOfRange(const std::string& key) {
    return core::Error{core::ErrorCode::kInvalidArgument, "argument '" + key + "' is out of range"};
}

core::Result<std::string> GetString(const Poco::JSON::Object::Ptr& args, const std::string& key,
                                    const std::optional<std::string>& fallback) {
    if (!args || !args->has(key) || args->isNull(key)) {
        if (fallback) {
            return *fallback;
        }
        return MissingArgument(key);
    }
    const auto value = args->get(key);
    if (!value.isString()) {
        return WrongType(key, "string");
    }
    return value.convert<std::string>();
}

core::Result<int> GetInt(const Poco::JSON::Object::Ptr& args, const std::string& key,
                         int fallback) {
    if (!args || !args->has(key) || args->isNull(key)) {
        return fallback;
    }
    const auto value = args->get(key);
    if (!value.isInteger()) {
        return WrongType(key, "integer");
    }
    Poco::Int64 wide = 0;
    try {
        wide = value.convert<Poco::Int64>();
    } catch (const Poco::RangeException&) {
        return OutOfRange(key);
    }
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return OutOfRange(key);
    }
    return static_cast<int>(wide);
}

core::Result<bool> GetBool(const Poco::JSON::Object::Ptr& args, const std::string& key,
                           bool fallback) {
    if (!args || !args->has(key) || args->isNull(key)) {
        return fallback;
    }
    const auto value = args->get(key);
    if (!value.isBoolean()) {
        return WrongType(key, "boolean");
    }
    return value.convert<bool>();
}

std::vector<std::string> SplitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::stringstream ss(content);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::string ReplaceAll(const std::string& input, const std::string& from, const std::string& to) {
    std::string out;
    std::size_t last = 0;
    for (auto pos = input.find(from); pos != std::string::npos;
         pos = input.find(from, last)) {
        out.append(input, last, pos - last);
        out += to;
        last = pos + from.size();
    }
    out.append(input, last, std::string::npos);
    return out;
}

std::string JoinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

// Glob patterns are matched against the path relative to the search directory, or against the
// full virtual path when the pattern itself is absolute.
bool MatchesGlob(Poco::Glob& glob, bool absolute_pattern, const std::string& base,
                 const std::string& file) {
    if (absolute_pattern) {
        return glob.match(file);
    }
    std::string prefix = storage::SandboxStorage::JoinVirtual(base, "");
    if (prefix.back() != '/') {
        prefix += '/';
    }
    if (file.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return glob.match(file.substr(prefix.size()));
}

core::Error InvalidPattern(const std::string& pattern, const Poco::Exception& ex) {
    return core::Error{core::ErrorCode::kInvalidArgument,
                       "invalid glob pattern '" + pattern + "': " + ex.displayText()};
}

}  // namespace

FileTools::FileTools(std::shared_ptr<storage::SandboxStorage> storage, core::ToolsConfig config)
    : storage_(std::move(storage)), config_(config) {}

const std::vector<std::string>& FileTools::ToolNames() {
    static const std::vector<std::string> names = {"ls",          "read_file", "write_file",
                                                   "edit_file",   "delete_file", "glob",
                                                   "grep"};
    return names;
}

core::Result<std::string> FileTools::Invoke(const std::string& tool,
                                            const Poco::JSON::Object::Ptr& args,
                                            const std::string& request_id) const {
    const auto path_key =
        (tool == "ls" || tool == "glob" || tool == "grep") ? "path" : "file_path";
    std::string logged_path;
    if (args && args->has(path_key) && args->get(path_key).isString()) {
        logged_path = args->getValue<std::string>(path_key);
    }

    auto result = [&]() -> core::Result<std::string> {
        if (tool == "ls") {
            auto path = GetString(args, "path", std::string("/"));
            if (!path.ok()) {
                return path.error();
            }
            return Ls(path.value());
        }
        if (tool == "read_file") {
            auto file_path = GetString(args, "file_path", std::nullopt);
            auto offset = GetInt(args, "offset", 0);
            auto limit = GetInt(args, "limit", config_.read_default_limit);
            if (!file_path.ok()) {
                return file_path.error();
            }
            if (!offset.ok()) {
                return offset.error();
            }
            if (!limit.ok()) {
                return limit.error();
            }
            return ReadFile(file_path.value(), offset.value(), limit.value());
        }
        if (tool == "write_file") {
            auto file_path = GetString(args, "file_path", std::nullopt);
            auto content = GetString(args, "content", std::nullopt);
            if (!file_path.ok()) {
                return file_path.error();
            }
            if (!content.ok()) {
                return content.error();
            }
            return WriteFile(file_path.value(), content.value());
        }
        if (tool == "edit_file") {
            auto file_path = GetString(args, "file_path", std::nullopt);
            auto old_string = GetString(args, "old_string", std::nullopt);
            auto new_string = GetString(args, "new_string", std::nullopt);
            auto replace_all = GetBool(args, "replace_all", false);
            if (!file_path.ok()) {
                return file_path.error();
            }
            if (!old_string.ok()) {
                return old_string.error();
            }
            if (!new_string.ok()) {
                return new_string.error();
            }
            if (!replace_all.ok()) {
                return replace_all.error();
            }
            return EditFile(file_path.value(), old_string.value(), new_string.value(),
                            replace_all.value());
        }
        if (tool == "delete_file") {
            auto file_path = GetString(args, "file_path", std::nullopt);
            if (!file_path.ok()) {
                return file_path.error();
            }
            return DeleteFile(file_path.value());
        }
        if (tool == "glob") {
            auto pattern = GetString(args, "pattern", std::nullopt);
            auto path = GetString(args, "path", std::string("/"));
            if (!pattern.ok()) {
                return pattern.error();
            }
            if (!path.ok()) {
                return path.error();
            }
            return Glob(pattern.value(), path.value());
        }
        if (tool == "grep") {
            auto pattern = GetString(args, "pattern", std::nullopt);
            auto path = GetString(args, "path", std::string("/"));
            auto glob = GetString(args, "glob", std::string());
            if (!pattern.ok()) {
                return pattern.error();
            }
            if (!path.ok()) {
                return path.error();
            }
            if (!glob.ok()) {
                return glob.error();
            }
            return Grep(pattern.value(), path.value(), glob.value());
        }
        return core::Error{core::ErrorCode::kNotFound, "unknown tool '" + tool + "'"};
    }();

    observability::RecordToolCall(result.code());
    core::LogToolCall(request_id, tool, logged_path,
                      result.ok() ? "ok" : core::ErrorCodeName(result.code()));
    return result;
}

core::Result<std::string> FileTools::Ls(const std::string& path) const {
    auto entries = storage_->List(path);
    if (!entries.ok()) {
        return entries.error();
    }
    std::vector<std::string> paths;
    paths.reserve(entries.value().size());
    for (const auto& entry : entries.value()) {
        paths.push_back(entry.path);
    }
    return JoinLines(paths);
}

core::Result<std::string> FileTools::ReadFile(const std::string& file_path, int offset,
                                              int limit) const {
    if (offset < 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "offset must not be negative"};
    }
    if (limit <= 0) {
        return core::Error{core::ErrorCode::kInvalidArgument, "limit must be positive"};
    }
    auto content = storage_->Read(file_path);
    if (!content.ok()) {
        return content.error();
    }
    if (content.value().empty()) {
        return std::string("System reminder: File exists but has empty contents");
    }

    const auto lines = SplitLines(content.value());
    if (static_cast<std::size_t>(offset) >= lines.size()) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "Line offset " + std::to_string(offset) + " exceeds file length (" +
                               std::to_string(lines.size()) + " lines)"};
    }

    const auto max_length = static_cast<std::size_t>(config_.max_line_length);
    const auto end = std::min(lines.size(), static_cast<std::size_t>(offset) +
                                                static_cast<std::size_t>(limit));
    std::ostringstream out;
    for (std::size_t i = static_cast<std::size_t>(offset); i < end; ++i) {
        if (i > static_cast<std::size_t>(offset)) {
            out << '\n';
        }
        out << std::setw(6) << (i + 1) << '\t' << lines[i].substr(0, max_length);
    }
    return out.str();
}

core::Result<std::string> FileTools::WriteFile(const std::string& file_path,
                                               const std::string& content) const {
    auto stored = storage_->Write(file_path, content);
    if (!stored.ok()) {
        return stored.error();
    }
    return "Updated file " + stored.value().path;
}

core::Result<std::string> FileTools::EditFile(const std::string& file_path,
                                              const std::string& old_string,
                                              const std::string& new_string,
                                              bool replace_all) const {
    if (old_string.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "old_string must not be empty"};
    }
    auto content = storage_->Read(file_path);
    if (!content.ok()) {
        return content.error();
    }

    const auto occurrences = CountOccurrences(content.value(), old_string);
    if (occurrences == 0) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "String not found in file: '" + old_string + "'"};
    }
    if (occurrences > 1 && !replace_all) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "String '" + old_string + "' appears " +
                               std::to_string(occurrences) +
                               " times in file. Use replace_all=true to replace all instances, "
                               "or provide a more specific string with surrounding context."};
    }

    auto stored = storage_->Replace(file_path, ReplaceAll(content.value(), old_string, new_string));
    if (!stored.ok()) {
        return stored.error();
    }
    return "Successfully replaced " + std::to_string(occurrences) +
           " instance(s) of the string in '" + stored.value().path + "'";
}

core::Result<std::string> FileTools::DeleteFile(const std::string& file_path) const {
    auto canonical = storage_->Resolve(file_path);
    if (!canonical.ok()) {
        return canonical.error();
    }
    auto deleted = storage_->Delete(canonical.value());
    if (!deleted.ok()) {
        return deleted.error();
    }
    return "Deleted file " + canonical.value();
}

core::Result<std::string> FileTools::Glob(const std::string& pattern,
                                          const std::string& path) const {
    if (pattern.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "pattern must not be empty"};
    }
    auto base = storage_->Resolve(path);
    if (!base.ok()) {
        return base.error();
    }
    auto files = storage_->Walk(base.value());
    if (!files.ok()) {
        return files.error();
    }

    const bool absolute_pattern = pattern.front() == '/';
    std::vector<std::string> matches;
    try {
        Poco::Glob glob(pattern);
        for (const auto& file : files.value()) {
            if (MatchesGlob(glob, absolute_pattern, base.value(), file)) {
                matches.push_back(file);
            }
        }
    } catch (const Poco::SyntaxException& ex) {
        return InvalidPattern(pattern, ex);
    }
    return JoinLines(matches);
}

core::Result<std::string> FileTools::Grep(const std::string& pattern, const std::string& path,
                                          const std::string& glob) const {
    if (pattern.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "pattern must not be empty"};
    }
    auto base = storage_->Resolve(path);
    if (!base.ok()) {
        return base.error();
    }
    auto files = storage_->Walk(base.value());
    if (!files.ok()) {
        return files.error();
    }

    std::optional<Poco::Glob> filter;
    try {
        if (!glob.empty()) {
            filter.emplace(glob);
        }
    } catch (const Poco::SyntaxException& ex) {
        return InvalidPattern(glob, ex);
    }
    std::vector<std::string> matches;
    for (const auto& file : files.value()) {
        try {
            if (filter && !MatchesGlob(*filter, glob.front() == '/', base.value(), file)) {
                continue;
            }
        } catch (const Poco::SyntaxException& ex) {
            return InvalidPattern(glob, ex);
        }
        auto content = storage_->Read(file);
        if (!content.ok()) {
            core::LogDebug("grep skipped " + file + ": " + content.error().message);
            continue;
        }
        const auto lines = SplitLines(content.value());
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (lines[i].find(pattern) != std::string::npos) {
                matches.push_back(file + ":" + std::to_string(i + 1) + ":" + lines[i]);
            }
        }
    }
    if (matches.empty()) {
        return "No matches found for pattern '" + pattern + "'";
    }
    return JoinLines(matches);
}

}  // namespace pathgate::tools
