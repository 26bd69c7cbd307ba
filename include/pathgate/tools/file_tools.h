#pragma once

#include <memory>
#include <string>
#include <vector>

#include <Poco/JSON/Object.h>

#include "pathgate/core/config.h"
#include "pathgate/core/result.h"
#include "pathgate/storage/sandbox_storage.h"

namespace pathgate::tools {

/// @brief Agent-facing file tools over a SandboxStorage.
///
/// Each tool takes its arguments as a JSON object and returns the text handed back to the
/// agent. Path arguments are untrusted and always go through the sandbox validator.
class FileTools {
public:
    FileTools(std::shared_ptr<storage::SandboxStorage> storage, core::ToolsConfig config);

    /// Dispatch by tool name ("ls", "read_file", "write_file", "edit_file", "delete_file",
    /// "glob", "grep").
    core::Result<std::string> Invoke(const std::string& tool, const Poco::JSON::Object::Ptr& args,
                                     const std::string& request_id = "") const;

    core::Result<std::string> Ls(const std::string& path) const;
    core::Result<std::string> ReadFile(const std::string& file_path, int offset, int limit) const;
    core::Result<std::string> WriteFile(const std::string& file_path,
                                        const std::string& content) const;
    core::Result<std::string> EditFile(const std::string& file_path, const std::string& old_string,
                                       const std::string& new_string, bool replace_all) const;
    core::Result<std::string> DeleteFile(const std::string& file_path) const;
    core::Result<std::string> Glob(const std::string& pattern, const std::string& path) const;
    core::Result<std::string> Grep(const std::string& pattern, const std::string& path,
                                   const std::string& glob) const;

    static const std::vector<std::string>& ToolNames();

private:
    std::shared_ptr<storage::SandboxStorage> storage_;
    core::ToolsConfig config_;
};

}  // namespace pathgate::tools
