#pragma once

#include <memory>

#include "pathgate/http/router.h"

namespace pathgate::storage {
class SandboxStorage;
}

namespace pathgate::tools {
class FileTools;
}

namespace pathgate::http {

/// Registers the server's HTTP routes into the provided router.
void RegisterDefaultRoutes(Router& router, std::shared_ptr<storage::SandboxStorage> storage,
                           std::shared_ptr<tools::FileTools> tools);

}  // namespace pathgate::http
