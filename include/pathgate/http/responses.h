#pragma once

#include <string>

#include <boost/beast/http/status.hpp>

#include "pathgate/core/error.h"
#include "pathgate/http/router.h"

namespace pathgate::http {

HttpResponse JsonOk(int version, const std::string& body);
/// @brief Consistent error envelope: {"error":{"code","message","request_id"}}.
HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, boost::beast::http::status status);
/// @brief Error envelope for a core::Error, with status and code derived from its ErrorCode.
HttpResponse JsonError(int version, const core::Error& error, const std::string& request_id);

/// @brief HTTP status for a failed operation.
boost::beast::http::status StatusFor(core::ErrorCode code);

}  // namespace pathgate::http
