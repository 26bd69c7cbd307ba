#include "pathgate/http/responses.h"

#include <sstream>

#include <Poco/JSON/Object.h>

namespace pathgate::http {

HttpResponse JsonOk(int version, const std::string& body) {
    HttpResponse response{boost::beast::http::status::ok, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, boost::beast::http::status status) {
    // Messages echo caller-supplied paths, so they go through the JSON writer for escaping.
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object root;
    root.set("error", error);
    std::stringstream ss;
    root.stringify(ss);

    HttpResponse response{status, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = ss.str();
    response.prepare_payload();
    return response;
}

HttpResponse JsonError(int version, const core::Error& error, const std::string& request_id) {
    return JsonError(version, core::ErrorCodeName(error.code), error.message, request_id,
                     StatusFor(error.code));
}

boost::beast::http::status StatusFor(core::ErrorCode code) {
    using boost::beast::http::status;
    switch (code) {
        case core::ErrorCode::kOk:
            return status::ok;
        case core::ErrorCode::kInvalidArgument:
            return status::bad_request;
        case core::ErrorCode::kNotFound:
            return status::not_found;
        case core::ErrorCode::kAlreadyExists:
            return status::conflict;
        case core::ErrorCode::kPathTraversal:
        case core::ErrorCode::kPrefixViolation:
            return status::forbidden;
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kInternal:
            return status::internal_server_error;
    }
    return status::internal_server_error;
}

}  // namespace pathgate::http
