#include "pathgate/http/route_registration.h"

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <typeinfo>

#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "pathgate/core/time.h"
#include "pathgate/http/responses.h"
#include "pathgate/observability/metrics.h"
#include "pathgate/storage/sandbox_storage.h"
#include "pathgate/tools/file_tools.h"

namespace pathgate::http {
namespace {

std::string Stringify(const Poco::JSON::Object& object) {
    std::stringstream ss;
    object.stringify(ss);
    return ss.str();
}

// An empty body means "no arguments"; anything else must be a JSON object.
core::Result<Poco::JSON::Object::Ptr> ParseArguments(const std::string& body) {
    if (body.empty()) {
        return Poco::JSON::Object::Ptr(new Poco::JSON::Object());
    }
    try {
        Poco::JSON::Parser parser;
        auto result = parser.parse(body);
        if (result.type() != typeid(Poco::JSON::Object::Ptr)) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "request body must be a JSON object"};
        }
        return result.extract<Poco::JSON::Object::Ptr>();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument, ex.displayText()};
    }
}

}  // namespace

void RegisterDefaultRoutes(Router& router, std::shared_ptr<storage::SandboxStorage> storage,
                           std::shared_ptr<tools::FileTools> tools) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(), "{\"status\":\"ok\",\"time\":\"" +
                                                    core::NowIso8601() + "\",\"request_id\":\"" +
                                                    ctx.request_id + "\"}");
               });

    router.Add("GET", "/readyz",
               [storage](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   std::error_code ec;
                   if (!std::filesystem::is_directory(storage->root_path(), ec)) {
                       return JsonError(req.version(), "NOT_READY",
                                        "sandbox root is not a directory: " + storage->root_path(),
                                        ctx.request_id,
                                        boost::beast::http::status::service_unavailable);
                   }
                   return JsonOk(req.version(),
                                 "{\"status\":\"ready\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("GET", "/v1/tools",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
                   for (const auto& name : tools::FileTools::ToolNames()) {
                       arr->add(name);
                   }
                   Poco::JSON::Object root;
                   root.set("tools", arr);
                   return JsonOk(req.version(), Stringify(root));
               });

    router.Add("POST", "/v1/paths/validate",
               [storage](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   auto args = ParseArguments(req.body());
                   if (!args.ok()) {
                       return JsonError(req.version(), "INVALID_JSON", args.error().message,
                                        ctx.request_id, boost::beast::http::status::bad_request);
                   }
                   const auto value = args.value()->get("path");
                   if (!value.isString()) {
                       return JsonError(req.version(), "INVALID_ARGUMENT",
                                        "'path' must be a string", ctx.request_id,
                                        boost::beast::http::status::bad_request);
                   }
                   auto canonical = storage->Resolve(value.convert<std::string>());
                   observability::RecordPathDecision(canonical.code());
                   if (!canonical.ok()) {
                       return JsonError(req.version(), canonical.error(), ctx.request_id);
                   }
                   Poco::JSON::Object root;
                   root.set("path", canonical.value());
                   return JsonOk(req.version(), Stringify(root));
               });

    router.Add("POST", "/v1/tools/{tool}",
               [tools](const RequestContext& ctx, const HttpRequest& req,
                       const RouteParams& params) {
                   const auto tool = params.at("tool");
                   auto args = ParseArguments(req.body());
                   if (!args.ok()) {
                       return JsonError(req.version(), "INVALID_JSON", args.error().message,
                                        ctx.request_id, boost::beast::http::status::bad_request);
                   }
                   auto output = tools->Invoke(tool, args.value(), ctx.request_id);
                   if (!output.ok()) {
                       return JsonError(req.version(), output.error(), ctx.request_id);
                   }
                   Poco::JSON::Object root;
                   root.set("tool", tool);
                   root.set("output", output.value());
                   return JsonOk(req.version(), Stringify(root));
               });
}

}  // namespace pathgate::http
