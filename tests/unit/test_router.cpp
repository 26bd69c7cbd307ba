#include <filesystem>
#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/UUIDGenerator.h>

#include "pathgate/http/route_registration.h"
#include "pathgate/http/router.h"
#include "pathgate/storage/sandbox_storage.h"
#include "pathgate/tools/file_tools.h"

namespace {

namespace http = boost::beast::http;
using pathgate::http::HttpRequest;
using pathgate::http::HttpResponse;
using pathgate::http::RequestContext;
using pathgate::http::RouteParams;
using pathgate::http::Router;

HttpRequest MakeRequest(http::verb method, const std::string& target, const std::string& body) {
    HttpRequest request{method, target, 11};
    request.body() = body;
    request.prepare_payload();
    return request;
}

Poco::JSON::Object::Ptr ParseBody(const HttpResponse& response) {
    Poco::JSON::Parser parser;
    return parser.parse(response.body()).extract<Poco::JSON::Object::Ptr>();
}

class RoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("pathgate_routes_" + Poco::UUIDGenerator().createOne().toString());
        auto storage = std::make_shared<pathgate::storage::SandboxStorage>(
            root_.string(),
            pathgate::sandbox::PathValidator(pathgate::sandbox::Platform::kWindows,
                                             {"/data/", "C:/data/"}));
        auto tools =
            std::make_shared<pathgate::tools::FileTools>(storage, pathgate::core::ToolsConfig{});
        pathgate::http::RegisterDefaultRoutes(router_, storage, tools);
        ctx_.request_id = "req-1";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    HttpResponse Call(http::verb method, const std::string& target,
                      const std::string& body = "") {
        auto result = router_.Route(ctx_, MakeRequest(method, target, body));
        EXPECT_TRUE(result.ok());
        return result.ok() ? result.value() : HttpResponse{};
    }

    std::filesystem::path root_;
    Router router_;
    RequestContext ctx_;
};

}  // namespace

TEST(RouterMatch, ExtractsParams) {
    RouteParams params;
    EXPECT_TRUE(Router::Match("/v1/tools/{tool}", "/v1/tools/read_file", &params));
    EXPECT_EQ(params.at("tool"), "read_file");
    EXPECT_TRUE(Router::Match("/healthz", "/healthz/", nullptr));
    EXPECT_FALSE(Router::Match("/v1/tools/{tool}", "/v1/tools", nullptr));
    EXPECT_FALSE(Router::Match("/v1/tools/{tool}", "/v1/paths/validate", nullptr));
}

TEST(RouterDispatch, UnknownPathAndWrongMethod) {
    Router router;
    router.Add("GET", "/healthz",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   return HttpResponse{http::status::ok, req.version()};
               });
    RequestContext ctx;
    ctx.request_id = "r";

    auto missing = router.Route(ctx, MakeRequest(http::verb::get, "/nope", ""));
    ASSERT_TRUE(missing.ok());
    EXPECT_EQ(missing.value().result(), http::status::not_found);

    auto wrong = router.Route(ctx, MakeRequest(http::verb::post, "/healthz?x=1", ""));
    ASSERT_TRUE(wrong.ok());
    EXPECT_EQ(wrong.value().result(), http::status::method_not_allowed);

    auto ok = router.Route(ctx, MakeRequest(http::verb::get, "/healthz?x=1", ""));
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value().result(), http::status::ok);
}

TEST_F(RoutesTest, ValidateReturnsCanonicalPath) {
    auto response = Call(http::verb::post, "/v1/paths/validate",
                         R"({"path": "C:\\data\\reports\\..\\q3.csv"})");
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(ParseBody(response)->getValue<std::string>("path"), "C:/data/q3.csv");
}

TEST_F(RoutesTest, ValidateMapsViolationsToForbidden) {
    auto traversal = Call(http::verb::post, "/v1/paths/validate", R"({"path": "../secret"})");
    EXPECT_EQ(traversal.result(), http::status::forbidden);
    auto error = ParseBody(traversal)->getObject("error");
    EXPECT_EQ(error->getValue<std::string>("code"), "PATH_TRAVERSAL");
    EXPECT_EQ(error->getValue<std::string>("message"), "Path traversal not allowed: ../secret");
    EXPECT_EQ(error->getValue<std::string>("request_id"), "req-1");

    auto prefix = Call(http::verb::post, "/v1/paths/validate", R"({"path": "/etc/passwd"})");
    EXPECT_EQ(prefix.result(), http::status::forbidden);
    EXPECT_EQ(ParseBody(prefix)->getObject("error")->getValue<std::string>("code"),
              "PATH_NOT_ALLOWED");
}

TEST_F(RoutesTest, ValidateRejectsBadBodies) {
    EXPECT_EQ(Call(http::verb::post, "/v1/paths/validate", "not json").result(),
              http::status::bad_request);
    EXPECT_EQ(Call(http::verb::post, "/v1/paths/validate", "[1,2]").result(),
              http::status::bad_request);
    EXPECT_EQ(Call(http::verb::post, "/v1/paths/validate", R"({"path": 1})").result(),
              http::status::bad_request);
}

TEST_F(RoutesTest, ToolInvocation) {
    auto write = Call(http::verb::post, "/v1/tools/write_file",
                      R"({"file_path": "/data/a.txt", "content": "hi \"there\""})");
    EXPECT_EQ(write.result(), http::status::ok);
    auto body = ParseBody(write);
    EXPECT_EQ(body->getValue<std::string>("tool"), "write_file");
    EXPECT_EQ(body->getValue<std::string>("output"), "Updated file /data/a.txt");

    auto read = Call(http::verb::post, "/v1/tools/read_file", R"({"file_path": "/data/a.txt"})");
    EXPECT_EQ(ParseBody(read)->getValue<std::string>("output"), "     1\thi \"there\"");

    auto exists = Call(http::verb::post, "/v1/tools/write_file",
                       R"({"file_path": "/data/a.txt", "content": "again"})");
    EXPECT_EQ(exists.result(), http::status::conflict);

    auto unknown = Call(http::verb::post, "/v1/tools/format_disk", "{}");
    EXPECT_EQ(unknown.result(), http::status::not_found);
}

TEST_F(RoutesTest, OversizedIntegerArgumentIsBadRequest) {
    auto response = Call(http::verb::post, "/v1/tools/read_file",
                         R"({"file_path": "/data/a.txt", "offset": 99999999999})");
    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(ParseBody(response)->getObject("error")->getValue<std::string>("code"),
              "INVALID_ARGUMENT");
}

TEST_F(RoutesTest, ListsToolsAndServesMetrics) {
    auto listed = Call(http::verb::get, "/v1/tools");
    EXPECT_EQ(listed.result(), http::status::ok);
    EXPECT_EQ(ParseBody(listed)->getArray("tools")->size(),
              pathgate::tools::FileTools::ToolNames().size());

    (void)Call(http::verb::post, "/v1/paths/validate", R"({"path": "~/x"})");
    auto metrics = Call(http::verb::get, "/metrics");
    EXPECT_EQ(metrics.result(), http::status::ok);
    EXPECT_NE(metrics.body().find("pathgate_paths_traversal_rejected_total"), std::string::npos);
}

TEST_F(RoutesTest, HealthAndReadiness) {
    EXPECT_EQ(Call(http::verb::get, "/healthz").result(), http::status::ok);
    EXPECT_EQ(Call(http::verb::get, "/readyz").result(), http::status::ok);
}

TEST_F(RoutesTest, HealthReportsServerTime) {
    auto body = ParseBody(Call(http::verb::get, "/healthz"));
    EXPECT_EQ(body->getValue<std::string>("status"), "ok");
    EXPECT_FALSE(body->getValue<std::string>("time").empty());
    EXPECT_EQ(body->getValue<std::string>("request_id"), "req-1");
}
