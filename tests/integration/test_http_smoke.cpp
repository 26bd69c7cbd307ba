#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Process.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

class ServerProcess {
public:
    explicit ServerProcess(Poco::ProcessHandle handle) : handle_(std::move(handle)) {}

    ~ServerProcess() {
        try {
            if (Poco::Process::isRunning(handle_)) {
                Poco::Process::kill(handle_);
                Poco::Process::wait(handle_);
            }
        } catch (const std::exception&) {
            // Best-effort shutdown; test cleanup should not throw.
        }
    }

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

private:
    Poco::ProcessHandle handle_;
};

unsigned short FindFreePort() {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, {tcp::v4(), 0});
    return acceptor.local_endpoint().port();
}

std::filesystem::path MakeTempDir() {
    const auto base = std::filesystem::temp_directory_path();
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
#ifdef _WIN32
    const auto pid = static_cast<long>(GetCurrentProcessId());
#else
    const auto pid = static_cast<long>(getpid());
#endif
    auto dir = base / ("pathgate_it_" + std::to_string(pid) + "_" + std::to_string(now));
    std::filesystem::create_directories(dir);
    return dir;
}

void CleanupTempDir(const std::filesystem::path& dir) {
    std::error_code ec;
    for (int i = 0; i < 5; ++i) {
        std::filesystem::remove_all(dir, ec);
        if (!ec) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

std::filesystem::path WriteServerConfig(const std::filesystem::path& dir, unsigned short port) {
    const auto sandbox_dir = dir / "sandbox";
    const auto config_path = dir / "server.json";
    std::ofstream out(config_path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": " << port << ",\n"
        << "    \"threads\": 1,\n"
        << "    \"limits\": {\n"
        << "      \"max_body_bytes\": 4096\n"
        << "    }\n"
        << "  },\n"
        << "  \"sandbox\": {\n"
        << "    \"root_path\": \"" << sandbox_dir.generic_string() << "\",\n"
        << "    \"platform\": \"posix\",\n"
        << "    \"allowed_prefixes\": [\"/data/\", \"/logs/\"]\n"
        << "  },\n"
        << "  \"observability\": {\n"
        << "    \"log_level\": \"warning\"\n"
        << "  }\n"
        << "}\n";
    return config_path;
}

http::response<http::string_body> SendRequest(http::verb method, const std::string& host,
                                              unsigned short port, const std::string& target,
                                              const std::string& body = "") {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    auto const results = resolver.resolve(host, std::to_string(port));
    stream.connect(results);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "pathgate-integration-tests");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
    }
    req.body() = body;
    req.prepare_payload();

    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

bool WaitForHealth(const std::string& host, unsigned short port) {
    for (int i = 0; i < 30; ++i) {
        try {
            auto res = SendRequest(http::verb::get, host, port, "/healthz");
            if (res.result() == http::status::ok) {
                return true;
            }
        } catch (const std::exception&) {
            // Server may not be ready yet.
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return false;
}

Poco::JSON::Object::Ptr ParseBody(const std::string& body) {
    Poco::JSON::Parser parser;
    return parser.parse(body).extract<Poco::JSON::Object::Ptr>();
}

std::string ErrorCodeOf(const http::response<http::string_body>& res) {
    return ParseBody(res.body())->getObject("error")->getValue<std::string>("code");
}

}  // namespace

TEST(IntegrationHttp, ValidateAndToolsSmoke) {
    const auto port = FindFreePort();
    const auto temp_dir = MakeTempDir();
    const auto config_path = WriteServerConfig(temp_dir, port);

    std::vector<std::string> args = {"--config", config_path.string()};
    auto handle = Poco::Process::launch(PATHGATE_SERVER_PATH, args);
    {
        ServerProcess server(std::move(handle));

        ASSERT_TRUE(WaitForHealth("127.0.0.1", port));

        auto ready = SendRequest(http::verb::get, "127.0.0.1", port, "/readyz");
        EXPECT_EQ(ready.result(), http::status::ok);
        EXPECT_FALSE(ready["X-Request-Id"].empty());

        auto canonical = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/paths/validate",
                                     R"({"path":"/data/./reports//../q3.csv"})");
        EXPECT_EQ(canonical.result(), http::status::ok);
        EXPECT_EQ(ParseBody(canonical.body())->getValue<std::string>("path"), "/data/q3.csv");

        auto traversal = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/paths/validate",
                                     R"({"path":"../etc/passwd"})");
        EXPECT_EQ(traversal.result(), http::status::forbidden);
        EXPECT_EQ(ErrorCodeOf(traversal), "PATH_TRAVERSAL");

        auto write = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/tools/write_file",
                                 R"({"file_path":"/data/notes.txt","content":"alpha\nbeta\n"})");
        EXPECT_EQ(write.result(), http::status::ok);
        EXPECT_TRUE(std::filesystem::exists(temp_dir / "sandbox" / "data" / "notes.txt"));

        auto read = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/tools/read_file",
                                R"({"file_path":"data/notes.txt","offset":1})");
        EXPECT_EQ(read.result(), http::status::ok);
        EXPECT_EQ(ParseBody(read.body())->getValue<std::string>("output"), "     2\tbeta");

        auto outside = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/tools/read_file",
                                   R"({"file_path":"/etc/passwd"})");
        EXPECT_EQ(outside.result(), http::status::forbidden);
        EXPECT_EQ(ErrorCodeOf(outside), "PATH_NOT_ALLOWED");

        auto missing_route = SendRequest(http::verb::get, "127.0.0.1", port, "/v1/unknown");
        EXPECT_EQ(missing_route.result(), http::status::not_found);

        auto wrong_method = SendRequest(http::verb::get, "127.0.0.1", port, "/v1/paths/validate");
        EXPECT_EQ(wrong_method.result(), http::status::method_not_allowed);

        const std::string oversized = R"({"path":")" + std::string(8192, 'a') + R"("})";
        auto too_large = SendRequest(http::verb::post, "127.0.0.1", port, "/v1/paths/validate",
                                     oversized);
        EXPECT_EQ(too_large.result(), http::status::payload_too_large);

        auto metrics = SendRequest(http::verb::get, "127.0.0.1", port, "/metrics");
        EXPECT_EQ(metrics.result(), http::status::ok);
        EXPECT_NE(metrics.body().find("pathgate_paths_traversal_rejected_total 1"),
                  std::string::npos);
        EXPECT_NE(metrics.body().find("pathgate_paths_accepted_total 1"), std::string::npos);
    }

    CleanupTempDir(temp_dir);
}
