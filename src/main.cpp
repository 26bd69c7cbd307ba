#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "pathgate/core/config.h"
#include "pathgate/core/logger.h"
#include "pathgate/http/http_server.h"
#include "pathgate/http/route_registration.h"
#include "pathgate/http/router.h"
#include "pathgate/sandbox/path_validator.h"
#include "pathgate/storage/sandbox_storage.h"
#include "pathgate/tools/file_tools.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");

    pathgate::core::Config config;
    try {
        config = pathgate::core::LoadConfig(config_path);
    } catch (const std::exception& ex) {
        std::cerr << "failed to load config " << config_path << ": " << ex.what() << std::endl;
        return 1;
    }
    pathgate::core::InitLogging(config.observability.log_level);

    auto platform = pathgate::sandbox::ParsePlatform(config.sandbox.platform);
    if (!platform.ok()) {
        pathgate::core::LogError(platform.error().message);
        return 1;
    }

    try {
        pathgate::sandbox::PathValidator validator(platform.value(),
                                                   config.sandbox.allowed_prefixes);
        auto storage =
            std::make_shared<pathgate::storage::SandboxStorage>(config.sandbox.root_path, validator);
        auto tools = std::make_shared<pathgate::tools::FileTools>(storage, config.tools);

        pathgate::http::Router router;
        pathgate::http::RegisterDefaultRoutes(router, storage, tools);

        boost::asio::io_context ioc(config.server.threads);
        pathgate::http::HttpServer server(ioc, config, std::move(router));
        server.Run();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc](const boost::system::error_code&, int) { ioc.stop(); });

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(config.server.threads));
        for (int i = 0; i < config.server.threads; ++i) {
            threads.emplace_back([&ioc]() { ioc.run(); });
        }
        for (auto& t : threads) {
            t.join();
        }
    } catch (const std::exception& ex) {
        pathgate::core::LogError(std::string("server failed: ") + ex.what());
        return 1;
    }

    pathgate::core::LogInfo("PathGate stopped");
    return 0;
}
