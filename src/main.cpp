#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <Poco/Exception.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "filelink/core/config.h"
#include "filelink/core/logger.h"
#include "filelink/http/http_server.h"
#include "filelink/http/route_registration.h"
#include "filelink/http/router.h"
#include "filelink/registry/sqlite_object_registry.h"
#include "filelink/source/chunk_source.h"

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
    const std::string db_path = GetArgValue(argc, argv, "--database", "config/database.json");

    filelink::core::Config config;
    std::string sqlite_path;
    try {
        config = filelink::core::LoadConfig(config_path);
        sqlite_path = filelink::core::LoadDatabasePath(db_path);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "invalid configuration: " << ex.what() << std::endl;
        return 1;
    } catch (const Poco::Exception& ex) {
        std::cerr << "failed to load configuration: " << ex.displayText() << std::endl;
        return 1;
    }
    if (!config.observability.log_file.empty()) {
        const auto log_dir = std::filesystem::path(config.observability.log_file).parent_path();
        std::error_code ec;
        if (!log_dir.empty()) {
            std::filesystem::create_directories(log_dir, ec);
        }
        if (ec) {
            std::cerr << "cannot create log directory " << log_dir.string() << ": "
                      << ec.message() << std::endl;
            return 1;
        }
    }
    filelink::core::InitLogging(config.observability.log_level,
                                config.observability.log_file);

    std::shared_ptr<filelink::registry::SqliteObjectRegistry> registry;
    std::shared_ptr<filelink::source::ChunkSource> source;
    try {
        const auto parent = std::filesystem::path(sqlite_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        registry = std::make_shared<filelink::registry::SqliteObjectRegistry>(sqlite_path);
        source = filelink::source::MakeChunkSource(config.backend);
    } catch (const std::exception& ex) {
        filelink::core::LogError(std::string("startup failed: ") + ex.what());
        return 1;
    }

    filelink::http::Router router;
    filelink::http::RegisterDefaultRoutes(router, registry, config);

    boost::asio::io_context ioc(config.server.threads);
    filelink::http::HttpServer server(ioc, config, std::move(router), registry, source);
    auto started = server.Run();
    if (!started.ok()) {
        filelink::core::LogError(started.error().message);
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int) {
        filelink::core::LogInfo("shutting down");
        ioc.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
