/**
 * @file full_sync_server.cpp
 * @brief Full-sync trigger server over two in-memory instances
 *
 * USAGE:
 *   ./full_sync_server [--config fullsync.json] [--port 8080]
 *                      [--registry DIR] [--seed N]
 *
 * --registry keeps sessions, reports and leases as JSON files under DIR so
 * a restarted server can resume orphaned sessions. Without it the registry
 * lives in memory. --seed fills the local instance with N demo products.
 *
 * TRY IT:
 *   curl -X POST localhost:8080/api/sync -d '{"direction":"push","method":"bulk"}'
 *   curl localhost:8080/api/sync/<sessionId>
 *   curl localhost:8080/api/reports/<reportId>
 */

#include "fullsync/api/sync_api.hpp"
#include "fullsync/core/config.hpp"
#include "fullsync/data/database.hpp"
#include "fullsync/events/components.hpp"
#include "fullsync/events/event_bus.hpp"
#include "fullsync/events/events.hpp"
#include "fullsync/net/http_router.hpp"
#include "fullsync/net/http_server.hpp"
#include "fullsync/registry/session_store.hpp"
#include "fullsync/session/manager.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace fullsync;
namespace fs = std::filesystem;

namespace {

void seed_products(data::InMemoryDatabase& db, std::size_t count) {
    db.dataset().upsert(data::Record{"business", "b-1", {{"name", "Corner Shop"}}});
    db.dataset().upsert(data::Record{"category", "c-1", {{"business_id", "b-1"}, {"name", "Drinks"}}});
    for (std::size_t i = 1; i <= count; ++i) {
        const auto id = "p-" + std::to_string(1000 + i);
        db.dataset().upsert(data::Record{"product", id, {
            {"business_id", "b-1"},
            {"category_id", "c-1"},
            {"name", "Product " + std::to_string(i)},
            {"price", std::to_string(100 + i)}
        }});
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program
              << " [--config FILE] [--port PORT] [--registry DIR] [--seed N]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path config_path = "config/fullsync.json";
    uint16_t port = 8080;
    fs::path registry_root;
    std::size_t seed = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if ((arg == "-r" || arg == "--registry") && i + 1 < argc) {
            registry_root = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config = core::load_config(config_path);
    if (config.is_error()) {
        spdlog::error("Failed to load config: {}", config.error().describe());
        return 1;
    }

    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    events::MetricsComponent metrics(event_bus);

    data::InMemoryDatabase local("local", config.value().schema_revision);
    data::InMemoryDatabase remote("remote", config.value().schema_revision);
    seed_products(local, seed);

    std::unique_ptr<registry::SessionStore> store;
    if (registry_root.empty()) {
        store = std::make_unique<registry::InMemorySessionStore>();
    } else {
        store = std::make_unique<registry::JsonFileSessionStore>(registry_root);
    }

    session::SyncManager manager(config.value(), local, remote, *store, event_bus);
    api::SyncApi sync_api(manager, config.value());

    net::HttpRouter router;
    sync_api.register_routes(router);
    router.get("/health", [](const net::HttpContext&) {
        net::HttpResponse response(net::HttpStatus::OK);
        response.set_json({{"status", "ok"}});
        return response;
    });

    boost::asio::io_context io_context;
    net::HttpServer server(io_context, port);
    server.set_handler([&router](const net::HttpRequest& request) {
        return router.handle_request(request);
    });
    event_bus.emit(events::ServerStartedEvent{server.get_port()});

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        event_bus.emit(events::ServerShuttingDownEvent{signal_number == SIGINT ? "SIGINT" : "SIGTERM"});
        server.stop();
        io_context.stop();
    });

    io_context.run();

    manager.shutdown();
    metrics.print_stats();
    return 0;
}
