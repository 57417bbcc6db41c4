/**
 * @file full_sync_demo.cpp
 * @brief End-to-end walkthrough without a network
 *
 * Seeds 100 products on the local instance, pushes them to an empty remote
 * with the bulk method, then pulls a changed product back incrementally.
 * Prints the session state and reconciliation summary of each run.
 *
 * USAGE:
 *   ./full_sync_demo [--products N]
 */

#include "fullsync/core/config.hpp"
#include "fullsync/data/database.hpp"
#include "fullsync/events/components.hpp"
#include "fullsync/events/event_bus.hpp"
#include "fullsync/registry/serialization.hpp"
#include "fullsync/registry/session_store.hpp"
#include "fullsync/session/manager.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <string>

using namespace fullsync;

namespace {

core::SyncConfig demo_config() {
    core::SyncConfig config;
    config.entities = {
        {"business", {}},
        {"category", {{"business_id", "business"}}},
        {"product", {{"business_id", "business"}, {"category_id", "category"}}},
    };
    config.expected_differences.push_back({"*", "updated_at", core::Presence::Both, true, "timestamp_rewritten_on_restore"});
    config.transfer.chunk_size = 4096;
    config.transfer.batch_size = 25;
    config.session.persist_interval = std::chrono::milliseconds(50);
    return config;
}

void seed(data::InMemoryDatabase& db, std::size_t products) {
    db.dataset().upsert(data::Record{"business", "b-1", {{"name", "Corner Shop"}}});
    db.dataset().upsert(data::Record{"category", "c-1", {{"business_id", "b-1"}, {"name", "Drinks"}}});
    for (std::size_t i = 1; i <= products; ++i) {
        db.dataset().upsert(data::Record{"product", "p-" + std::to_string(1000 + i), {
            {"business_id", "b-1"},
            {"category_id", "c-1"},
            {"name", "Product " + std::to_string(i)},
            {"price", std::to_string(100 + i)},
            {"updated_at", "2024-01-01T00:00:00Z"}
        }});
    }
}

bool run_and_print(session::SyncManager& manager, Direction direction, Method method) {
    auto started = manager.start_sync(direction, method);
    if (started.is_error()) {
        spdlog::error("start {} {} failed: {}", to_string(method), to_string(direction),
                      started.error().describe());
        return false;
    }

    auto finished = manager.wait(started.value(), std::chrono::seconds(30));
    if (finished.is_error()) {
        spdlog::error("status of {} unavailable: {}", started.value(), finished.error().describe());
        return false;
    }
    const auto& info = finished.value();
    std::cout << registry::session_to_json(info).dump(2) << "\n";

    if (info.reconciliation_report_id.empty()) {
        return info.phase == session::Phase::Completed;
    }
    auto report = manager.report(info.reconciliation_report_id);
    if (report.is_error()) {
        spdlog::error("report {} unavailable: {}", info.reconciliation_report_id, report.error().describe());
        return false;
    }
    std::cout << registry::report_to_json(report.value(), false).dump(2) << "\n";
    return info.phase == session::Phase::Completed;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::size_t products = 100;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--products" && i + 1 < argc) {
            products = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
    }

    // A supplied file must still declare business, category and product.
    core::SyncConfig config = demo_config();
    if (!config_path.empty()) {
        auto loaded = core::load_config(config_path);
        if (loaded.is_error()) {
            spdlog::error("Failed to load config: {}", loaded.error().describe());
            return 1;
        }
        config = std::move(loaded.value());
    }
    auto valid = core::validate_config(config);
    if (valid.is_error()) {
        spdlog::error("demo config rejected: {}", valid.error().describe());
        return 1;
    }

    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    events::MetricsComponent metrics(event_bus);

    data::InMemoryDatabase local("local");
    data::InMemoryDatabase remote("remote");
    seed(local, products);

    registry::InMemorySessionStore store;
    session::SyncManager manager(config, local, remote, store, event_bus);

    std::cout << "\n=== push / bulk: " << products << " products ===\n";
    bool ok = run_and_print(manager, Direction::Push, Method::Bulk);

    // A price change on the remote side travels back incrementally.
    remote.dataset().upsert(data::Record{"product", "p-1001", {
        {"business_id", "b-1"},
        {"category_id", "c-1"},
        {"name", "Product 1"},
        {"price", "999"},
        {"updated_at", "2024-02-01T00:00:00Z"}
    }});

    std::cout << "\n=== pull / incremental ===\n";
    ok = run_and_print(manager, Direction::Pull, Method::Incremental) && ok;

    manager.shutdown();
    metrics.print_stats();
    return ok ? 0 : 1;
}
