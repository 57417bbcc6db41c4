#include "fullsync/transfer/migration.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <map>
#include <set>

namespace fullsync::transfer {

SchemaConverter::SchemaConverter(std::vector<core::SchemaMigration> migrations)
    : migrations_(std::move(migrations)) {}

Result<std::vector<const core::SchemaMigration*>> SchemaConverter::plan(const std::string& from,
                                                                        const std::string& to) const {
    using Plan = std::vector<const core::SchemaMigration*>;
    if (from == to) {
        return Ok(Plan{});
    }

    // Breadth-first over revisions so the shortest chain wins.
    std::map<std::string, std::string> previous;
    std::set<std::string> visited{from};
    std::deque<std::string> frontier{from};
    while (!frontier.empty() && visited.count(to) == 0) {
        const auto current = frontier.front();
        frontier.pop_front();
        for (const auto& migration : migrations_) {
            if (migration.from_revision == current && visited.insert(migration.to_revision).second) {
                previous[migration.to_revision] = current;
                frontier.push_back(migration.to_revision);
            }
        }
    }
    if (visited.count(to) == 0) {
        return Err<Plan>(ErrorCode::Validation,
            "no schema migration path from revision '" + from + "' to '" + to + "'");
    }

    std::vector<std::pair<std::string, std::string>> steps;
    for (auto revision = to; revision != from; revision = previous.at(revision)) {
        steps.emplace_back(previous.at(revision), revision);
    }

    Plan result;
    for (auto step = steps.rbegin(); step != steps.rend(); ++step) {
        for (const auto& migration : migrations_) {
            if (migration.from_revision == step->first && migration.to_revision == step->second) {
                result.push_back(&migration);
            }
        }
    }
    return Ok(std::move(result));
}

bool SchemaConverter::apply(const std::vector<const core::SchemaMigration*>& plan, data::Record& record) {
    bool changed = false;
    for (const auto* migration : plan) {
        if (migration->entity_type != "*" && migration->entity_type != record.entity_type) {
            continue;
        }
        for (const auto& [old_name, new_name] : migration->rename_fields) {
            auto node = record.fields.extract(old_name);
            if (node.empty()) {
                continue;
            }
            node.key() = new_name;
            record.fields.insert_or_assign(node.key(), std::move(node.mapped()));
            changed = true;
        }
    }
    return changed;
}

Result<std::size_t> SchemaConverter::convert(data::RestoreTransaction& transaction,
                                             const std::string& from,
                                             const std::string& to) const {
    auto steps = plan(from, to);
    if (steps.is_error()) {
        return Err<std::size_t>(steps.error());
    }
    if (steps.value().empty()) {
        return Ok(std::size_t{0});
    }

    std::size_t changed = 0;
    transaction.transform([&](data::Record& record) {
        if (apply(steps.value(), record)) {
            ++changed;
        }
    });
    spdlog::debug("[Convert] {} -> {} migrations={} records_changed={}",
                  from, to, steps.value().size(), changed);
    return Ok(changed);
}

} // namespace fullsync::transfer
