#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iterator>
#include <unordered_map>

namespace {

using Attrs = std::unordered_map<std::string, std::string>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;

} // namespace

RedisBus::RedisBus(const std::string& redis_url) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {}", redis_url);
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on {}", group, stream);
    } catch (const sw::redis::ReplyError& e) {
        // BUSYGROUP: already exists
        spdlog::debug("Consumer group {} on {}: {}", group, stream, e.what());
    }
}

std::vector<std::pair<std::string, nlohmann::json>>
RedisBus::read_triggers(const std::string& stream, const std::string& group,
                        const std::string& consumer, int count, int block_ms) {
    std::vector<std::pair<std::string, nlohmann::json>> results;

    std::unordered_map<std::string, ItemStream> items;
    redis_->xreadgroup(group, consumer, stream, ">", count,
                       std::chrono::milliseconds(block_ms),
                       std::inserter(items, items.end()));

    for (const auto& [_, item_stream] : items) {
        for (const auto& item : item_stream) {
            if (!item.second) {
                results.emplace_back(item.first, nullptr);
                continue;
            }
            auto it = item.second->find("data");
            if (it == item.second->end()) {
                spdlog::warn("Trigger {} has no data field", item.first);
                results.emplace_back(item.first, nullptr);
                continue;
            }
            try {
                results.emplace_back(item.first, nlohmann::json::parse(it->second));
            } catch (const nlohmann::json::parse_error& e) {
                spdlog::warn("Trigger {} is not valid JSON: {}", item.first, e.what());
                results.emplace_back(item.first, nullptr);
            }
        }
    }

    return results;
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    redis_->xack(stream, group, msg_id);
}

void RedisBus::publish_result(const std::string& stream, const nlohmann::json& data) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = data.dump();
    redis_->xadd(stream, "*", fields.begin(), fields.end());
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
