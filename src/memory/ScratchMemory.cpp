/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "memory/ScratchMemory.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <array>
#include <format>

namespace Smallville {

namespace {

constexpr std::array<const char*, 6> KNOWN_KEYS = {
    "name", "vision_r", "att_bandwidth", "retention", "curr_tile", "curr_time"};

bool isKnownKey(const std::string& key) {
    for (const char* known : KNOWN_KEYS) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

[[noreturn]] void corrupt(const std::string& path, const std::string& reason) {
    MEMORY_ERROR("Scratch memory " + path + ": " + reason);
    throw CorruptSnapshot(path, reason);
}

int readInt(const JsonValue& root, const char* key, int fallback, const std::string& path) {
    const JsonValue& value = root[key];
    if (value.isNull()) {
        return fallback;
    }
    const auto number = value.tryAsInt();
    if (!number) {
        corrupt(path, std::format("'{}' must be an integer", key));
    }
    return *number;
}

} // anonymous namespace

ScratchMemory ScratchMemory::load(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        corrupt(path, reader.getLastError());
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        corrupt(path, "root is not a JSON object");
    }

    const auto name = root["name"].tryAsString();
    if (!name) {
        corrupt(path, "'name' must be a string");
    }

    ScratchMemory scratch(*name);
    scratch.m_visionRadius = readInt(root, "vision_r", DEFAULT_VISION_RADIUS, path);
    scratch.m_attentionBandwidth =
        readInt(root, "att_bandwidth", DEFAULT_ATTENTION_BANDWIDTH, path);
    scratch.m_retention = readInt(root, "retention", DEFAULT_RETENTION, path);

    const JsonValue& tile = root["curr_tile"];
    if (!tile.isNull()) {
        const auto x = tile[size_t{0}].tryAsInt();
        const auto y = tile[size_t{1}].tryAsInt();
        if (!tile.isArray() || tile.size() != 2 || !x || !y) {
            corrupt(path, "'curr_tile' must be [x, y] or null");
        }
        scratch.m_state.currentTile = TileCoord{*x, *y};
    }

    const JsonValue& time = root["curr_time"];
    if (!time.isNull()) {
        const auto text = time.tryAsString();
        const auto parsed = text ? parseSimTime(*text) : std::nullopt;
        if (!parsed) {
            corrupt(path, "'curr_time' is not a valid timestamp");
        }
        scratch.m_state.currentTime = *parsed;
    }

    for (const auto& [key, value] : root.asObject()) {
        if (!isKnownKey(key)) {
            scratch.m_state.plannerState.emplace(key, value);
        }
    }

    MEMORY_DEBUG(std::format("Loaded scratch memory for '{}' from {}", scratch.m_name, path));
    return scratch;
}

bool ScratchMemory::save(const std::string& path) const {
    JsonObject root = m_state.plannerState;

    root["name"] = JsonValue(m_name);
    root["vision_r"] = JsonValue(m_visionRadius);
    root["att_bandwidth"] = JsonValue(m_attentionBandwidth);
    root["retention"] = JsonValue(m_retention);

    if (m_state.currentTile) {
        root["curr_tile"] = JsonValue(JsonArray{JsonValue(m_state.currentTile->x),
                                                JsonValue(m_state.currentTile->y)});
    } else {
        root["curr_tile"] = JsonValue();
    }

    root["curr_time"] = m_state.currentTime
                            ? JsonValue(formatSimTime(*m_state.currentTime))
                            : JsonValue();

    if (!writeJsonFile(path, JsonValue(std::move(root)))) {
        MEMORY_ERROR("Failed to write scratch memory: " + path);
        return false;
    }

    MEMORY_DEBUG("Saved scratch memory: " + path);
    return true;
}

} // namespace Smallville
