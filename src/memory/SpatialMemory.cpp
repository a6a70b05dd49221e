/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "memory/SpatialMemory.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include "world/Address.hpp"
#include <algorithm>
#include <format>

namespace Smallville {

namespace {

[[noreturn]] void corrupt(const std::string& path, const std::string& reason) {
    MEMORY_ERROR("Spatial memory " + path + ": " + reason);
    throw CorruptSnapshot(path, reason);
}

template <typename Map>
std::vector<std::string> keysOf(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& entry : map) {
        keys.push_back(entry.first);
    }
    return keys;
}

} // anonymous namespace

SpatialMemory SpatialMemory::load(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        corrupt(path, reader.getLastError());
    }

    const JsonObject* worlds = reader.getRoot().tryAsObject();
    if (!worlds) {
        corrupt(path, "root is not a JSON object");
    }

    SpatialMemory memory;
    for (const auto& [world, sectorsValue] : *worlds) {
        const JsonObject* sectors = sectorsValue.tryAsObject();
        if (!sectors) {
            corrupt(path, std::format("world '{}' must map sectors", world));
        }
        auto& sectorMap = memory.m_tree[world];

        for (const auto& [sector, arenasValue] : *sectors) {
            const JsonObject* arenas = arenasValue.tryAsObject();
            if (!arenas) {
                corrupt(path, std::format("sector '{}:{}' must map arenas", world, sector));
            }
            auto& arenaMap = sectorMap[sector];

            for (const auto& [arena, objectsValue] : *arenas) {
                const JsonArray* objects = objectsValue.tryAsArray();
                if (!objects) {
                    corrupt(path, std::format("arena '{}:{}:{}' must list objects", world,
                                              sector, arena));
                }
                auto& objectList = arenaMap[arena];

                for (const JsonValue& object : *objects) {
                    const auto name = object.tryAsString();
                    if (!name) {
                        corrupt(path, std::format("arena '{}:{}:{}' lists a non-string object",
                                                  world, sector, arena));
                    }
                    if (std::find(objectList.begin(), objectList.end(), *name) == objectList.end()) {
                        objectList.push_back(*name);
                    }
                }
            }
        }
    }

    MEMORY_DEBUG("Loaded spatial memory from " + path);
    return memory;
}

bool SpatialMemory::save(const std::string& path) const {
    JsonObject worlds;
    for (const auto& [world, sectorMap] : m_tree) {
        JsonObject sectors;
        for (const auto& [sector, arenaMap] : sectorMap) {
            JsonObject arenas;
            for (const auto& [arena, objectList] : arenaMap) {
                JsonArray objects;
                objects.reserve(objectList.size());
                for (const auto& object : objectList) {
                    objects.emplace_back(object);
                }
                arenas.emplace(arena, JsonValue(std::move(objects)));
            }
            sectors.emplace(sector, JsonValue(std::move(arenas)));
        }
        worlds.emplace(world, JsonValue(std::move(sectors)));
    }

    if (!writeJsonFile(path, JsonValue(std::move(worlds)))) {
        MEMORY_ERROR("Failed to write spatial memory: " + path);
        return false;
    }

    MEMORY_DEBUG("Saved spatial memory: " + path);
    return true;
}

bool SpatialMemory::recordTile(const Tile& tile) {
    return record({tile.world, tile.sector, tile.arena, tile.gameObject});
}

bool SpatialMemory::recordAddress(const std::string& address) {
    return record(splitAddress(address));
}

bool SpatialMemory::record(const std::vector<std::string>& segments) {
    const size_t depth = std::min<size_t>(segments.size(), 4);
    bool learned = false;

    if (depth < 1 || segments[0].empty()) {
        return false;
    }
    auto [worldIt, newWorld] = m_tree.try_emplace(segments[0]);
    learned |= newWorld;

    if (depth < 2 || segments[1].empty()) {
        return learned;
    }
    auto [sectorIt, newSector] = worldIt->second.try_emplace(segments[1]);
    learned |= newSector;

    if (depth < 3 || segments[2].empty()) {
        return learned;
    }
    auto [arenaIt, newArena] = sectorIt->second.try_emplace(segments[2]);
    learned |= newArena;

    if (depth < 4 || segments[3].empty()) {
        return learned;
    }
    ObjectList& objectList = arenaIt->second;
    if (std::find(objectList.begin(), objectList.end(), segments[3]) == objectList.end()) {
        objectList.push_back(segments[3]);
        learned = true;
    }
    return learned;
}

std::vector<std::string> SpatialMemory::worlds() const {
    return keysOf(m_tree);
}

std::vector<std::string> SpatialMemory::sectors(const std::string& world) const {
    auto worldIt = m_tree.find(world);
    return (worldIt != m_tree.end()) ? keysOf(worldIt->second) : std::vector<std::string>{};
}

std::vector<std::string> SpatialMemory::arenas(const std::string& world,
                                               const std::string& sector) const {
    auto worldIt = m_tree.find(world);
    if (worldIt == m_tree.end()) {
        return {};
    }
    auto sectorIt = worldIt->second.find(sector);
    return (sectorIt != worldIt->second.end()) ? keysOf(sectorIt->second)
                                               : std::vector<std::string>{};
}

std::vector<std::string> SpatialMemory::objects(const std::string& world,
                                                const std::string& sector,
                                                const std::string& arena) const {
    auto worldIt = m_tree.find(world);
    if (worldIt == m_tree.end()) {
        return {};
    }
    auto sectorIt = worldIt->second.find(sector);
    if (sectorIt == worldIt->second.end()) {
        return {};
    }
    auto arenaIt = sectorIt->second.find(arena);
    return (arenaIt != sectorIt->second.end()) ? arenaIt->second : ObjectList{};
}

bool SpatialMemory::knows(const std::string& address) const {
    const auto segments = splitAddress(address);
    if (segments.empty() || segments.size() > 4 || segments[0].empty()) {
        return false;
    }

    auto worldIt = m_tree.find(segments[0]);
    if (worldIt == m_tree.end()) {
        return false;
    }
    if (segments.size() == 1) {
        return true;
    }

    auto sectorIt = worldIt->second.find(segments[1]);
    if (sectorIt == worldIt->second.end()) {
        return false;
    }
    if (segments.size() == 2) {
        return true;
    }

    auto arenaIt = sectorIt->second.find(segments[2]);
    if (arenaIt == sectorIt->second.end()) {
        return false;
    }
    if (segments.size() == 3) {
        return true;
    }

    const ObjectList& objectList = arenaIt->second;
    return std::find(objectList.begin(), objectList.end(), segments[3]) != objectList.end();
}

} // namespace Smallville
