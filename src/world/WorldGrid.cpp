/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/WorldGrid.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace Smallville {

namespace {

const std::string& resolveCode(const CodeNameTable& table, const std::string& code) {
    static const std::string EMPTY_NAME;
    auto it = table.find(code);
    return (it != table.end()) ? it->second : EMPTY_NAME;
}

bool isBlockedCode(const std::string& code) {
    return !code.empty() && code != "0";
}

// Saturates at the int range; NaN lands on INT_MIN, which no grid contains
int pixelToTileIndex(float pixel, double tileSize) {
    const double index = std::ceil(static_cast<double>(pixel) / tileSize);
    if (std::isnan(index) || index <= static_cast<double>(std::numeric_limits<int>::min())) {
        return std::numeric_limits<int>::min();
    }
    if (index >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(index);
}

} // anonymous namespace

WorldGrid::WorldGrid(const WorldGridConfig& config)
    : m_width(config.width),
      m_height(config.height),
      m_tileSize(config.tileSize),
      m_worldName(config.worldName),
      m_specialConstraint(config.specialConstraint) {
    validateConfig(config);

    m_grid.resize(static_cast<size_t>(m_height));
    for (int y = 0; y < m_height; ++y) {
        auto& row = m_grid[static_cast<size_t>(y)];
        row.reserve(static_cast<size_t>(m_width));

        for (int x = 0; x < m_width; ++x) {
            const size_t idx = static_cast<size_t>(y) * static_cast<size_t>(m_width) +
                               static_cast<size_t>(x);

            Tile tile;
            tile.world = m_worldName;
            tile.sector = resolveCode(config.sectorNames, config.sectorLayer[idx]);
            tile.arena = resolveCode(config.arenaNames, config.arenaLayer[idx]);
            tile.gameObject = resolveCode(config.gameObjectNames, config.gameObjectLayer[idx]);
            tile.spawningLocation =
                resolveCode(config.spawningLocationNames, config.spawningLocationLayer[idx]);
            tile.collision = isBlockedCode(config.collisionLayer[idx]);

            // Every game object starts out idle
            if (!tile.gameObject.empty()) {
                tile.events.insert(TileEvent::idle(joinAddress(
                    {tile.world, tile.sector, tile.arena, tile.gameObject})));
            }

            indexTile(tile, TileCoord{x, y});
            row.push_back(std::move(tile));
        }
    }

    WORLD_GRID_INFO(std::format("Built world '{}' ({}x{} tiles, {}px tiles, {} indexed addresses)",
                                m_worldName, m_width, m_height, m_tileSize,
                                m_addressTiles.size()));
}

void WorldGrid::validateConfig(const WorldGridConfig& config) const {
    if (config.width <= 0 || config.height <= 0) {
        const std::string message = std::format(
            "Grid dimensions must be positive, got {}x{}", config.width, config.height);
        WORLD_GRID_ERROR(message);
        throw ConfigError(message);
    }
    if (config.tileSize <= 0) {
        const std::string message =
            std::format("Tile size must be positive, got {}", config.tileSize);
        WORLD_GRID_ERROR(message);
        throw ConfigError(message);
    }

    const size_t expected = static_cast<size_t>(config.width) * static_cast<size_t>(config.height);
    const std::pair<const char*, const std::vector<std::string>*> layers[] = {
        {"collision", &config.collisionLayer},
        {"sector", &config.sectorLayer},
        {"arena", &config.arenaLayer},
        {"game_object", &config.gameObjectLayer},
        {"spawning_location", &config.spawningLocationLayer},
    };

    for (const auto& [name, layer] : layers) {
        if (layer->size() != expected) {
            const std::string message = std::format(
                "Layer '{}' has {} cells, expected {} ({}x{})", name, layer->size(),
                expected, config.width, config.height);
            WORLD_GRID_ERROR(message);
            throw ConfigError(message);
        }
    }
}

void WorldGrid::indexTile(const Tile& tile, TileCoord coord) {
    // Tiles arrive in row-major order, so each insert lands at the back
    auto index = [this, coord](std::string key) {
        auto& tiles = m_addressTiles[std::move(key)];
        tiles.insert(tiles.end(), coord);
    };

    if (!tile.sector.empty()) {
        index(joinAddress({tile.world, tile.sector}));
    }
    if (!tile.arena.empty()) {
        index(joinAddress({tile.world, tile.sector, tile.arena}));
    }
    if (!tile.gameObject.empty()) {
        index(joinAddress({tile.world, tile.sector, tile.arena, tile.gameObject}));
    }
    if (!tile.spawningLocation.empty()) {
        index(spawnLocationKey(tile.spawningLocation));
    }
}

TileCoord WorldGrid::coordinateToTile(PixelCoord pixel) const {
    const double size = static_cast<double>(m_tileSize);
    return TileCoord{pixelToTileIndex(pixel.x, size), pixelToTileIndex(pixel.y, size)};
}

void WorldGrid::checkBounds(TileCoord coord) const {
    if (!isValidPosition(coord)) {
        throw OutOfBounds(coord.x, coord.y, m_width, m_height);
    }
}

const Tile& WorldGrid::accessTile(TileCoord coord) const {
    checkBounds(coord);
    return m_grid[static_cast<size_t>(coord.y)][static_cast<size_t>(coord.x)];
}

Tile& WorldGrid::mutableTile(TileCoord coord) {
    checkBounds(coord);
    return m_grid[static_cast<size_t>(coord.y)][static_cast<size_t>(coord.x)];
}

std::string WorldGrid::addressOf(TileCoord coord, AddressLevel level) const {
    const Tile& tile = accessTile(coord);

    switch (level) {
        case AddressLevel::World:
            return tile.world;
        case AddressLevel::Sector:
            return joinAddress({tile.world, tile.sector});
        case AddressLevel::Arena:
            return joinAddress({tile.world, tile.sector, tile.arena});
        case AddressLevel::Object:
            return joinAddress({tile.world, tile.sector, tile.arena, tile.gameObject});
    }
    throw std::invalid_argument(
        std::format("Unknown address level {}", static_cast<int>(level)));
}

std::vector<TileCoord> WorldGrid::tilesNear(TileCoord center, int radius) const {
    std::vector<TileCoord> tiles;
    if (radius < 0) {
        return tiles;
    }

    // 64-bit bounds so huge radii cannot overflow
    const long long xMin = std::max(0LL, static_cast<long long>(center.x) - radius);
    const long long xMax = std::min(static_cast<long long>(m_width) - 1,
                                    static_cast<long long>(center.x) + radius);
    const long long yMin = std::max(0LL, static_cast<long long>(center.y) - radius);
    const long long yMax = std::min(static_cast<long long>(m_height) - 1,
                                    static_cast<long long>(center.y) + radius);

    if (xMin > xMax || yMin > yMax) {
        return tiles;
    }

    tiles.reserve(static_cast<size_t>((xMax - xMin + 1) * (yMax - yMin + 1)));
    for (long long x = xMin; x <= xMax; ++x) {
        for (long long y = yMin; y <= yMax; ++y) {
            tiles.push_back(TileCoord{static_cast<int>(x), static_cast<int>(y)});
        }
    }
    return tiles;
}

const TileCoordSet& WorldGrid::tilesForAddress(const std::string& address) const {
    static const TileCoordSet EMPTY_SET;
    auto it = m_addressTiles.find(address);
    return (it != m_addressTiles.end()) ? it->second : EMPTY_SET;
}

bool WorldGrid::addEvent(const TileEvent& event, TileCoord tile) {
    return mutableTile(tile).events.insert(event).second;
}

bool WorldGrid::removeEvent(const TileEvent& event, TileCoord tile) {
    return mutableTile(tile).events.erase(event) > 0;
}

bool WorldGrid::idleEvent(const TileEvent& event, TileCoord tile) {
    auto& events = mutableTile(tile).events;
    if (event.isIdle() || !events.contains(event)) {
        return false;
    }
    events.erase(event);
    events.insert(event.toIdle());
    return true;
}

bool WorldGrid::removeSubjectEvents(const std::string& subject, TileCoord tile) {
    auto& events = mutableTile(tile).events;
    const size_t removed = std::erase_if(events, [&subject](const TileEvent& event) {
        return event.subject == subject;
    });
    return removed > 0;
}

} // namespace Smallville
