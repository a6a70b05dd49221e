/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_GRID_HPP
#define WORLD_GRID_HPP

#include "world/Address.hpp"
#include "world/TileEvent.hpp"
#include "world/WorldData.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace Smallville {

/**
 * @brief The shared spatial world: semantic tiles, collision and events
 *
 * Built once from a WorldGridConfig. After construction only tile event sets
 * change. Event mutation is not synchronized: callers must ensure at most one
 * writer per tile at a time, and no reads of a tile while it is written.
 *
 * All coordinate-taking methods throw OutOfBounds for coordinates outside
 * [0, width) x [0, height).
 */
class WorldGrid {
public:
    /**
     * @brief Build the grid and its reverse address index
     * @throws ConfigError if dimensions are not positive or a layer does not
     *         hold exactly width * height cells
     */
    explicit WorldGrid(const WorldGridConfig& config);

    WorldGrid(const WorldGrid&) = delete;
    WorldGrid& operator=(const WorldGrid&) = delete;
    WorldGrid(WorldGrid&&) = default;
    WorldGrid& operator=(WorldGrid&&) = default;

    int width() const { return m_width; }
    int height() const { return m_height; }
    int tileSize() const { return m_tileSize; }
    const std::string& worldName() const { return m_worldName; }
    const std::string& specialConstraint() const { return m_specialConstraint; }

    bool isValidPosition(TileCoord coord) const {
        return coord.x >= 0 && coord.x < m_width && coord.y >= 0 && coord.y < m_height;
    }

    /**
     * @brief Convert a pixel position to a tile coordinate
     *
     * Uses ceiling division per axis, so a pixel exactly on a tile boundary
     * maps to the boundary's index (64px with 32px tiles is tile 2, not 1).
     * The result is not bounds-checked. Positions beyond the int range
     * saturate at its limits and NaN maps to INT_MIN, both outside any grid.
     */
    TileCoord coordinateToTile(PixelCoord pixel) const;

    const Tile& accessTile(TileCoord coord) const;

    bool isCollision(TileCoord coord) const { return accessTile(coord).collision; }

    /**
     * @brief Colon-joined address of a tile truncated at the given level
     *
     * Empty intermediate fields still produce their segment, e.g.
     * "Town::bench" for a tile with an arena but no sector.
     * Throws std::invalid_argument for a level outside AddressLevel.
     */
    std::string addressOf(TileCoord coord, AddressLevel level) const;

    /**
     * @brief Coordinates of the square of side 2*radius+1 around center
     *
     * Clipped to the grid, never wrapped. Ordered column by column (x outer,
     * y inner). Contains center whenever center is in bounds.
     */
    std::vector<TileCoord> tilesNear(TileCoord center, int radius) const;

    /**
     * @brief Tiles carrying an address at sector, arena or object level, or a
     *        "<spawn_loc>" key
     * @return The indexed set; an empty set for addresses never indexed
     */
    const TileCoordSet& tilesForAddress(const std::string& address) const;

    const TileCoordSet& spawnLocationTiles(const std::string& spawnLocation) const {
        return tilesForAddress(spawnLocationKey(spawnLocation));
    }

    size_t indexedAddressCount() const { return m_addressTiles.size(); }

    // Event mutation. Each returns true if the tile's event set changed.

    // Idempotent insert
    bool addEvent(const TileEvent& event, TileCoord tile);
    // No-op when absent
    bool removeEvent(const TileEvent& event, TileCoord tile);
    // Replace a present event with its idle variant
    bool idleEvent(const TileEvent& event, TileCoord tile);
    // Drop every event with this subject, whatever its other fields
    bool removeSubjectEvents(const std::string& subject, TileCoord tile);

private:
    void validateConfig(const WorldGridConfig& config) const;
    void indexTile(const Tile& tile, TileCoord coord);
    void checkBounds(TileCoord coord) const;
    Tile& mutableTile(TileCoord coord);

    int m_width{0};
    int m_height{0};
    int m_tileSize{1};
    std::string m_worldName;
    std::string m_specialConstraint;

    std::vector<std::vector<Tile>> m_grid;  // m_grid[y][x]
    std::unordered_map<std::string, TileCoordSet> m_addressTiles;
};

} // namespace Smallville

#endif // WORLD_GRID_HPP
