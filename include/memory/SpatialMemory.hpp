/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_MEMORY_HPP
#define SPATIAL_MEMORY_HPP

#include "world/WorldData.hpp"
#include <map>
#include <string>
#include <vector>

namespace Smallville {

/**
 * @brief What an agent knows about the world's layout
 *
 * A tree world -> sector -> arena -> objects, persisted as
 * spatial_memory.json:
 *   { "Town": { "park": { "bench": ["chessboard"] } } }
 * Children are listed in name order; objects keep discovery order.
 */
class SpatialMemory {
public:
    SpatialMemory() = default;

    /**
     * @throws CorruptSnapshot if the file is missing or malformed
     */
    static SpatialMemory load(const std::string& path);

    bool save(const std::string& path) const;

    /**
     * @brief Learn the address levels a tile carries
     *
     * Stops at the first empty level (an arena is only recorded under a
     * known sector).
     * @return true if anything new was learned
     */
    bool recordTile(const Tile& tile);

    /**
     * @brief Learn a full or partial address "world[:sector[:arena[:object]]]"
     * @return true if anything new was learned
     */
    bool recordAddress(const std::string& address);

    std::vector<std::string> worlds() const;
    std::vector<std::string> sectors(const std::string& world) const;
    std::vector<std::string> arenas(const std::string& world, const std::string& sector) const;
    std::vector<std::string> objects(const std::string& world, const std::string& sector,
                                     const std::string& arena) const;

    /**
     * @brief Whether every segment of the address is known
     */
    bool knows(const std::string& address) const;

    bool empty() const { return m_tree.empty(); }

private:
    using ObjectList = std::vector<std::string>;
    using ArenaMap = std::map<std::string, ObjectList>;
    using SectorMap = std::map<std::string, ArenaMap>;
    using WorldMap = std::map<std::string, SectorMap>;

    bool record(const std::vector<std::string>& segments);

    WorldMap m_tree;
};

} // namespace Smallville

#endif // SPATIAL_MEMORY_HPP
