/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_DATA_HPP
#define WORLD_DATA_HPP

#include "world/TileEvent.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace Smallville {

/**
 * @brief Discrete grid coordinate
 *
 * Ordered row-major (y first, then x) so coordinate sets built by a row-major
 * sweep are appended in order.
 */
struct TileCoord {
    int x{0};
    int y{0};

    bool operator==(const TileCoord&) const = default;
    bool operator<(const TileCoord& other) const {
        return (y != other.y) ? (y < other.y) : (x < other.x);
    }
};

using TileCoordSet = boost::container::flat_set<TileCoord>;

/**
 * @brief Continuous position in world pixels
 */
struct PixelCoord {
    float x{0.0f};
    float y{0.0f};
};

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, const TileCoord& coord) {
    return os << '(' << coord.x << ", " << coord.y << ')';
}

inline std::ostream& operator<<(std::ostream& os, const PixelCoord& coord) {
    return os << '(' << coord.x << ", " << coord.y << ')';
}

/**
 * @brief One grid cell
 *
 * Address fields and collision are fixed once the grid is built; only the
 * event set changes afterwards.
 */
struct Tile {
    std::string world;
    std::string sector;
    std::string arena;
    std::string gameObject;
    std::string spawningLocation;
    bool collision = false;
    TileEventSet events;
};

using CodeNameTable = boost::container::flat_map<std::string, std::string>;

/**
 * @brief Everything needed to build a WorldGrid
 *
 * Code layers are row-major with width * height cells each. Codes are
 * resolved through the matching name table; a code missing from its table
 * resolves to an empty name. In the collision layer any code other than "0"
 * (or empty) marks a blocked cell.
 */
struct WorldGridConfig {
    int width{0};
    int height{0};
    int tileSize{32};                 // Tile edge in pixels
    std::string specialConstraint;    // Passed through unexamined
    std::string worldName;

    std::vector<std::string> collisionLayer;
    std::vector<std::string> sectorLayer;
    std::vector<std::string> arenaLayer;
    std::vector<std::string> gameObjectLayer;
    std::vector<std::string> spawningLocationLayer;

    CodeNameTable sectorNames;
    CodeNameTable arenaNames;
    CodeNameTable gameObjectNames;
    CodeNameTable spawningLocationNames;
};

} // namespace Smallville

#endif // WORLD_DATA_HPP
