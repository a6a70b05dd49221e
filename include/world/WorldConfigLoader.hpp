/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_CONFIG_LOADER_HPP
#define WORLD_CONFIG_LOADER_HPP

#include "world/WorldData.hpp"
#include <string>

namespace Smallville {

/**
 * @brief Reads a world bundle directory into a WorldGridConfig
 *
 * Expected layout:
 *   <dir>/maze_meta_info.json
 *   <dir>/special_blocks/world_blocks.csv
 *   <dir>/special_blocks/{sector,arena,game_object,spawning_location}_blocks.csv
 *   <dir>/maze/{collision,sector,arena,game_object,spawning_location}_maze.csv
 *
 * Block tables map their first column (code) to their last column (name).
 * Each maze file holds every cell code, row-major, on its first row.
 *
 * Layer lengths are not checked here; WorldGrid validates them.
 */
class WorldConfigLoader {
public:
    /**
     * @throws ConfigError naming the file that is missing or malformed
     */
    static WorldGridConfig loadFromDirectory(const std::string& bundleDir);

private:
    static void loadMetaInfo(const std::string& path, WorldGridConfig& config);
    static std::string loadWorldName(const std::string& path);
    static CodeNameTable loadBlockTable(const std::string& path);
    static std::vector<std::string> loadLayer(const std::string& path);
};

} // namespace Smallville

#endif // WORLD_CONFIG_LOADER_HPP
