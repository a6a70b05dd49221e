/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WorldConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "utils/CsvReader.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <filesystem>
#include <format>

namespace Smallville {

namespace {

[[noreturn]] void fail(const std::string& message) {
    WORLD_CONFIG_ERROR(message);
    throw ConfigError(message);
}

const std::vector<CsvRow>& readCsv(CsvReader& reader, const std::string& path) {
    if (!reader.loadFromFile(path)) {
        fail("Failed to read " + path + " - " + reader.getLastError());
    }
    return reader.getRows();
}

int requirePositiveInt(const JsonValue& root, const std::string& key,
                       const std::string& path) {
    const auto value = root[key].tryAsNumber();
    if (!value || *value != std::floor(*value) || *value <= 0.0 || *value > 1e9) {
        fail(std::format("{}: '{}' must be a positive integer", path, key));
    }
    return static_cast<int>(*value);
}

} // anonymous namespace

WorldGridConfig WorldConfigLoader::loadFromDirectory(const std::string& bundleDir) {
    namespace fs = std::filesystem;
    const fs::path root(bundleDir);
    const fs::path blocks = root / "special_blocks";
    const fs::path maze = root / "maze";

    if (!fs::is_directory(root)) {
        fail("World bundle directory does not exist: " + bundleDir);
    }

    WorldGridConfig config;
    loadMetaInfo((root / "maze_meta_info.json").string(), config);

    config.worldName = loadWorldName((blocks / "world_blocks.csv").string());
    config.sectorNames = loadBlockTable((blocks / "sector_blocks.csv").string());
    config.arenaNames = loadBlockTable((blocks / "arena_blocks.csv").string());
    config.gameObjectNames = loadBlockTable((blocks / "game_object_blocks.csv").string());
    config.spawningLocationNames =
        loadBlockTable((blocks / "spawning_location_blocks.csv").string());

    config.collisionLayer = loadLayer((maze / "collision_maze.csv").string());
    config.sectorLayer = loadLayer((maze / "sector_maze.csv").string());
    config.arenaLayer = loadLayer((maze / "arena_maze.csv").string());
    config.gameObjectLayer = loadLayer((maze / "game_object_maze.csv").string());
    config.spawningLocationLayer = loadLayer((maze / "spawning_location_maze.csv").string());

    WORLD_CONFIG_INFO(std::format("Loaded world bundle '{}' from {} ({}x{})", config.worldName,
                                  bundleDir, config.width, config.height));
    return config;
}

void WorldConfigLoader::loadMetaInfo(const std::string& path, WorldGridConfig& config) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        fail("Failed to read " + path + " - " + reader.getLastError());
    }

    const JsonValue& meta = reader.getRoot();
    if (!meta.isObject()) {
        fail(path + ": root is not a JSON object");
    }

    config.width = requirePositiveInt(meta, "maze_width", path);
    config.height = requirePositiveInt(meta, "maze_height", path);
    config.tileSize = requirePositiveInt(meta, "sq_tile_size", path);

    // Opaque to the grid; kept verbatim (strings unquoted)
    const JsonValue& constraint = meta["special_constraint"];
    config.specialConstraint = constraint.isString() ? constraint.asString()
                             : constraint.isNull()   ? std::string()
                                                     : constraint.toString();
}

std::string WorldConfigLoader::loadWorldName(const std::string& path) {
    CsvReader reader;
    const auto& rows = readCsv(reader, path);
    if (rows.empty() || rows.front().empty()) {
        fail(path + ": expected a world block row");
    }
    return rows.front().back();
}

CodeNameTable WorldConfigLoader::loadBlockTable(const std::string& path) {
    CsvReader reader;
    const auto& rows = readCsv(reader, path);

    CodeNameTable table;
    table.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        const CsvRow& row = rows[i];
        if (row.size() < 2 || row.front().empty()) {
            fail(std::format("{}: row {} must map a code to a name", path, i + 1));
        }
        if (!table.insert_or_assign(row.front(), row.back()).second) {
            WORLD_CONFIG_WARN(std::format("{}: code '{}' defined more than once, keeping the last",
                                          path, row.front()));
        }
    }
    return table;
}

std::vector<std::string> WorldConfigLoader::loadLayer(const std::string& path) {
    CsvReader reader;
    const auto& rows = readCsv(reader, path);
    if (rows.empty()) {
        fail(path + ": layer file is empty");
    }
    return rows.front();
}

} // namespace Smallville
