/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ADDRESS_HPP
#define ADDRESS_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace Smallville {

/**
 * @brief Granularity of a hierarchical address "world:sector:arena:object"
 */
enum class AddressLevel : uint8_t {
    World = 0,
    Sector = 1,
    Arena = 2,
    Object = 3
};

inline std::ostream& operator<<(std::ostream& os, AddressLevel level) {
    switch (level) {
        case AddressLevel::World: return os << "world";
        case AddressLevel::Sector: return os << "sector";
        case AddressLevel::Arena: return os << "arena";
        case AddressLevel::Object: return os << "object";
        default: return os << "UNKNOWN";
    }
}

constexpr char ADDRESS_DELIMITER = ':';

// Spawn-location keys live in their own namespace. Normal addresses always
// begin with the world name, so this prefix cannot collide with them.
constexpr std::string_view SPAWN_LOCATION_PREFIX = "<spawn_loc>";

/**
 * @brief Join address segments with ':' (empty segments are kept)
 */
std::string joinAddress(const std::vector<std::string>& segments);

/**
 * @brief Split an address into its segments (empty segments are kept)
 */
std::vector<std::string> splitAddress(std::string_view address);

inline std::string spawnLocationKey(std::string_view spawnLocation) {
    std::string key(SPAWN_LOCATION_PREFIX);
    key += spawnLocation;
    return key;
}

inline bool isSpawnLocationKey(std::string_view key) {
    return key.starts_with(SPAWN_LOCATION_PREFIX);
}

} // namespace Smallville

#endif // ADDRESS_HPP
