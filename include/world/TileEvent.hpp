/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_EVENT_HPP
#define TILE_EVENT_HPP

#include <boost/container_hash/hash.hpp>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>

namespace Smallville {

/**
 * @brief A subject-centred fact attached to a tile
 *
 * "Isabella Rodriguez is brewing coffee" is
 * {subject: "Isabella Rodriguez", predicate: "is", object: "coffee",
 *  description: "brewing coffee"}. An idle event carries only its subject.
 *
 * Equality and hashing cover all four fields: two events are the same only
 * if every field matches, including which optionals are set.
 */
struct TileEvent {
    std::string subject;
    std::optional<std::string> predicate;
    std::optional<std::string> object;
    std::optional<std::string> description;

    static TileEvent idle(std::string subject) {
        return TileEvent{std::move(subject), std::nullopt, std::nullopt, std::nullopt};
    }

    bool isIdle() const {
        return !predicate && !object && !description;
    }

    TileEvent toIdle() const { return idle(subject); }

    bool operator==(const TileEvent&) const = default;
};

struct TileEventHash {
    size_t operator()(const TileEvent& event) const {
        size_t seed = 0;
        boost::hash_combine(seed, std::hash<std::string>{}(event.subject));
        for (const auto* field : {&event.predicate, &event.object, &event.description}) {
            boost::hash_combine(seed, field->has_value());
            if (field->has_value()) {
                boost::hash_combine(seed, std::hash<std::string>{}(**field));
            }
        }
        return seed;
    }
};

using TileEventSet = std::unordered_set<TileEvent, TileEventHash>;

// Stream operator for test output
inline std::ostream& operator<<(std::ostream& os, const TileEvent& event) {
    auto field = [&os](const std::optional<std::string>& value) {
        if (value) {
            os << '"' << *value << '"';
        } else {
            os << "None";
        }
    };
    os << "(\"" << event.subject << "\", ";
    field(event.predicate);
    os << ", ";
    field(event.object);
    os << ", ";
    field(event.description);
    return os << ')';
}

} // namespace Smallville

#endif // TILE_EVENT_HPP
