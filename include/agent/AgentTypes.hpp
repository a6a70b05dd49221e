/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_TYPES_HPP
#define AGENT_TYPES_HPP

#include "world/TileEvent.hpp"
#include "world/WorldData.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace Smallville {

/**
 * @brief Whether a new calendar day began since the agent's previous tick
 */
enum class DayFlag : uint8_t {
    NoSignal = 0,
    FirstDay = 1,   // No earlier tick recorded for this agent
    NewDay = 2
};

/**
 * @brief Orchestrator state. A tick walks Perceiving..Executing in order and
 *        returns to Idle; Conversing covers openConversation().
 */
enum class TickPhase : uint8_t {
    Idle = 0,
    Perceiving,
    Retrieving,
    Planning,
    Reflecting,
    Executing,
    Conversing
};

enum class ConversationMode : uint8_t {
    Analysis = 0,   // Free-form interview with the agent
    Whisper = 1     // Directed statement the agent should internalize
};

inline const char* toString(DayFlag flag) {
    switch (flag) {
        case DayFlag::NoSignal: return "NoSignal";
        case DayFlag::FirstDay: return "FirstDay";
        case DayFlag::NewDay: return "NewDay";
        default: return "UNKNOWN";
    }
}

inline const char* toString(TickPhase phase) {
    switch (phase) {
        case TickPhase::Idle: return "Idle";
        case TickPhase::Perceiving: return "Perceiving";
        case TickPhase::Retrieving: return "Retrieving";
        case TickPhase::Planning: return "Planning";
        case TickPhase::Reflecting: return "Reflecting";
        case TickPhase::Executing: return "Executing";
        case TickPhase::Conversing: return "Conversing";
        default: return "UNKNOWN";
    }
}

inline const char* toString(ConversationMode mode) {
    switch (mode) {
        case ConversationMode::Analysis: return "Analysis";
        case ConversationMode::Whisper: return "Whisper";
        default: return "UNKNOWN";
    }
}

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, DayFlag flag) { return os << toString(flag); }
inline std::ostream& operator<<(std::ostream& os, TickPhase phase) { return os << toString(phase); }
inline std::ostream& operator<<(std::ostream& os, ConversationMode mode) { return os << toString(mode); }

// ----------------------------------------------------------------------------
// Values passed between the pipeline stages. Their content is produced and
// consumed by the cognitive modules; the orchestrator only moves them along.
// ----------------------------------------------------------------------------

struct PerceivedEvent {
    TileEvent event;
    TileCoord tile;
    uint32_t memoryNodeId{0};   // Associative memory node, 0 if not stored
};

using PerceivedEvents = std::vector<PerceivedEvent>;

struct RetrievedContext {
    PerceivedEvent focus;
    std::vector<uint32_t> relatedEvents;     // Associative memory node ids
    std::vector<uint32_t> relatedThoughts;
};

using RetrievedMemories = std::vector<RetrievedContext>;

struct Plan {
    std::string actAddress;     // Where the planned activity takes place
    std::string description;
    int durationMinutes{0};
};

struct MoveAction {
    TileCoord target;
    bool operator==(const MoveAction&) const = default;
};

struct InteractAction {
    std::string objectAddress;
    TileEvent objectEvent;      // Event the object should carry while in use
    bool operator==(const InteractAction&) const = default;
};

struct SpeakAction {
    std::string listener;
    std::string utterance;
    bool operator==(const SpeakAction&) const = default;
};

/**
 * @brief Concrete outcome of a tick, applied to the world by the driver
 */
using AgentAction = std::variant<MoveAction, InteractAction, SpeakAction>;

} // namespace Smallville

#endif // AGENT_TYPES_HPP
