/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ASSOCIATIVE_MEMORY_HPP
#define ASSOCIATIVE_MEMORY_HPP

#include "core/SimTime.hpp"
#include "utils/BinarySerializer.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace Smallville {

enum class MemoryKind : uint8_t {
    Event = 0,
    Thought = 1,
    Chat = 2
};

inline const char* toString(MemoryKind kind) {
    switch (kind) {
        case MemoryKind::Event: return "Event";
        case MemoryKind::Thought: return "Thought";
        case MemoryKind::Chat: return "Chat";
        default: return "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream& os, MemoryKind kind) { return os << toString(kind); }

/**
 * @brief One entry of the agent's long-term memory stream
 */
struct MemoryNode {
    uint32_t id{0};             // 1-based, assigned on insertion
    MemoryKind kind{MemoryKind::Event};
    SimTime created{};
    std::string subject;
    std::string predicate;
    std::string object;
    std::string description;
    int poignancy{0};
    std::vector<std::string> keywords;

    bool serialize(BinarySerial::Writer& writer) const;
    bool deserialize(BinarySerial::Reader& reader);
};

/**
 * @brief Long-term ("associative") memory: an append-only stream of nodes
 *
 * Persisted as <folder>/nodes.bin. Node ids are stable across save/load,
 * so perceived events and retrieved contexts may refer to them by id.
 */
class AssociativeMemory {
public:
    static constexpr const char* NODES_FILE = "nodes.bin";
    static constexpr uint32_t FORMAT_VERSION = 1;

    AssociativeMemory() = default;

    /**
     * @brief Load the node stream from a store folder
     * @throws CorruptSnapshot if nodes.bin is missing, truncated or has a
     *         foreign signature
     */
    static AssociativeMemory load(const std::string& folder);

    /**
     * @brief Write the node stream to <folder>/nodes.bin, creating the folder
     */
    bool save(const std::string& folder) const;

    uint32_t addEvent(SimTime created, std::string subject, std::string predicate,
                      std::string object, std::string description, int poignancy,
                      std::vector<std::string> keywords);

    uint32_t addThought(SimTime created, std::string subject, std::string predicate,
                        std::string object, std::string description, int poignancy,
                        std::vector<std::string> keywords);

    uint32_t addChat(SimTime created, std::string subject, std::string predicate,
                     std::string object, std::string description, int poignancy,
                     std::vector<std::string> keywords);

    // nullptr for an unknown id
    const MemoryNode* node(uint32_t id) const;

    /**
     * @brief Nodes tagged with a keyword (case-insensitive), newest first
     */
    std::vector<const MemoryNode*> nodesForKeyword(const std::string& keyword) const;

    /**
     * @brief Up to count most recent nodes of a kind, newest first
     */
    std::vector<const MemoryNode*> latest(MemoryKind kind, size_t count) const;

    size_t size() const { return m_nodes.size(); }
    bool empty() const { return m_nodes.empty(); }

    // Poignancy accumulated since the last reflection
    int importanceSinceReflection() const { return m_importanceSinceReflection; }
    void resetImportance() { m_importanceSinceReflection = 0; }

private:
    uint32_t add(MemoryNode node);
    void indexNode(const MemoryNode& node);

    std::vector<MemoryNode> m_nodes;
    std::unordered_map<std::string, std::vector<uint32_t>> m_keywordIndex;
    int m_importanceSinceReflection{0};
};

} // namespace Smallville

#endif // ASSOCIATIVE_MEMORY_HPP
