/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "memory/AssociativeMemory.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>

namespace Smallville {

namespace {

constexpr BinarySerial::Signature NODES_SIGNATURE = {'S', 'V', 'A', 'S', 'S', 'O', 'C', 'M'};

// id, kind, created, four string lengths, poignancy, keyword count
constexpr uint64_t MIN_NODE_BYTES = 4 + 1 + 8 + 4 * 4 + 4 + 4;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

[[noreturn]] void corrupt(const std::string& path, const std::string& reason) {
    MEMORY_ERROR("Associative memory " + path + ": " + reason);
    throw CorruptSnapshot(path, reason);
}

} // anonymous namespace

bool MemoryNode::serialize(BinarySerial::Writer& writer) const {
    const int64_t createdSeconds = created.time_since_epoch().count();
    const int32_t storedPoignancy = poignancy;
    return writer.write(id) &&
           writer.write(kind) &&
           writer.write(createdSeconds) &&
           writer.writeString(subject) &&
           writer.writeString(predicate) &&
           writer.writeString(object) &&
           writer.writeString(description) &&
           writer.write(storedPoignancy) &&
           writer.writeStringList(keywords);
}

bool MemoryNode::deserialize(BinarySerial::Reader& reader) {
    int64_t createdSeconds = 0;
    int32_t storedPoignancy = 0;
    if (!reader.read(id) ||
        !reader.read(kind) ||
        !reader.read(createdSeconds) ||
        !reader.readString(subject) ||
        !reader.readString(predicate) ||
        !reader.readString(object) ||
        !reader.readString(description) ||
        !reader.read(storedPoignancy) ||
        !reader.readStringList(keywords)) {
        return false;
    }
    if (static_cast<uint8_t>(kind) > static_cast<uint8_t>(MemoryKind::Chat)) {
        return false;
    }
    created = SimTime{std::chrono::seconds{createdSeconds}};
    poignancy = storedPoignancy;
    return true;
}

AssociativeMemory AssociativeMemory::load(const std::string& folder) {
    const std::string path = (std::filesystem::path(folder) / NODES_FILE).string();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        corrupt(path, "file not found");
    }

    auto reader = BinarySerial::Reader::createFileReader(path);
    if (!reader) {
        corrupt(path, "cannot open file");
    }

    BinarySerial::FileHeader header;
    if (!reader->readHeader(NODES_SIGNATURE, FORMAT_VERSION, header)) {
        corrupt(path, "bad file header");
    }

    int32_t importance = 0;
    if (!reader->read(importance)) {
        corrupt(path, "truncated importance counter");
    }

    if (header.recordCount > reader->remainingBytes() / MIN_NODE_BYTES) {
        corrupt(path, std::format("header claims {} nodes, more than the file can hold",
                                  header.recordCount));
    }

    AssociativeMemory memory;
    memory.m_nodes.reserve(header.recordCount);
    for (uint32_t i = 0; i < header.recordCount; ++i) {
        MemoryNode node;
        if (!reader->readSerializable(node)) {
            corrupt(path, std::format("node {} of {} is truncated or invalid", i + 1,
                                      header.recordCount));
        }
        // Ids are positional; anything else means the stream was tampered with
        if (node.id != i + 1) {
            corrupt(path, std::format("node {} carries id {}", i + 1, node.id));
        }
        memory.indexNode(node);
        memory.m_nodes.push_back(std::move(node));
    }

    if (!reader->atEnd()) {
        corrupt(path, "trailing bytes after last node");
    }

    memory.m_importanceSinceReflection = importance;
    MEMORY_DEBUG(std::format("Loaded {} memory nodes from {}", memory.m_nodes.size(), path));
    return memory;
}

bool AssociativeMemory::save(const std::string& folder) const {
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        MEMORY_ERROR("Failed to create associative memory folder " + folder + ": " +
                     ec.message());
        return false;
    }

    const std::string path = (std::filesystem::path(folder) / NODES_FILE).string();
    auto writer = BinarySerial::Writer::createFileWriter(path);
    if (!writer) {
        MEMORY_ERROR("Failed to open associative memory file: " + path);
        return false;
    }

    if (!writer->writeHeader(NODES_SIGNATURE, FORMAT_VERSION,
                             static_cast<uint32_t>(m_nodes.size()))) {
        MEMORY_ERROR("Failed to write associative memory header: " + path);
        return false;
    }

    const int32_t importance = m_importanceSinceReflection;
    if (!writer->write(importance)) {
        MEMORY_ERROR("Failed to write importance counter: " + path);
        return false;
    }

    for (const auto& node : m_nodes) {
        if (!writer->writeSerializable(node)) {
            MEMORY_ERROR(std::format("Failed to write memory node {} to {}", node.id, path));
            return false;
        }
    }

    writer->flush();
    if (!writer->good()) {
        MEMORY_ERROR("Failed to flush associative memory file: " + path);
        return false;
    }

    MEMORY_DEBUG(std::format("Saved {} memory nodes to {}", m_nodes.size(), path));
    return true;
}

uint32_t AssociativeMemory::addEvent(SimTime created, std::string subject,
                                     std::string predicate, std::string object,
                                     std::string description, int poignancy,
                                     std::vector<std::string> keywords) {
    return add(MemoryNode{0, MemoryKind::Event, created, std::move(subject),
                          std::move(predicate), std::move(object), std::move(description),
                          poignancy, std::move(keywords)});
}

uint32_t AssociativeMemory::addThought(SimTime created, std::string subject,
                                       std::string predicate, std::string object,
                                       std::string description, int poignancy,
                                       std::vector<std::string> keywords) {
    return add(MemoryNode{0, MemoryKind::Thought, created, std::move(subject),
                          std::move(predicate), std::move(object), std::move(description),
                          poignancy, std::move(keywords)});
}

uint32_t AssociativeMemory::addChat(SimTime created, std::string subject,
                                    std::string predicate, std::string object,
                                    std::string description, int poignancy,
                                    std::vector<std::string> keywords) {
    return add(MemoryNode{0, MemoryKind::Chat, created, std::move(subject),
                          std::move(predicate), std::move(object), std::move(description),
                          poignancy, std::move(keywords)});
}

uint32_t AssociativeMemory::add(MemoryNode node) {
    node.id = static_cast<uint32_t>(m_nodes.size() + 1);
    // Chats count towards reflection the same way events and thoughts do
    m_importanceSinceReflection += node.poignancy;
    indexNode(node);
    m_nodes.push_back(std::move(node));
    return m_nodes.back().id;
}

void AssociativeMemory::indexNode(const MemoryNode& node) {
    for (const auto& keyword : node.keywords) {
        auto& ids = m_keywordIndex[lowercase(keyword)];
        // A node listing the same keyword twice is indexed once
        if (ids.empty() || ids.back() != node.id) {
            ids.push_back(node.id);
        }
    }
}

const MemoryNode* AssociativeMemory::node(uint32_t id) const {
    if (id == 0 || id > m_nodes.size()) {
        return nullptr;
    }
    return &m_nodes[id - 1];
}

std::vector<const MemoryNode*> AssociativeMemory::nodesForKeyword(
    const std::string& keyword) const {
    std::vector<const MemoryNode*> result;
    auto it = m_keywordIndex.find(lowercase(keyword));
    if (it == m_keywordIndex.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (auto idIt = it->second.rbegin(); idIt != it->second.rend(); ++idIt) {
        result.push_back(&m_nodes[*idIt - 1]);
    }
    return result;
}

std::vector<const MemoryNode*> AssociativeMemory::latest(MemoryKind kind, size_t count) const {
    std::vector<const MemoryNode*> result;
    for (auto it = m_nodes.rbegin(); it != m_nodes.rend() && result.size() < count; ++it) {
        if (it->kind == kind) {
            result.push_back(&*it);
        }
    }
    return result;
}

} // namespace Smallville
