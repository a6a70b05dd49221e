/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <array>
#include <cstdint>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only binary serialization for snapshot files.
 *
 * Layout of every file: a FileHeader (signature, format version, record
 * count) followed by the records. Integers are written in host byte order;
 * snapshots are not meant to move between architectures.
 */
namespace Smallville::BinarySerial {

constexpr size_t SIGNATURE_SIZE = 8;
using Signature = std::array<char, SIGNATURE_SIZE>;

struct FileHeader {
    Signature signature{};
    uint32_t version{0};
    uint32_t recordCount{0};
};

// Length prefixes above these are treated as corruption
constexpr uint32_t MAX_STRING_BYTES = 1024 * 1024;
constexpr uint32_t MAX_LIST_ELEMENTS = 1024 * 1024;

class Writer {
public:
    explicit Writer(std::unique_ptr<std::ostream> stream) : m_stream(std::move(stream)) {
        if (!m_stream || !m_stream->good()) {
            throw std::runtime_error("BinarySerial::Writer needs a writable stream");
        }
    }

    // Truncates an existing file; nullptr when it cannot be created
    static std::unique_ptr<Writer> createFileWriter(const std::string& filename) {
        auto file = std::make_unique<std::ofstream>(filename, std::ios::binary | std::ios::trunc);
        if (!file->is_open()) {
            SERIAL_ERROR("Cannot open for writing: " + filename);
            return nullptr;
        }
        return std::make_unique<Writer>(std::move(file));
    }

    template <typename T>
    bool write(const T& value) {
        static_assert(std::is_trivially_copyable_v<T>, "write() takes plain data only");
        m_stream->write(reinterpret_cast<const char*>(&value), sizeof(T));
        return good();
    }

    bool writeString(const std::string& text) {
        if (text.size() > MAX_STRING_BYTES) {
            SERIAL_ERROR(std::format("Refusing to write a {} byte string", text.size()));
            return false;
        }
        if (!write(static_cast<uint32_t>(text.size()))) {
            return false;
        }
        m_stream->write(text.data(), static_cast<std::streamsize>(text.size()));
        return good();
    }

    bool writeStringList(const std::vector<std::string>& list) {
        if (list.size() > MAX_LIST_ELEMENTS || !write(static_cast<uint32_t>(list.size()))) {
            return false;
        }
        for (const auto& text : list) {
            if (!writeString(text)) {
                return false;
            }
        }
        return true;
    }

    bool writeHeader(const Signature& signature, uint32_t version, uint32_t recordCount) {
        return write(FileHeader{signature, version, recordCount});
    }

    // T provides bool serialize(Writer&) const
    template <typename T>
    bool writeSerializable(const T& record) {
        return record.serialize(*this);
    }

    bool good() const { return m_stream->good(); }
    void flush() { m_stream->flush(); }

private:
    std::unique_ptr<std::ostream> m_stream;
};

class Reader {
public:
    explicit Reader(std::unique_ptr<std::istream> stream) : m_stream(std::move(stream)) {
        if (!m_stream || !m_stream->good()) {
            throw std::runtime_error("BinarySerial::Reader needs a readable stream");
        }
    }

    // nullptr when the file cannot be opened
    static std::unique_ptr<Reader> createFileReader(const std::string& filename) {
        auto file = std::make_unique<std::ifstream>(filename, std::ios::binary);
        if (!file->is_open()) {
            SERIAL_ERROR("Cannot open for reading: " + filename);
            return nullptr;
        }
        return std::make_unique<Reader>(std::move(file));
    }

    template <typename T>
    bool read(T& value) {
        static_assert(std::is_trivially_copyable_v<T>, "read() takes plain data only");
        m_stream->read(reinterpret_cast<char*>(&value), sizeof(T));
        return m_stream->gcount() == static_cast<std::streamsize>(sizeof(T));
    }

    bool readString(std::string& text) {
        uint32_t length = 0;
        if (!read(length)) {
            return false;
        }
        if (length > MAX_STRING_BYTES || length > remainingBytes()) {
            SERIAL_ERROR(std::format("String length prefix {} exceeds the data left", length));
            return false;
        }
        text.resize(length);
        m_stream->read(text.data(), static_cast<std::streamsize>(length));
        return m_stream->gcount() == static_cast<std::streamsize>(length);
    }

    bool readStringList(std::vector<std::string>& list) {
        uint32_t count = 0;
        if (!read(count)) {
            return false;
        }
        // Every element carries at least its four byte length prefix
        if (count > MAX_LIST_ELEMENTS || count > remainingBytes() / sizeof(uint32_t)) {
            SERIAL_ERROR(std::format("List count {} exceeds the data left", count));
            return false;
        }
        list.clear();
        list.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            if (!readString(list.emplace_back())) {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief Read and validate a FileHeader
     * @return false on short read, wrong signature or unsupported version
     */
    bool readHeader(const Signature& expectedSignature, uint32_t maxVersion,
                    FileHeader& header) {
        if (!read(header)) {
            SERIAL_ERROR("File is shorter than its header");
            return false;
        }
        if (header.signature != expectedSignature) {
            SERIAL_ERROR("File signature mismatch");
            return false;
        }
        if (header.version == 0 || header.version > maxVersion) {
            SERIAL_ERROR(std::format("Unsupported file version {}", header.version));
            return false;
        }
        return true;
    }

    // T provides bool deserialize(Reader&)
    template <typename T>
    bool readSerializable(T& record) {
        return record.deserialize(*this);
    }

    // Bytes between the read position and the end of the stream
    uint64_t remainingBytes() {
        const std::streamoff here = m_stream->tellg();
        if (here < 0) {
            return 0;
        }
        m_stream->seekg(0, std::ios::end);
        const std::streamoff end = m_stream->tellg();
        m_stream->seekg(here);
        return end > here ? static_cast<uint64_t>(end - here) : 0;
    }

    bool atEnd() { return m_stream->peek() == std::char_traits<char>::eof(); }

private:
    std::unique_ptr<std::istream> m_stream;
};

} // namespace Smallville::BinarySerial

#endif // BINARY_SERIALIZER_HPP
