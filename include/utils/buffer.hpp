#pragma once

#include <cstdint>
#include <vector>
#include <stdexcept>
#include <utility>

namespace prudp::utils {

/**
 * Buffer reader for parsing little-endian wire data
 */
class BufferReader {
public:
    explicit BufferReader(const std::vector<uint8_t>& data)
        : m_data(data.data())
        , m_size(data.size())
        , m_pos(0)
    {}

    BufferReader(const uint8_t* data, size_t size)
        : m_data(data)
        , m_size(size)
        , m_pos(0)
    {}

    uint8_t readU8() {
        checkBounds(1);
        return m_data[m_pos++];
    }

    uint16_t readU16() {
        checkBounds(2);
        uint16_t value = m_data[m_pos] | (m_data[m_pos + 1] << 8);
        m_pos += 2;
        return value;
    }

    uint32_t readU32() {
        checkBounds(4);
        uint32_t value = static_cast<uint32_t>(m_data[m_pos]) |
                        (static_cast<uint32_t>(m_data[m_pos + 1]) << 8) |
                        (static_cast<uint32_t>(m_data[m_pos + 2]) << 16) |
                        (static_cast<uint32_t>(m_data[m_pos + 3]) << 24);
        m_pos += 4;
        return value;
    }

    // Read raw bytes
    std::vector<uint8_t> readBytes(size_t count) {
        checkBounds(count);
        std::vector<uint8_t> result(m_data + m_pos, m_data + m_pos + count);
        m_pos += count;
        return result;
    }

    // Read raw bytes into a fixed-size destination
    void readBytes(uint8_t* dest, size_t count) {
        checkBounds(count);
        for (size_t i = 0; i < count; i++) {
            dest[i] = m_data[m_pos + i];
        }
        m_pos += count;
    }

    // Position
    size_t position() const { return m_pos; }
    size_t remaining() const { return m_size - m_pos; }
    size_t size() const { return m_size; }
    bool hasMore() const { return m_pos < m_size; }
    const uint8_t* data() const { return m_data; }

private:
    void checkBounds(size_t count) const {
        if (count > m_size - m_pos) {
            throw std::out_of_range("Buffer read out of bounds");
        }
    }

    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
};

/**
 * Buffer writer for building little-endian wire data
 */
class BufferWriter {
public:
    BufferWriter() {
        m_data.reserve(64);
    }

    explicit BufferWriter(size_t reserveSize) {
        m_data.reserve(reserveSize);
    }

    void writeU8(uint8_t value) {
        m_data.push_back(value);
    }

    void writeU16(uint16_t value) {
        m_data.push_back(value & 0xFF);
        m_data.push_back((value >> 8) & 0xFF);
    }

    void writeU32(uint32_t value) {
        m_data.push_back(value & 0xFF);
        m_data.push_back((value >> 8) & 0xFF);
        m_data.push_back((value >> 16) & 0xFF);
        m_data.push_back((value >> 24) & 0xFF);
    }

    // Write raw bytes
    void writeBytes(const uint8_t* data, size_t count) {
        m_data.insert(m_data.end(), data, data + count);
    }

    void writeBytes(const std::vector<uint8_t>& data) {
        m_data.insert(m_data.end(), data.begin(), data.end());
    }

    // Get result
    const std::vector<uint8_t>& data() const { return m_data; }
    std::vector<uint8_t>&& take() { return std::move(m_data); }
    size_t size() const { return m_data.size(); }

    void clear() { m_data.clear(); }

private:
    std::vector<uint8_t> m_data;
};

} // namespace prudp::utils
