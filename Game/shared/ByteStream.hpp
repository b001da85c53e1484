#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <cstring>
#include <glm/glm.hpp>

#include "NetworkTypes.hpp"

namespace Spraynet {

// Byte-aligned little-endian writer. The expected size is declared up front;
// writing past it sets the error state instead of growing the packet.
class ByteWriter
{
private:
    std::vector<uint8_t> buffer;
    size_t capacity = 0;
    bool error_state = false;

    bool reserveBytes(size_t count) {
        if (error_state || buffer.size() + count > capacity) {
            error_state = true;
            return false;
        }
        return true;
    }

    template <typename T>
    void writeLittleEndian(T value) {
        if (!reserveBytes(sizeof(T))) return;
        for (size_t i = 0; i < sizeof(T); ++i) {
            buffer.push_back(static_cast<uint8_t>(static_cast<uint64_t>(value) >> (i * 8)));
        }
    }

public:
    explicit ByteWriter(size_t expected_size) : capacity(expected_size) {
        buffer.reserve(expected_size);
    }

    bool hasError() const { return error_state; }

    void writeByte(uint8_t value) {
        writeLittleEndian(value);
    }

    void writeBool(bool value) {
        writeByte(value ? 1 : 0);
    }

    void writeUInt16(uint16_t value) {
        writeLittleEndian(value);
    }

    void writeUInt32(uint32_t value) {
        writeLittleEndian(value);
    }

    void writeUInt64(uint64_t value) {
        writeLittleEndian(value);
    }

    void writeFloat(float value) {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(float));
        writeUInt32(bits);
    }

    void writeVector3f(const glm::vec3& v) {
        writeFloat(v.x);
        writeFloat(v.y);
        writeFloat(v.z);
    }

    void writeId(NetworkIdentity id) {
        writeUInt64(id);
    }

    void writeBytes(const uint8_t* data, size_t count) {
        if (count == 0 || !reserveBytes(count)) return;
        buffer.insert(buffer.end(), data, data + count);
    }

    const uint8_t* getData() const {
        return buffer.data();
    }

    size_t getByteSize() const {
        return buffer.size();
    }

    size_t getCapacity() const {
        return capacity;
    }

    std::vector<uint8_t> release() {
        return std::move(buffer);
    }
};

// Reads the primitives back in write order. Reading past the end sets the
// error state and yields zero; callers check hasError() before using the values.
class ByteReader
{
private:
    const uint8_t* buffer;
    size_t buffer_size;
    size_t position = 0;
    bool error_state = false;

    bool consume(size_t count) {
        if (!canRead(count)) {
            error_state = true;
            return false;
        }
        return true;
    }

    template <typename T>
    T readLittleEndian() {
        if (!consume(sizeof(T))) return T{};
        uint64_t result = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            result |= static_cast<uint64_t>(buffer[position + i]) << (i * 8);
        }
        position += sizeof(T);
        return static_cast<T>(result);
    }

public:
    ByteReader(const uint8_t* data, size_t size)
        : buffer(data), buffer_size(size) {}

    bool hasError() const { return error_state; }

    uint8_t readByte() {
        return readLittleEndian<uint8_t>();
    }

    bool readBool() {
        return readByte() != 0;
    }

    uint16_t readUInt16() {
        return readLittleEndian<uint16_t>();
    }

    uint32_t readUInt32() {
        return readLittleEndian<uint32_t>();
    }

    uint64_t readUInt64() {
        return readLittleEndian<uint64_t>();
    }

    float readFloat() {
        uint32_t bits = readUInt32();
        float result;
        std::memcpy(&result, &bits, sizeof(float));
        return result;
    }

    glm::vec3 readVector3f() {
        glm::vec3 result;
        result.x = readFloat();
        result.y = readFloat();
        result.z = readFloat();
        return result;
    }

    NetworkIdentity readId() {
        return readUInt64();
    }

    // Copies 'count' bytes; on overrun nothing is copied
    std::vector<uint8_t> readBytes(size_t count) {
        if (!consume(count)) return {};
        std::vector<uint8_t> result(buffer + position, buffer + position + count);
        position += count;
        return result;
    }

    // Consumes 'count' bytes and returns a pointer into the packet, nullptr on overrun
    const uint8_t* readRaw(size_t count) {
        if (!consume(count)) return nullptr;
        const uint8_t* result = buffer + position;
        position += count;
        return result;
    }

    size_t getPosition() const {
        return position;
    }

    size_t getSize() const {
        return buffer_size;
    }

    size_t remaining() const {
        return buffer_size - position;
    }

    bool canRead(size_t num_bytes) const {
        return !error_state && num_bytes <= buffer_size - position;
    }
};

} // namespace Spraynet
