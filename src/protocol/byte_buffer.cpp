// GemGame Protocol
// byte_buffer.cpp - Little-endian binary writer and reader

#include <gemgame/protocol/byte_buffer.hpp>

#include <cstring>

namespace gemgame::protocol {

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::write_u16(uint16_t value) {
    buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void ByteWriter::write_u32(uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::write_u64(uint64_t value) {
    for (int shift = 0; shift < 64; shift += 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::write_i32(int32_t value) {
    write_u32(static_cast<uint32_t>(value));
}

void ByteWriter::write_f32(float value) {
    uint32_t bits = 0;
    static_assert(sizeof(bits) == sizeof(value));
    std::memcpy(&bits, &value, sizeof(bits));
    write_u32(bits);
}

void ByteWriter::write_bool(bool value) {
    write_u8(value ? 1 : 0);
}

void ByteWriter::write_bytes(std::span<const uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::write_blob(std::span<const uint8_t> bytes) {
    write_u32(static_cast<uint32_t>(bytes.size()));
    write_bytes(bytes);
}

void ByteWriter::write_string(std::string_view value) {
    write_blob(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size()));
}

// ============================================================================
// ByteReader
// ============================================================================

bool ByteReader::require(size_t count) {
    if (failed_ || remaining() < count) {
        failed_ = true;
        return false;
    }
    return true;
}

uint8_t ByteReader::read_u8() {
    if (!require(1)) {
        return 0;
    }
    return data_[position_++];
}

uint16_t ByteReader::read_u16() {
    if (!require(2)) {
        return 0;
    }
    uint16_t value = static_cast<uint16_t>(data_[position_]) | static_cast<uint16_t>(data_[position_ + 1] << 8);
    position_ += 2;
    return value;
}

uint32_t ByteReader::read_u32() {
    if (!require(4)) {
        return 0;
    }
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data_[position_ + i]) << (8 * i);
    }
    position_ += 4;
    return value;
}

uint64_t ByteReader::read_u64() {
    if (!require(8)) {
        return 0;
    }
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data_[position_ + i]) << (8 * i);
    }
    position_ += 8;
    return value;
}

int32_t ByteReader::read_i32() {
    return static_cast<int32_t>(read_u32());
}

float ByteReader::read_f32() {
    uint32_t bits = read_u32();
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

bool ByteReader::read_bool() {
    uint8_t value = read_u8();
    if (value > 1) {
        failed_ = true;
        return false;
    }
    return value == 1;
}

std::vector<uint8_t> ByteReader::read_blob() {
    uint32_t length = read_u32();
    if (!require(length)) {
        return {};
    }
    std::vector<uint8_t> bytes(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                               data_.begin() + static_cast<std::ptrdiff_t>(position_ + length));
    position_ += length;
    return bytes;
}

std::string ByteReader::read_string() {
    auto bytes = read_blob();
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace gemgame::protocol
