// GemGame Protocol
// byte_buffer.hpp - Little-endian binary writer and reader

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gemgame::protocol {

// Appends little-endian integers to a growable buffer
class ByteWriter {
public:
    ByteWriter() = default;

    void write_u8(uint8_t value);
    void write_u16(uint16_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_i32(int32_t value);
    void write_f32(float value);
    void write_bool(bool value);
    void write_bytes(std::span<const uint8_t> bytes);
    // u32 length prefix followed by the raw bytes
    void write_blob(std::span<const uint8_t> bytes);
    void write_string(std::string_view value);

    [[nodiscard]] const std::vector<uint8_t>& data() const { return buffer_; }
    [[nodiscard]] size_t size() const { return buffer_.size(); }
    [[nodiscard]] std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

// Reads little-endian integers from a borrowed buffer.
//
// A read past the end yields zero and puts the reader into the failed state,
// which sticks. Callers decode a whole structure and check ok() once.
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] uint8_t read_u8();
    [[nodiscard]] uint16_t read_u16();
    [[nodiscard]] uint32_t read_u32();
    [[nodiscard]] uint64_t read_u64();
    [[nodiscard]] int32_t read_i32();
    [[nodiscard]] float read_f32();
    [[nodiscard]] bool read_bool();
    [[nodiscard]] std::vector<uint8_t> read_blob();
    [[nodiscard]] std::string read_string();

    [[nodiscard]] bool ok() const { return !failed_; }
    [[nodiscard]] size_t remaining() const { return data_.size() - position_; }
    [[nodiscard]] bool at_end() const { return position_ == data_.size(); }
    [[nodiscard]] size_t position() const { return position_; }

    // Marks the reader failed, used when a decoded value is out of range
    void fail() { failed_ = true; }

private:
    [[nodiscard]] bool require(size_t count);

    std::span<const uint8_t> data_;
    size_t position_ = 0;
    bool failed_ = false;
};

}  // namespace gemgame::protocol
