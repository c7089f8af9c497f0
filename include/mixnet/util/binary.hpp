#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace mixnet::util {

enum class WireError {
    Truncated,
    InvalidLength,
    TrailingData,
    InvalidValue,
};

[[nodiscard]] constexpr const char* wire_error_name(WireError err) {
    switch (err) {
        case WireError::Truncated: return "Truncated";
        case WireError::InvalidLength: return "InvalidLength";
        case WireError::TrailingData: return "TrailingData";
        case WireError::InvalidValue: return "InvalidValue";
        default: return "Unknown";
    }
}

// Big-endian cursor over a borrowed buffer
class BinaryReader {
public:
    explicit BinaryReader(std::span<const uint8_t> data) : data_(data) {}

    template <typename T>
        requires std::is_unsigned_v<T>
    [[nodiscard]] std::expected<T, WireError> read() {
        if (remaining() < sizeof(T)) {
            return std::unexpected(WireError::Truncated);
        }
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value = static_cast<T>((value << 8) | data_[pos_ + i]);
        }
        pos_ += sizeof(T);
        return value;
    }

    [[nodiscard]] std::expected<uint8_t, WireError> read_u8() { return read<uint8_t>(); }
    [[nodiscard]] std::expected<uint16_t, WireError> read_u16() { return read<uint16_t>(); }
    [[nodiscard]] std::expected<uint32_t, WireError> read_u32() { return read<uint32_t>(); }
    [[nodiscard]] std::expected<uint64_t, WireError> read_u64() { return read<uint64_t>(); }

    template <size_t N>
    [[nodiscard]] std::expected<std::array<uint8_t, N>, WireError> read_array() {
        std::array<uint8_t, N> out{};
        if (remaining() < N) {
            return std::unexpected(WireError::Truncated);
        }
        std::memcpy(out.data(), data_.data() + pos_, N);
        pos_ += N;
        return out;
    }

    [[nodiscard]] std::expected<std::span<const uint8_t>, WireError> read_span(size_t count) {
        if (remaining() < count) {
            return std::unexpected(WireError::Truncated);
        }
        auto out = data_.subspan(pos_, count);
        pos_ += count;
        return out;
    }

    [[nodiscard]] std::expected<std::vector<uint8_t>, WireError> read_bytes(size_t count) {
        auto s = read_span(count);
        if (!s) return std::unexpected(s.error());
        return std::vector<uint8_t>(s->begin(), s->end());
    }

    [[nodiscard]] std::expected<std::string, WireError> read_u8_string() {
        auto len = read_u8();
        if (!len) return std::unexpected(len.error());
        auto s = read_span(*len);
        if (!s) return std::unexpected(s.error());
        return std::string(s->begin(), s->end());
    }

    [[nodiscard]] std::expected<std::vector<uint8_t>, WireError> read_u16_prefixed() {
        auto len = read_u16();
        if (!len) return std::unexpected(len.error());
        return read_bytes(*len);
    }

    [[nodiscard]] std::expected<void, WireError> expect_end() const {
        if (!at_end()) return std::unexpected(WireError::TrailingData);
        return {};
    }

    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }
    [[nodiscard]] bool at_end() const { return pos_ >= data_.size(); }
    [[nodiscard]] std::span<const uint8_t> rest() const { return data_.subspan(pos_); }

private:
    std::span<const uint8_t> data_;
    size_t pos_{0};
};

class BinaryWriter {
public:
    BinaryWriter() = default;
    explicit BinaryWriter(size_t reserve) { buffer_.reserve(reserve); }

    template <typename T>
        requires std::is_unsigned_v<T>
    void write(T value) {
        for (size_t i = sizeof(T); i-- > 0;) {
            buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    void write_u8(uint8_t v) { write<uint8_t>(v); }
    void write_u16(uint16_t v) { write<uint16_t>(v); }
    void write_u32(uint32_t v) { write<uint32_t>(v); }
    void write_u64(uint64_t v) { write<uint64_t>(v); }

    void write_bytes(std::span<const uint8_t> data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    // Truncates to 255 bytes
    void write_u8_string(const std::string& s) {
        auto len = s.size() > 255 ? size_t{255} : s.size();
        write_u8(static_cast<uint8_t>(len));
        buffer_.insert(buffer_.end(), s.begin(), s.begin() + static_cast<std::ptrdiff_t>(len));
    }

    void write_u16_prefixed(std::span<const uint8_t> data) {
        write_u16(static_cast<uint16_t>(data.size()));
        write_bytes(data);
    }

    void write_zeros(size_t count) { buffer_.insert(buffer_.end(), count, 0); }

    [[nodiscard]] const std::vector<uint8_t>& data() const { return buffer_; }
    [[nodiscard]] std::vector<uint8_t> take() { return std::move(buffer_); }
    [[nodiscard]] size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

}  // namespace mixnet::util
