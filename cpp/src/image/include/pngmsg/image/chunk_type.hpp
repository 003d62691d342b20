#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>


namespace pngmsg {

    enum class ChunkTypeError {
        byte_out_of_range,
        bad_len,
    };

    const char* to_str(ChunkTypeError err);


    /*
    Four ASCII letters identifying a PNG chunk. Bit 5 of each byte carries a
    property flag, see https://www.w3.org/TR/png/#5Chunk-naming-conventions
    */
    class ChunkType {

    public:
        using Bytes = std::array<uint8_t, 4>;
        using Expected = std::expected<ChunkType, ChunkTypeError>;

        static constexpr size_t SIZE = 4;

    public:
        static Expected from_bytes(const Bytes& bytes);
        static Expected from_slice(const uint8_t* data, size_t size);
        static Expected from_str(std::string_view str);

        const Bytes& bytes() const { return bytes_; }
        std::string to_str() const;

        bool is_critical() const;
        bool is_public() const;
        bool is_reserved_bit_valid() const;
        bool is_safe_to_copy() const;

        // Only the reserved bit decides validity
        bool is_valid() const { return this->is_reserved_bit_valid(); }

        bool operator==(const ChunkType& rhs) const = default;

    private:
        explicit ChunkType(const Bytes& bytes) : bytes_(bytes) {}

        Bytes bytes_;
    };

}  // namespace pngmsg


template <>
struct std::hash<pngmsg::ChunkType> {
    size_t operator()(const pngmsg::ChunkType& t) const noexcept {
        const auto& b = t.bytes();
        const uint32_t packed = (uint32_t(b[0]) << 24) |
                                (uint32_t(b[1]) << 16) |
                                (uint32_t(b[2]) << 8) | uint32_t(b[3]);
        return std::hash<uint32_t>{}(packed);
    }
};
