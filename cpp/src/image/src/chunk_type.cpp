#include "pngmsg/image/chunk_type.hpp"


namespace {

    constexpr uint8_t PROPERTY_BIT_MASK = 0x20;

    bool is_ascii_letter(const uint8_t b) {
        return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
    }

    bool is_property_bit_set(const uint8_t b) {
        return (b & PROPERTY_BIT_MASK) != 0;
    }

}  // namespace


namespace pngmsg {

    const char* to_str(const ChunkTypeError err) {
        switch (err) {
            case ChunkTypeError::byte_out_of_range:
                return "Chunk type contains a byte that is not an ASCII "
                       "letter";
            case ChunkTypeError::bad_len:
                return "Chunk type must be exactly 4 bytes";
        }
        return "Unknown chunk type error";
    }

}  // namespace pngmsg


// ChunkType
namespace pngmsg {

    ChunkType::Expected ChunkType::from_bytes(const Bytes& bytes) {
        for (const auto b : bytes) {
            if (!::is_ascii_letter(b))
                return std::unexpected(ChunkTypeError::byte_out_of_range);
        }
        return ChunkType{ bytes };
    }

    ChunkType::Expected ChunkType::from_slice(
        const uint8_t* data, const size_t size
    ) {
        if (size != SIZE)
            return std::unexpected(ChunkTypeError::bad_len);

        return ChunkType::from_bytes({ data[0], data[1], data[2], data[3] });
    }

    ChunkType::Expected ChunkType::from_str(const std::string_view str) {
        return ChunkType::from_slice(
            reinterpret_cast<const uint8_t*>(str.data()), str.size()
        );
    }

    std::string ChunkType::to_str() const {
        return std::string(bytes_.begin(), bytes_.end());
    }

    bool ChunkType::is_critical() const {
        return !::is_property_bit_set(bytes_[0]);
    }

    bool ChunkType::is_public() const {
        return !::is_property_bit_set(bytes_[1]);
    }

    bool ChunkType::is_reserved_bit_valid() const {
        return !::is_property_bit_set(bytes_[2]);
    }

    bool ChunkType::is_safe_to_copy() const {
        return ::is_property_bit_set(bytes_[3]);
    }

}  // namespace pngmsg
