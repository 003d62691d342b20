#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "pngmsg/image/chunk_type.hpp"


namespace pngmsg {

    struct ChunkError {
        enum class Kind {
            bad_len,       // Fewer bytes than the fixed fields need
            bad_data_len,  // Length field disagrees with the data span
            chunk_type,
            bad_crc,
            invalid_utf8,
        };

        std::string to_str() const;

        bool operator==(const ChunkError& rhs) const = default;

        Kind kind_;
        // Set when kind_ is chunk_type
        std::optional<ChunkTypeError> type_error_;
        // Set when kind_ is invalid_utf8
        size_t utf8_valid_up_to_ = 0;
    };


    class Chunk {

    public:
        using Expected = std::expected<Chunk, ChunkError>;

        static constexpr size_t LENGTH_FIELD_SIZE = 4;
        static constexpr size_t TYPE_FIELD_SIZE = ChunkType::SIZE;
        static constexpr size_t CRC_FIELD_SIZE = 4;
        static constexpr size_t NON_DATA_SIZE = LENGTH_FIELD_SIZE +
                                                TYPE_FIELD_SIZE +
                                                CRC_FIELD_SIZE;

    public:
        Chunk(const ChunkType& chunk_type, std::vector<uint8_t> data);

        // `size` must cover exactly one chunk, no more and no less
        static Expected parse(const uint8_t* data, size_t size);
        static Expected parse(const std::vector<uint8_t>& bytes);

        uint32_t length() const { return length_; }
        const ChunkType& chunk_type() const { return chunk_type_; }
        const std::vector<uint8_t>& data() const { return data_; }
        uint32_t crc() const { return crc_; }

        std::expected<std::string, ChunkError> data_as_str() const;

        std::vector<uint8_t> serialize() const;
        void serialize(std::vector<uint8_t>& out) const;

        std::string to_str() const;

        bool operator==(const Chunk& rhs) const = default;

    private:
        Chunk(
            uint32_t length,
            const ChunkType& chunk_type,
            std::vector<uint8_t> data,
            uint32_t crc
        );

        uint32_t length_;
        ChunkType chunk_type_;
        std::vector<uint8_t> data_;
        uint32_t crc_;
    };


    // Big-endian, as every integer field of a PNG file
    uint32_t read_u32_be(const uint8_t* p);

    // CRC-32/ISO-HDLC over the type bytes followed by the data
    uint32_t calc_chunk_crc(
        const ChunkType::Bytes& type_bytes, const uint8_t* data, size_t size
    );

}  // namespace pngmsg
