#include "pngmsg/image/chunk.hpp"

#include <format>
#include <utility>

#include <zlib.h>


namespace {

    void write_u32_be(const uint32_t value, std::vector<uint8_t>& out) {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    // Returns the offset of the first ill-formed sequence, or `size` if the
    // whole buffer is well-formed UTF-8 (RFC 3629).
    size_t find_invalid_utf8(const uint8_t* data, const size_t size) {
        size_t i = 0;

        while (i < size) {
            const auto lead = data[i];

            if (lead < 0x80) {
                ++i;
                continue;
            }

            size_t seq_len = 0;
            uint8_t lo = 0x80;
            uint8_t hi = 0xBF;

            if (lead >= 0xC2 && lead <= 0xDF) {
                seq_len = 2;
            } else if (lead == 0xE0) {
                seq_len = 3;
                lo = 0xA0;  // Overlong
            } else if (lead >= 0xE1 && lead <= 0xEC) {
                seq_len = 3;
            } else if (lead == 0xED) {
                seq_len = 3;
                hi = 0x9F;  // Surrogates
            } else if (lead >= 0xEE && lead <= 0xEF) {
                seq_len = 3;
            } else if (lead == 0xF0) {
                seq_len = 4;
                lo = 0x90;  // Overlong
            } else if (lead >= 0xF1 && lead <= 0xF3) {
                seq_len = 4;
            } else if (lead == 0xF4) {
                seq_len = 4;
                hi = 0x8F;  // Above U+10FFFF
            } else {
                return i;
            }

            if (size - i < seq_len)
                return i;

            const auto second = data[i + 1];
            if (second < lo || second > hi)
                return i;

            for (size_t k = 2; k < seq_len; ++k) {
                const auto cont = data[i + k];
                if (cont < 0x80 || cont > 0xBF)
                    return i;
            }

            i += seq_len;
        }

        return size;
    }

}  // namespace


// ChunkError
namespace pngmsg {

    std::string ChunkError::to_str() const {
        switch (kind_) {
            case Kind::bad_len:
                return "Too few bytes to parse as a chunk";
            case Kind::bad_data_len:
                return "Data length does not match header";
            case Kind::chunk_type:
                return std::format(
                    "Invalid chunk type: {}",
                    type_error_ ? pngmsg::to_str(*type_error_) : "unknown"
                );
            case Kind::bad_crc:
                return "CRC mismatch";
            case Kind::invalid_utf8:
                return std::format(
                    "Chunk data is not valid UTF-8 (invalid sequence at byte "
                    "{})",
                    utf8_valid_up_to_
                );
        }
        return "Unknown chunk error";
    }

}  // namespace pngmsg


// Chunk
namespace pngmsg {

    Chunk::Chunk(const ChunkType& chunk_type, std::vector<uint8_t> data)
        : length_(static_cast<uint32_t>(data.size()))
        , chunk_type_(chunk_type)
        , data_(std::move(data))
        , crc_(calc_chunk_crc(
              chunk_type_.bytes(), data_.data(), data_.size()
          )) {}

    Chunk::Chunk(
        const uint32_t length,
        const ChunkType& chunk_type,
        std::vector<uint8_t> data,
        const uint32_t crc
    )
        : length_(length)
        , chunk_type_(chunk_type)
        , data_(std::move(data))
        , crc_(crc) {}

    Chunk::Expected Chunk::parse(const uint8_t* data, const size_t size) {
        if (size < NON_DATA_SIZE)
            return std::unexpected(ChunkError{ ChunkError::Kind::bad_len });

        const auto length = read_u32_be(data);
        if (length != size - NON_DATA_SIZE) {
            return std::unexpected(
                ChunkError{ ChunkError::Kind::bad_data_len }
            );
        }

        const auto type_ptr = data + LENGTH_FIELD_SIZE;
        const auto exp_type = ChunkType::from_slice(type_ptr, TYPE_FIELD_SIZE);
        if (!exp_type) {
            return std::unexpected(
                ChunkError{ ChunkError::Kind::chunk_type, exp_type.error() }
            );
        }

        const auto data_ptr = type_ptr + TYPE_FIELD_SIZE;
        const auto crc = read_u32_be(data + size - CRC_FIELD_SIZE);

        const auto crc_calculated = calc_chunk_crc(
            exp_type->bytes(), data_ptr, length
        );
        if (crc != crc_calculated)
            return std::unexpected(ChunkError{ ChunkError::Kind::bad_crc });

        return Chunk{
            length,
            *exp_type,
            std::vector<uint8_t>(data_ptr, data_ptr + length),
            crc,
        };
    }

    Chunk::Expected Chunk::parse(const std::vector<uint8_t>& bytes) {
        return Chunk::parse(bytes.data(), bytes.size());
    }

    std::expected<std::string, ChunkError> Chunk::data_as_str() const {
        const auto invalid_at = ::find_invalid_utf8(data_.data(), data_.size());
        if (invalid_at != data_.size()) {
            ChunkError err{ ChunkError::Kind::invalid_utf8 };
            err.utf8_valid_up_to_ = invalid_at;
            return std::unexpected(err);
        }

        return std::string(data_.begin(), data_.end());
    }

    std::vector<uint8_t> Chunk::serialize() const {
        std::vector<uint8_t> output;
        output.reserve(NON_DATA_SIZE + data_.size());
        this->serialize(output);
        return output;
    }

    void Chunk::serialize(std::vector<uint8_t>& out) const {
        const auto& type_bytes = chunk_type_.bytes();

        ::write_u32_be(length_, out);
        out.insert(out.end(), type_bytes.begin(), type_bytes.end());
        out.insert(out.end(), data_.begin(), data_.end());
        ::write_u32_be(crc_, out);
    }

    std::string Chunk::to_str() const {
        std::string data_hex;
        for (size_t i = 0; i < data_.size(); ++i) {
            if (i > 0)
                data_hex += ", ";
            data_hex += std::format("{:x}", data_[i]);
        }

        return std::format(
            "Length: {}, Type: {}, Data: [{}], CRC: {:x}",
            length_,
            chunk_type_.to_str(),
            data_hex,
            crc_
        );
    }

}  // namespace pngmsg


// Free functions
namespace pngmsg {

    uint32_t read_u32_be(const uint8_t* p) {
        return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
               (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    }

    uint32_t calc_chunk_crc(
        const ChunkType::Bytes& type_bytes,
        const uint8_t* data,
        const size_t size
    ) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(
            crc, type_bytes.data(), static_cast<uInt>(type_bytes.size())
        );

        // zlib treats a null buffer as a request for the initial value
        if (size > 0)
            crc = crc32_z(crc, data, size);

        return static_cast<uint32_t>(crc);
    }

}  // namespace pngmsg
