#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pngmsg/image/chunk.hpp"


namespace pngmsg {

    struct PngError {
        enum class Kind {
            signature_mismatch,
            chunk,
            chunk_type,
            chunk_not_found,
        };

        std::string to_str() const;

        bool operator==(const PngError& rhs) const = default;

        Kind kind_;
        // Set when kind_ is chunk
        std::optional<ChunkError> chunk_error_;
        // Set when kind_ is chunk_type
        std::optional<ChunkTypeError> type_error_;
    };


    /*
    A PNG file seen as its signature followed by a sequence of chunks.
    Chunk order is file order and is kept as is, duplicated types included.
    Pixel data is never decoded.
    */
    class Png {

    public:
        using Expected = std::expected<Png, PngError>;

        static constexpr std::array<uint8_t, 8> SIGNATURE{
            137, 80, 78, 71, 13, 10, 26, 10
        };

    public:
        Png() = default;
        explicit Png(std::vector<Chunk> chunks);

        static Expected parse(const uint8_t* data, size_t size);
        static Expected parse(const std::vector<uint8_t>& bytes);

        void append_chunk(Chunk chunk);

        // Removes the first chunk of the type only
        std::expected<Chunk, PngError> remove_chunk(std::string_view type_str);

        // An ill-formed `type_str` matches nothing
        const Chunk* chunk_by_type(std::string_view type_str) const;

        const std::vector<Chunk>& chunks() const { return chunks_; }

        std::vector<uint8_t> serialize() const;

        std::string to_str() const;

    private:
        std::vector<Chunk> chunks_;
    };

}  // namespace pngmsg
