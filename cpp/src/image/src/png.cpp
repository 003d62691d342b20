#include "pngmsg/image/png.hpp"

#include <algorithm>
#include <format>

#include <png.h>


namespace {

    // Byte count of the chunk starting at `data`, clamped to `remaining` so
    // that truncation is reported by Chunk::parse.
    size_t chunk_span(const uint8_t* data, const size_t remaining) {
        if (remaining < pngmsg::Chunk::NON_DATA_SIZE)
            return remaining;

        const uint64_t declared = uint64_t(pngmsg::read_u32_be(data)) +
                                  pngmsg::Chunk::NON_DATA_SIZE;
        return static_cast<size_t>(std::min<uint64_t>(declared, remaining));
    }

}  // namespace


// PngError
namespace pngmsg {

    std::string PngError::to_str() const {
        switch (kind_) {
            case Kind::signature_mismatch:
                return "Not a PNG file (signature mismatch)";
            case Kind::chunk:
                return std::format(
                    "Failed to parse chunk: {}",
                    chunk_error_ ? chunk_error_->to_str() : "unknown"
                );
            case Kind::chunk_type:
                return std::format(
                    "Invalid chunk type: {}",
                    type_error_ ? pngmsg::to_str(*type_error_) : "unknown"
                );
            case Kind::chunk_not_found:
                return "Chunk not found";
        }
        return "Unknown PNG error";
    }

}  // namespace pngmsg


// Png
namespace pngmsg {

    Png::Png(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

    Png::Expected Png::parse(const uint8_t* data, const size_t size) {
        // libpng only compares the bytes it is given
        if (size < SIGNATURE.size() ||
            0 != png_sig_cmp(data, 0, SIGNATURE.size())) {
            return std::unexpected(
                PngError{ PngError::Kind::signature_mismatch }
            );
        }

        std::vector<Chunk> chunks;
        size_t cursor = SIGNATURE.size();

        while (cursor < size) {
            const auto span = ::chunk_span(data + cursor, size - cursor);

            auto exp_chunk = Chunk::parse(data + cursor, span);
            if (!exp_chunk) {
                return std::unexpected(
                    PngError{ PngError::Kind::chunk, exp_chunk.error() }
                );
            }

            chunks.push_back(std::move(*exp_chunk));
            cursor += span;
        }

        return Png{ std::move(chunks) };
    }

    Png::Expected Png::parse(const std::vector<uint8_t>& bytes) {
        return Png::parse(bytes.data(), bytes.size());
    }

    void Png::append_chunk(Chunk chunk) { chunks_.push_back(std::move(chunk)); }

    std::expected<Chunk, PngError> Png::remove_chunk(
        const std::string_view type_str
    ) {
        const auto exp_type = ChunkType::from_str(type_str);
        if (!exp_type) {
            PngError err{ PngError::Kind::chunk_type };
            err.type_error_ = exp_type.error();
            return std::unexpected(err);
        }

        const auto it = std::find_if(
            chunks_.begin(),
            chunks_.end(),
            [&](const Chunk& c) { return c.chunk_type() == *exp_type; }
        );
        if (it == chunks_.end())
            return std::unexpected(PngError{ PngError::Kind::chunk_not_found });

        auto removed = std::move(*it);
        chunks_.erase(it);
        return removed;
    }

    const Chunk* Png::chunk_by_type(const std::string_view type_str) const {
        const auto exp_type = ChunkType::from_str(type_str);
        if (!exp_type)
            return nullptr;

        for (const auto& chunk : chunks_) {
            if (chunk.chunk_type() == *exp_type)
                return &chunk;
        }
        return nullptr;
    }

    std::vector<uint8_t> Png::serialize() const {
        size_t total_size = SIGNATURE.size();
        for (const auto& chunk : chunks_)
            total_size += Chunk::NON_DATA_SIZE + chunk.data().size();

        std::vector<uint8_t> output;
        output.reserve(total_size);
        output.insert(output.end(), SIGNATURE.begin(), SIGNATURE.end());

        for (const auto& chunk : chunks_)
            chunk.serialize(output);

        return output;
    }

    std::string Png::to_str() const {
        std::string output = "Signature: [";
        for (size_t i = 0; i < SIGNATURE.size(); ++i) {
            if (i > 0)
                output += ", ";
            output += std::format("{}", SIGNATURE[i]);
        }
        output += "]\n";

        for (const auto& chunk : chunks_) {
            output += chunk.to_str();
            output += '\n';
        }

        return output;
    }

}  // namespace pngmsg
