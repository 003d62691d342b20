#include <string>
#include <vector>

#include "check.hpp"
#include "pngmsg/auxiliary/filesys.hpp"
#include "pngmsg/image/png.hpp"
#include "pngmsg/image/png_meta.hpp"


namespace {

    pngmsg::Chunk make_chunk(const char* type, const std::string& data) {
        return pngmsg::Chunk{
            pngmsg::ChunkType::from_str(type).value(),
            std::vector<uint8_t>(data.begin(), data.end()),
        };
    }

    pngmsg::Png testing_png() {
        std::vector<pngmsg::Chunk> chunks;
        chunks.push_back(::make_chunk("FrSt", "I am the first chunk"));
        chunks.push_back(::make_chunk("miDl", "I am another chunk"));
        chunks.push_back(::make_chunk("LASt", "I am the last chunk"));
        return pngmsg::Png{ std::move(chunks) };
    }

    std::vector<uint8_t> with_signature(const std::vector<uint8_t>& body) {
        std::vector<uint8_t> out(
            pngmsg::Png::SIGNATURE.begin(), pngmsg::Png::SIGNATURE.end()
        );
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }

    void test_empty(pngmsg::test::Checker& t) {
        const pngmsg::Png png;
        t.check(png.chunks().empty(), "new png has no chunks");

        const auto bytes = png.serialize();
        t.check(bytes.size() == 8, "empty png is only the signature");

        const auto res = pngmsg::Png::parse(bytes);
        t.check(
            res.has_value() && res->chunks().empty(),
            "signature alone parses"
        );
    }

    void test_round_trip(pngmsg::test::Checker& t) {
        const auto png = ::testing_png();
        const auto bytes = png.serialize();

        const auto res = pngmsg::Png::parse(bytes);
        if (!t.check(res.has_value(), "serialized png parses"))
            return;

        t.check(res->chunks() == png.chunks(), "chunks and order preserved");
        t.check(res->serialize() == bytes, "byte exact round trip");
    }

    void test_encode_decode(pngmsg::test::Checker& t) {
        pngmsg::Png png;
        png.append_chunk(::make_chunk("teSt", "hello"));

        const auto res = pngmsg::Png::parse(png.serialize());
        if (!t.check(res.has_value(), "png with message parses"))
            return;

        const auto chunk = res->chunk_by_type("teSt");
        if (!t.check(chunk != nullptr, "message chunk is found"))
            return;

        const auto text = chunk->data_as_str();
        t.check(text.has_value() && *text == "hello", "message text");
    }

    void test_append(pngmsg::test::Checker& t) {
        auto png = ::testing_png();
        png.append_chunk(::make_chunk("TeSt", "Message"));

        t.check(png.chunks().size() == 4, "appended");
        t.check(
            png.chunks().back().chunk_type().to_str() == "TeSt",
            "appended at the end"
        );
    }

    void test_chunk_by_type(pngmsg::test::Checker& t) {
        const auto png = ::testing_png();

        const auto chunk = png.chunk_by_type("FrSt");
        t.check(
            chunk && chunk->data_as_str().value() == "I am the first chunk",
            "finds chunk by type"
        );

        t.check(png.chunk_by_type("nOPe") == nullptr, "absent type");
        t.check(png.chunk_by_type("Fr5t") == nullptr, "ill-formed type");
        t.check(png.chunk_by_type("FrStX") == nullptr, "too long type");
    }

    void test_remove(pngmsg::test::Checker& t) {
        using Kind = pngmsg::PngError::Kind;

        auto png = ::testing_png();
        const auto removed = png.remove_chunk("miDl");
        t.check(
            removed.has_value() && removed->chunk_type().to_str() == "miDl",
            "removed chunk is returned"
        );
        t.check(png.chunks().size() == 2, "one chunk removed");
        t.check(png.chunk_by_type("miDl") == nullptr, "no longer present");

        const auto missing = png.remove_chunk("miDl");
        t.check(
            !missing && missing.error().kind_ == Kind::chunk_not_found,
            "removing an absent type fails"
        );

        const auto invalid = png.remove_chunk("m1Dl");
        t.check(
            !invalid && invalid.error().kind_ == Kind::chunk_type &&
                invalid.error().type_error_ ==
                    pngmsg::ChunkTypeError::byte_out_of_range,
            "removing an ill-formed type fails"
        );
        t.check(png.chunks().size() == 2, "failed removals change nothing");
    }

    void test_remove_first_duplicate(pngmsg::test::Checker& t) {
        std::vector<pngmsg::Chunk> chunks;
        chunks.push_back(::make_chunk("IHDR", "header"));
        chunks.push_back(::make_chunk("ruSt", "first"));
        chunks.push_back(::make_chunk("abCd", "middle"));
        chunks.push_back(::make_chunk("ruSt", "second"));
        chunks.push_back(::make_chunk("IEND", ""));
        pngmsg::Png png{ std::move(chunks) };

        const auto removed = png.remove_chunk("ruSt");
        t.check(
            removed.has_value() && removed->data_as_str().value() == "first",
            "first duplicate removed"
        );

        std::vector<std::string> order;
        for (const auto& chunk : png.chunks())
            order.push_back(chunk.data_as_str().value());

        const std::vector<std::string> expected{
            "header", "middle", "second", ""
        };
        t.check(order == expected, "other chunks keep their order");
    }

    void test_signature_mismatch(pngmsg::test::Checker& t) {
        using Kind = pngmsg::PngError::Kind;

        auto bytes = ::testing_png().serialize();
        bytes[0] = 0x88;

        const auto res = pngmsg::Png::parse(bytes);
        t.check(
            !res && res.error().kind_ == Kind::signature_mismatch,
            "wrong signature"
        );

        const std::vector<uint8_t> short_buf{ 137, 80, 78, 71 };
        const auto res_short = pngmsg::Png::parse(short_buf);
        t.check(
            !res_short && res_short.error().kind_ == Kind::signature_mismatch,
            "buffer shorter than the signature"
        );

        const auto res_empty = pngmsg::Png::parse(nullptr, 0);
        t.check(
            !res_empty && res_empty.error().kind_ == Kind::signature_mismatch,
            "empty buffer"
        );
    }

    void test_truncated(pngmsg::test::Checker& t) {
        using Kind = pngmsg::PngError::Kind;
        using ChunkKind = pngmsg::ChunkError::Kind;

        const auto bytes = ::testing_png().serialize();

        {
            // Ends inside the last chunk's data
            const std::vector<uint8_t> cut(bytes.begin(), bytes.end() - 6);
            const auto res = pngmsg::Png::parse(cut);
            t.check(
                !res && res.error().kind_ == Kind::chunk &&
                    res.error().chunk_error_->kind_ == ChunkKind::bad_data_len,
                "truncated data"
            );
        }

        {
            // Trailing bytes too few for a chunk header
            auto extra = bytes;
            extra.push_back(0);
            extra.push_back(0);
            const auto res = pngmsg::Png::parse(extra);
            t.check(
                !res && res.error().kind_ == Kind::chunk &&
                    res.error().chunk_error_->kind_ == ChunkKind::bad_len,
                "trailing garbage"
            );
        }

        {
            auto corrupt = bytes;
            corrupt[8 + 8] ^= 0x01;  // First data byte of the first chunk
            const auto res = pngmsg::Png::parse(corrupt);
            t.check(
                !res && res.error().kind_ == Kind::chunk &&
                    res.error().chunk_error_->kind_ == ChunkKind::bad_crc,
                "corrupted chunk aborts parsing"
            );
        }

        {
            // Declared length far beyond the buffer
            std::vector<uint8_t> body{ 0xFF, 0xFF, 0xFF, 0xFF, 'a', 'b', 'C',
                                       'd',  0,    0,    0,    0 };
            const auto res = pngmsg::Png::parse(::with_signature(body));
            t.check(
                !res && res.error().chunk_error_ &&
                    res.error().chunk_error_->kind_ == ChunkKind::bad_data_len,
                "oversized length"
            );
        }
    }

    void test_to_str(pngmsg::test::Checker& t) {
        const auto text = ::testing_png().to_str();
        t.check(
            text.starts_with("Signature: [137, 80, 78, 71, 13, 10, 26, 10]"),
            "shows signature"
        );
        t.check(text.find("Type: FrSt") != std::string::npos, "first chunk");
        t.check(text.find("Type: LASt") != std::string::npos, "last chunk");
    }

    void test_fixture(pngmsg::test::Checker& t) {
        const auto png_path = pngmsg::test::fixture_dir() / "tiny.png";

        std::vector<uint8_t> file_content;
        const auto read_ok = pngmsg::read_file(png_path, file_content);
        if (!t.check(read_ok, "read fixture"))
            return;

        const auto res = pngmsg::Png::parse(file_content);
        if (!t.check(res.has_value(), "fixture parses"))
            return;

        std::vector<std::string> types;
        for (const auto& chunk : res->chunks())
            types.push_back(chunk.chunk_type().to_str());

        const std::vector<std::string> expected{
            "IHDR", "tEXt", "IDAT", "IEND"
        };
        t.check(types == expected, "fixture chunk order");
        t.check(res->serialize() == file_content, "fixture round trip");

        const auto meta = pngmsg::read_png_meta(
            file_content.data(), file_content.size()
        );
        if (!t.check(meta.has_value(), "fixture header readable"))
            return;

        t.check(meta->width == 4 && meta->height == 3, "fixture size");
        t.check(meta->bit_depth == 8, "fixture bit depth");
        t.check(
            std::string(pngmsg::color_type_name(meta->color_type)) ==
                "Truecolor",
            "fixture color type"
        );

        const auto comment = meta->find_text_chunk("Comment");
        t.check(
            comment && comment->value == "pngmsg fixture", "fixture text chunk"
        );
    }

    void test_meta_rejects_garbage(pngmsg::test::Checker& t) {
        const std::vector<uint8_t> garbage{ 'n', 'o', 't', ' ', 'p', 'n', 'g',
                                            '!', 0,   0 };
        const auto meta = pngmsg::read_png_meta(garbage.data(), garbage.size());
        t.check(!meta.has_value(), "header reader rejects non-PNG");

        // Signature only, libpng runs out of input before IHDR
        const auto sig_only = pngmsg::Png{}.serialize();
        const auto meta_sig = pngmsg::read_png_meta(
            sig_only.data(), sig_only.size()
        );
        t.check(!meta_sig.has_value(), "header reader needs IHDR");

        // IHDR cut in the middle of its data
        std::vector<uint8_t> file_content;
        const auto png_path = pngmsg::test::fixture_dir() / "tiny.png";
        if (!t.check(pngmsg::read_file(png_path, file_content), "read fixture"))
            return;

        const std::vector<uint8_t> cut(
            file_content.begin(), file_content.begin() + 8 + 8 + 6
        );
        const auto meta_cut = pngmsg::read_png_meta(cut.data(), cut.size());
        t.check(
            !meta_cut.has_value() &&
                meta_cut.error().find("end of PNG data") != std::string::npos,
            "truncated IHDR is reported"
        );
    }

}  // namespace


int main() {
    pngmsg::test::Checker t;

    ::test_empty(t);
    ::test_round_trip(t);
    ::test_encode_decode(t);
    ::test_append(t);
    ::test_chunk_by_type(t);
    ::test_remove(t);
    ::test_remove_first_duplicate(t);
    ::test_signature_mismatch(t);
    ::test_truncated(t);
    ::test_to_str(t);
    ::test_fixture(t);
    ::test_meta_rejects_garbage(t);

    return t.finish("png");
}
