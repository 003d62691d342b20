#include "pngmsg/image/png_meta.hpp"

#include <cstdio>
#include <cstring>
#include <format>

#include <png.h>

#include "pngmsg/image/png.hpp"


namespace {

    struct MemReadContext {
        const uint8_t* data;
        size_t size;
        size_t offset;
        char error_msg[256];
    };


    void read_from_memory(png_structp png_ptr, png_bytep out, size_t size) {
        auto* ctx = static_cast<::MemReadContext*>(png_get_io_ptr(png_ptr));

        if (ctx->size - ctx->offset < size)
            png_error(png_ptr, "Unexpected end of PNG data");

        std::memcpy(out, ctx->data + ctx->offset, size);
        ctx->offset += size;
    }

    [[noreturn]] void record_error(png_structp png_ptr, png_const_charp msg) {
        auto* ctx = static_cast<::MemReadContext*>(png_get_error_ptr(png_ptr));
        std::snprintf(
            ctx->error_msg,
            sizeof(ctx->error_msg),
            "%s",
            msg ? msg : "libpng error"
        );
        png_longjmp(png_ptr, 1);
    }

    // libpng leaves this frame through longjmp on error, so nothing with a
    // destructor may live here
    bool read_header(
        png_structp png_ptr, png_infop info_ptr, pngmsg::PngMeta& out
    ) {
        if (setjmp(png_jmpbuf(png_ptr)))
            return false;

        png_read_info(png_ptr, info_ptr);
        png_get_IHDR(
            png_ptr,
            info_ptr,
            &out.width,
            &out.height,
            &out.bit_depth,
            &out.color_type,
            &out.interlace,
            nullptr,
            nullptr
        );
        return true;
    }


    class ReadStructs {

    public:
        explicit ReadStructs(::MemReadContext& ctx) {
            png_ptr_ = png_create_read_struct(
                PNG_LIBPNG_VER_STRING, &ctx, ::record_error, nullptr
            );
            if (png_ptr_)
                info_ptr_ = png_create_info_struct(png_ptr_);
        }

        ~ReadStructs() {
            if (png_ptr_) {
                png_destroy_read_struct(
                    &png_ptr_, info_ptr_ ? &info_ptr_ : nullptr, nullptr
                );
            }
        }

        ReadStructs(const ReadStructs&) = delete;
        ReadStructs& operator=(const ReadStructs&) = delete;

        bool is_ready() const { return png_ptr_ && info_ptr_; }
        png_structp png() const { return png_ptr_; }
        png_infop info() const { return info_ptr_; }

    private:
        png_structp png_ptr_ = nullptr;
        png_infop info_ptr_ = nullptr;
    };

}  // namespace


namespace pngmsg {

    const char* color_type_name(const int color_type) {
        switch (color_type) {
            case PNG_COLOR_TYPE_GRAY:
                return "Grayscale";
            case PNG_COLOR_TYPE_RGB:
                return "Truecolor";
            case PNG_COLOR_TYPE_PALETTE:
                return "Indexed-color";
            case PNG_COLOR_TYPE_GRAY_ALPHA:
                return "Grayscale with alpha";
            case PNG_COLOR_TYPE_RGB_ALPHA:
                return "Truecolor with alpha";
            default:
                return "Unknown";
        }
    }

    std::expected<PngMeta, std::string> read_png_meta(
        const uint8_t* data, size_t size
    ) {
        constexpr auto sig_size = Png::SIGNATURE.size();
        if (size < sig_size || png_sig_cmp(data, 0, sig_size))
            return std::unexpected("Not a PNG file");

        ::MemReadContext ctx{ data, size, sig_size, {} };
        ::ReadStructs structs{ ctx };
        if (!structs.is_ready())
            return std::unexpected("Failed to create libpng read structs");

        png_set_read_fn(structs.png(), &ctx, ::read_from_memory);
        png_set_sig_bytes(structs.png(), static_cast<int>(sig_size));

        PngMeta meta;
        if (!::read_header(structs.png(), structs.info(), meta)) {
            return std::unexpected(
                std::format("Failed to read PNG header: {}", ctx.error_msg)
            );
        }

        png_textp text_ptr = nullptr;
        int num_text = 0;
        png_get_text(structs.png(), structs.info(), &text_ptr, &num_text);

        meta.text.reserve(static_cast<size_t>(num_text));
        for (int i = 0; i < num_text; ++i) {
            meta.text.push_back({
                text_ptr[i].key ? text_ptr[i].key : "",
                text_ptr[i].text ? text_ptr[i].text : "",
            });
        }

        return meta;
    }

}  // namespace pngmsg
