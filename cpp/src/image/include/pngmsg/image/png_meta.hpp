#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>


namespace pngmsg {

    struct PngMeta {
        struct TextKV {
            std::string key;
            std::string value;
        };

        const TextKV* find_text_chunk(const std::string& key) const {
            for (const auto& kv : text) {
                if (kv.key == key)
                    return &kv;
            }
            return nullptr;
        }

        uint32_t width = 0;
        uint32_t height = 0;
        int bit_depth = 0;
        int color_type = 0;
        int interlace = 0;
        // Only text chunks located before the first IDAT
        std::vector<TextKV> text;
    };


    const char* color_type_name(int color_type);

    std::expected<PngMeta, std::string> read_png_meta(
        const uint8_t* data, size_t size
    );

}  // namespace pngmsg
