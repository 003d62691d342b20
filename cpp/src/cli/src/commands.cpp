#include "commands.hpp"

#include <cstdio>
#include <format>
#include <print>

#include <nlohmann/json.hpp>

#include "pngmsg/auxiliary/filesys.hpp"
#include "pngmsg/image/png_meta.hpp"


namespace {

    const char* const END_CHUNK_TYPE = "IEND";


    void warn_unusual_chunk_type(const pngmsg::ChunkType& chunk_type) {
        if (!chunk_type.is_valid()) {
            std::println(
                stderr,
                "Warning: chunk type '{}' has the reserved bit set, PNG "
                "decoders may reject the file",
                chunk_type.to_str()
            );
        }
        if (chunk_type.is_critical()) {
            std::println(
                stderr,
                "Warning: chunk type '{}' is critical, decoders that do not "
                "know it will refuse to display the image",
                chunk_type.to_str()
            );
        }
    }

    nlohmann::json chunk_to_json(const pngmsg::Chunk& chunk) {
        const auto& type = chunk.chunk_type();

        auto output = nlohmann::json::object();
        output["type"] = type.to_str();
        output["length"] = chunk.length();
        output["crc"] = chunk.crc();
        output["critical"] = type.is_critical();
        output["public"] = type.is_public();
        output["reserved_bit_valid"] = type.is_reserved_bit_valid();
        output["safe_to_copy"] = type.is_safe_to_copy();
        return output;
    }

    nlohmann::json meta_to_json(const pngmsg::PngMeta& meta) {
        auto output = nlohmann::json::object();
        output["width"] = meta.width;
        output["height"] = meta.height;
        output["bit_depth"] = meta.bit_depth;
        output["color_type"] = pngmsg::color_type_name(meta.color_type);
        output["interlace"] = meta.interlace;

        auto text = nlohmann::json::object();
        for (const auto& kv : meta.text) {
            if (!text.contains(kv.key))
                text[kv.key] = kv.value;
        }
        output["text"] = text;

        return output;
    }

    std::string format_chunk_brief(const pngmsg::Chunk& chunk) {
        return std::format(
            "Length: {}, Type: {}, CRC: {:x}",
            chunk.length(),
            chunk.chunk_type().to_str(),
            chunk.crc()
        );
    }

    std::string format_meta(const pngmsg::PngMeta& meta) {
        std::string output = std::format(
            "Image: {}x{}, bit depth {}, {}, {}\n",
            meta.width,
            meta.height,
            meta.bit_depth,
            pngmsg::color_type_name(meta.color_type),
            meta.interlace ? "interlaced" : "non-interlaced"
        );

        for (const auto& kv : meta.text)
            output += std::format("Text: {} = {}\n", kv.key, kv.value);

        return output;
    }

}  // namespace


namespace pngmsg {

    std::expected<Png, std::string> load_png(const Path& path) {
        std::vector<uint8_t> file_content;
        if (!read_file(path, file_content))
            return std::unexpected("Failed to read file: " + tostr(path));

        auto exp_png = Png::parse(file_content);
        if (!exp_png) {
            return std::unexpected(
                std::format("{}: {}", tostr(path), exp_png.error().to_str())
            );
        }

        return std::move(*exp_png);
    }

    ErrStr save_png(const Path& path, const Png& png) {
        if (!write_file(path, png.serialize()))
            return std::unexpected("Failed to write file: " + tostr(path));
        return {};
    }

    ErrStr run_encode(const CliArgs& args, const AppConfigs& configs) {
        const auto exp_type = ChunkType::from_str(args.chunk_type_);
        if (!exp_type) {
            return std::unexpected(
                std::format("Invalid chunk type: {}", to_str(exp_type.error()))
            );
        }

        if (configs.warn_unsafe_chunk_type_)
            ::warn_unusual_chunk_type(*exp_type);

        auto exp_png = load_png(args.input_path_);
        if (!exp_png)
            return std::unexpected(exp_png.error());
        auto& png = *exp_png;

        const std::vector<uint8_t> message(
            args.message_.begin(), args.message_.end()
        );
        Chunk message_chunk{ *exp_type, message };

        if (configs.insert_before_iend_) {
            auto exp_end = png.remove_chunk(::END_CHUNK_TYPE);
            if (!exp_end) {
                return std::unexpected(std::format(
                    "{}: {} chunk: {}",
                    tostr(args.input_path_),
                    ::END_CHUNK_TYPE,
                    exp_end.error().to_str()
                ));
            }

            png.append_chunk(std::move(message_chunk));
            png.append_chunk(std::move(*exp_end));
        } else {
            png.append_chunk(std::move(message_chunk));
        }

        const auto& output_path = args.output_path_ ? *args.output_path_
                                                    : args.input_path_;
        return save_png(output_path, png);
    }

    std::expected<std::string, std::string> run_decode(const CliArgs& args) {
        const auto exp_png = load_png(args.input_path_);
        if (!exp_png)
            return std::unexpected(exp_png.error());

        const auto chunk = exp_png->chunk_by_type(args.chunk_type_);
        if (!chunk) {
            return std::unexpected(std::format(
                "{}: {}",
                PngError{ PngError::Kind::chunk_not_found }.to_str(),
                args.chunk_type_
            ));
        }

        auto exp_text = chunk->data_as_str();
        if (!exp_text)
            return std::unexpected(exp_text.error().to_str());

        return std::move(*exp_text);
    }

    ErrStr run_remove(const CliArgs& args) {
        auto exp_png = load_png(args.input_path_);
        if (!exp_png)
            return std::unexpected(exp_png.error());

        const auto exp_removed = exp_png->remove_chunk(args.chunk_type_);
        if (!exp_removed) {
            return std::unexpected(std::format(
                "{}: {}", exp_removed.error().to_str(), args.chunk_type_
            ));
        }

        return save_png(args.input_path_, *exp_png);
    }

    std::expected<std::string, std::string> run_print(
        const CliArgs& args, const AppConfigs& configs
    ) {
        std::vector<uint8_t> file_content;
        if (!read_file(args.input_path_, file_content)) {
            return std::unexpected(
                "Failed to read file: " + tostr(args.input_path_)
            );
        }

        const auto exp_png = Png::parse(file_content);
        if (!exp_png) {
            return std::unexpected(std::format(
                "{}: {}", tostr(args.input_path_), exp_png.error().to_str()
            ));
        }
        const auto& png = *exp_png;

        std::expected<PngMeta, std::string> exp_meta = std::unexpected(
            "Image header not requested"
        );
        if (configs.print_image_header_)
            exp_meta = read_png_meta(file_content.data(), file_content.size());

        if (args.json_) {
            auto output = nlohmann::json::object();
            output["chunks"] = nlohmann::json::array();
            for (const auto& chunk : png.chunks())
                output["chunks"].push_back(::chunk_to_json(chunk));
            if (exp_meta)
                output["image"] = ::meta_to_json(*exp_meta);
            return output.dump(2) + '\n';
        }

        std::string output;
        if (configs.print_hex_data_) {
            output = png.to_str();
        } else {
            for (const auto& chunk : png.chunks()) {
                output += ::format_chunk_brief(chunk);
                output += '\n';
            }
        }

        if (configs.print_image_header_) {
            if (exp_meta) {
                output += ::format_meta(*exp_meta);
            } else {
                std::println(
                    stderr,
                    "Warning: cannot read image header: {}",
                    exp_meta.error()
                );
            }
        }

        return output;
    }

}  // namespace pngmsg
