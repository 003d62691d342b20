#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "pngmsg/auxiliary/path.hpp"


namespace pngmsg {

    enum class Command {
        help,
        encode,
        decode,
        remove,
        print,
    };


    struct CliArgs {
        Command command_ = Command::help;
        Path config_path_;

        Path input_path_;
        std::string chunk_type_;
        std::string message_;
        std::optional<Path> output_path_;  // encode only
        bool json_ = false;                // print only
    };


    // Drops the program name, tolerates an empty argv
    std::vector<std::string> collect_args(int argc, const char* const* argv);

    // `args` excludes the program name
    std::expected<CliArgs, std::string> parse_args(
        const std::vector<std::string>& args
    );

    const char* usage_text();

}  // namespace pngmsg
