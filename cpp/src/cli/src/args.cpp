#include "args.hpp"

#include <format>

#include "pngmsg/auxiliary/app_configs.hpp"


namespace {

    struct CommandSpec {
        const char* name_;
        pngmsg::Command command_;
        size_t min_positional_;
        size_t max_positional_;
    };

    constexpr CommandSpec COMMAND_SPECS[] = {
        { "encode", pngmsg::Command::encode, 3, 4 },
        { "decode", pngmsg::Command::decode, 2, 2 },
        { "remove", pngmsg::Command::remove, 2, 2 },
        { "print", pngmsg::Command::print, 1, 1 },
    };

    const CommandSpec* find_command(const std::string& name) {
        for (const auto& spec : COMMAND_SPECS) {
            if (name == spec.name_)
                return &spec;
        }
        return nullptr;
    }

    bool is_help_flag(const std::string& arg) {
        return arg == "help" || arg == "-h" || arg == "--help";
    }

}  // namespace


namespace pngmsg {

    std::vector<std::string> collect_args(
        const int argc, const char* const* argv
    ) {
        if (argc <= 1 || !argv)
            return {};
        return std::vector<std::string>(argv + 1, argv + argc);
    }

    std::expected<CliArgs, std::string> parse_args(
        const std::vector<std::string>& args
    ) {
        CliArgs out;
        out.config_path_ = fromstr(DEFAULT_CONFIG_PATH);

        const CommandSpec* spec = nullptr;
        std::vector<std::string> positional;
        bool options_ended = false;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& arg = args[i];

            if (options_ended && spec) {
                positional.push_back(arg);
                continue;
            }

            if (arg == "--") {
                options_ended = true;
                continue;
            }

            if (::is_help_flag(arg) && !spec) {
                out.command_ = Command::help;
                return out;
            }

            if (arg == "--config") {
                if (i + 1 >= args.size())
                    return std::unexpected("Missing value for --config");
                out.config_path_ = fromstr(args[++i]);
                continue;
            }

            if (arg == "--json") {
                out.json_ = true;
                continue;
            }

            if (!spec) {
                spec = ::find_command(arg);
                if (!spec) {
                    return std::unexpected(
                        std::format("Unknown command: {}", arg)
                    );
                }
                continue;
            }

            positional.push_back(arg);
        }

        if (!spec)
            return std::unexpected("No command given");

        if (positional.size() < spec->min_positional_ ||
            positional.size() > spec->max_positional_) {
            return std::unexpected(
                std::format("Wrong number of arguments for '{}'", spec->name_)
            );
        }

        if (out.json_ && spec->command_ != Command::print)
            return std::unexpected("--json is only supported by 'print'");

        out.command_ = spec->command_;
        out.input_path_ = fromstr(positional[0]);

        switch (spec->command_) {
            case Command::encode:
                out.chunk_type_ = positional[1];
                out.message_ = positional[2];
                if (positional.size() > 3)
                    out.output_path_ = fromstr(positional[3]);
                break;
            case Command::decode:
            case Command::remove:
                out.chunk_type_ = positional[1];
                break;
            default:
                break;
        }

        return out;
    }

    const char* usage_text() {
        return "Usage: pngmsg [--config <path>] <command> <args...>\n"
               "\n"
               "Commands:\n"
               "  encode <input> <chunk-type> <message> [output]\n"
               "      Store a UTF-8 message in a new chunk. The input file "
               "is\n"
               "      overwritten when no output path is given.\n"
               "  decode <input> <chunk-type>\n"
               "      Print the message of the first chunk of the type.\n"
               "  remove <input> <chunk-type>\n"
               "      Remove the first chunk of the type from the file.\n"
               "  print [--json] <input>\n"
               "      Dump every chunk of the file.\n"
               "  help\n"
               "      Show this text.\n"
               "\n"
               "Chunk types are four ASCII letters, e.g. 'ruSt'.\n";
    }

}  // namespace pngmsg
