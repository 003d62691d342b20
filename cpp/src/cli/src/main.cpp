#include <cstdio>
#include <print>

#include "args.hpp"
#include "commands.hpp"


namespace {

    constexpr int EXIT_USAGE = 2;


    int report(const pngmsg::ErrStr& result) {
        if (!result) {
            std::println(stderr, "Error: {}", result.error());
            return 1;
        }
        return 0;
    }

    int report(const std::expected<std::string, std::string>& result) {
        if (!result) {
            std::println(stderr, "Error: {}", result.error());
            return 1;
        }
        std::print("{}", *result);
        return 0;
    }

}  // namespace


int main(int argc, char* argv[]) {
    const auto args = pngmsg::collect_args(argc, argv);

    const auto exp_args = pngmsg::parse_args(args);
    if (!exp_args) {
        std::println(stderr, "Error: {}\n", exp_args.error());
        std::print(stderr, "{}", pngmsg::usage_text());
        return ::EXIT_USAGE;
    }
    const auto& cli_args = *exp_args;

    if (cli_args.command_ == pngmsg::Command::help) {
        std::print("{}", pngmsg::usage_text());
        return 0;
    }

    const auto exp_configs = pngmsg::load_app_configs(cli_args.config_path_);
    if (!exp_configs) {
        std::println(
            stderr,
            "Cannot load configs from {}: {}",
            pngmsg::tostr(cli_args.config_path_),
            exp_configs.error()
        );
        return 1;
    }
    const auto& configs = *exp_configs;

    switch (cli_args.command_) {
        case pngmsg::Command::encode:
            return ::report(pngmsg::run_encode(cli_args, configs));
        case pngmsg::Command::decode:
            return ::report(pngmsg::run_decode(cli_args));
        case pngmsg::Command::remove:
            return ::report(pngmsg::run_remove(cli_args));
        case pngmsg::Command::print:
            return ::report(pngmsg::run_print(cli_args, configs));
        default:
            std::print("{}", pngmsg::usage_text());
            return 0;
    }
}
