#pragma once

#include <expected>
#include <string>

#include "args.hpp"
#include "pngmsg/auxiliary/app_configs.hpp"
#include "pngmsg/auxiliary/err_str.hpp"
#include "pngmsg/image/png.hpp"


namespace pngmsg {

    std::expected<Png, std::string> load_png(const Path& path);

    ErrStr save_png(const Path& path, const Png& png);

    ErrStr run_encode(const CliArgs& args, const AppConfigs& configs);

    // Returns the decoded message
    std::expected<std::string, std::string> run_decode(const CliArgs& args);

    ErrStr run_remove(const CliArgs& args);

    // Returns the text to be printed
    std::expected<std::string, std::string> run_print(
        const CliArgs& args, const AppConfigs& configs
    );

}  // namespace pngmsg
