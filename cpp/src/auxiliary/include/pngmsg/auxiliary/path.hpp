#pragma once

#include <filesystem>
#include <string>


namespace pngmsg {

    namespace fs = std::filesystem;

    using Path = std::filesystem::path;


    std::string tostr(const Path& path);

    Path fromstr(const std::string& str);

}  // namespace pngmsg
