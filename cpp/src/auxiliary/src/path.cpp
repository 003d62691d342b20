#include "pngmsg/auxiliary/path.hpp"


namespace pngmsg {

    std::string tostr(const Path& path) {
        const auto u8str = path.generic_u8string();
        return std::string(u8str.begin(), u8str.end());
    }

    Path fromstr(const std::string& str) { return fs::u8path(str); }

}  // namespace pngmsg
