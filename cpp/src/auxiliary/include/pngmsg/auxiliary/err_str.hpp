#pragma once

#include <expected>
#include <string>


namespace pngmsg {

    using ErrStr = std::expected<void, std::string>;

}  // namespace pngmsg
