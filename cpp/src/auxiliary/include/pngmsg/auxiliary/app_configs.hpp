#pragma once

#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "pngmsg/auxiliary/path.hpp"


namespace pngmsg {

    class AppConfigs {

    public:
        void fill_default();

        void import_json(const nlohmann::json& json_data);
        nlohmann::json export_json() const;

    public:
        // Encoding
        bool insert_before_iend_ = true;
        bool warn_unsafe_chunk_type_ = true;

        // Printing
        bool print_image_header_ = true;
        bool print_hex_data_ = true;
    };


    using ExpAppConfigs = std::expected<AppConfigs, std::string>;

    extern const char* const DEFAULT_CONFIG_PATH;

    // A missing file is not an error, defaults are used instead
    ExpAppConfigs load_app_configs(const Path& path);

}  // namespace pngmsg
