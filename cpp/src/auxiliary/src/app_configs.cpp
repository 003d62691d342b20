#include "pngmsg/auxiliary/app_configs.hpp"

#include <fstream>
#include <stdexcept>


namespace {

    template <typename T>
    T try_get(
        const nlohmann::json& j, const char* key, const T& default_value
    ) {
        if (!j.contains(key))
            return default_value;

        try {
            return j.at(key).get<T>();
        } catch (const std::exception& e) {
            throw std::runtime_error(
                "Invalid type for key '" + std::string(key) + "'"
            );
        }
    }

}  // namespace


// AppConfigs
namespace pngmsg {

    void AppConfigs::fill_default() {
        insert_before_iend_ = true;
        warn_unsafe_chunk_type_ = true;

        print_image_header_ = true;
        print_hex_data_ = true;
    }

    void AppConfigs::import_json(const nlohmann::json& json_data) {
        if (!json_data.is_object())
            throw std::runtime_error("Config root must be a JSON object");

        AppConfigs defaults;
        defaults.fill_default();

        insert_before_iend_ = try_get(
            json_data, "insert_before_iend", defaults.insert_before_iend_
        );
        warn_unsafe_chunk_type_ = try_get(
            json_data,
            "warn_unsafe_chunk_type",
            defaults.warn_unsafe_chunk_type_
        );

        print_image_header_ = try_get(
            json_data, "print_image_header", defaults.print_image_header_
        );
        print_hex_data_ = try_get(
            json_data, "print_hex_data", defaults.print_hex_data_
        );
    }

    nlohmann::json AppConfigs::export_json() const {
        auto output = nlohmann::json::object();

        output["insert_before_iend"] = insert_before_iend_;
        output["warn_unsafe_chunk_type"] = warn_unsafe_chunk_type_;

        output["print_image_header"] = print_image_header_;
        output["print_hex_data"] = print_hex_data_;

        return output;
    }

}  // namespace pngmsg


// Free functions
namespace pngmsg {

    const char* const DEFAULT_CONFIG_PATH = "./pngmsg_configs.json";

    ExpAppConfigs load_app_configs(const Path& path) {
        AppConfigs configs;
        configs.fill_default();

        std::ifstream ifs(path);
        if (!ifs)
            return configs;

        nlohmann::json json_data;

        try {
            ifs >> json_data;
        } catch (const std::exception& e) {
            return std::unexpected(e.what());
        }

        try {
            configs.import_json(json_data);
        } catch (const std::exception& e) {
            return std::unexpected(e.what());
        }

        return configs;
    }

}  // namespace pngmsg
