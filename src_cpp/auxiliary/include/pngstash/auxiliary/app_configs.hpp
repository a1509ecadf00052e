#pragma once

#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "pngstash/auxiliary/path.hpp"


namespace pngstash {

    constexpr const char* DEFAULT_CONFIG_FILE = "pngstash_configs.json";
    constexpr const char* CONFIG_PATH_ENV = "PNGSTASH_CONFIG";


    class AppConfigs {

    public:
        void fill_default();

        // Throws std::runtime_error when a known key has the wrong type
        void import_json(const nlohmann::json& json_data);
        nlohmann::json export_json() const;

    public:
        // Used when the chunk type argument on the command line is "-"
        std::string default_chunk_type_;
        bool require_valid_chunk_type_;
        bool insert_before_iend_;
        int print_data_preview_;
    };


    // Path from PNGSTASH_CONFIG, or DEFAULT_CONFIG_FILE in the working dir
    Path find_config_path();

    // Missing file yields defaults; unreadable or malformed file is an error
    std::expected<AppConfigs, std::string> load_app_configs(const Path& path);

}  // namespace pngstash
