#include "pngstash/auxiliary/app_configs.hpp"

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include "pngstash/auxiliary/filesys.hpp"


namespace {

    const std::string DEFAULT_CHUNK_TYPE = "ruSt";
    constexpr int DEFAULT_PRINT_DATA_PREVIEW = 16;

    bool fits_int(const nlohmann::json& value) {
        if (value.is_number_unsigned()) {
            return value.get<uint64_t>() <=
                   static_cast<uint64_t>(std::numeric_limits<int>::max());
        }

        const auto x = value.get<int64_t>();
        return x >= std::numeric_limits<int>::min() &&
               x <= std::numeric_limits<int>::max();
    }

    template <typename T>
    T try_get(
        const nlohmann::json& j, const char* key, const T& default_value
    ) {
        if (!j.contains(key))
            return default_value;

        const auto& value = j.at(key);

        // nlohmann converts bools and floats to int silently
        if constexpr (std::is_same_v<T, int>) {
            if (!value.is_number_integer() || !::fits_int(value)) {
                throw std::runtime_error(
                    "Key '" + std::string(key) + "' must be an integer"
                );
            }
        }

        try {
            return value.get<T>();
        } catch (const std::exception& e) {
            throw std::runtime_error(
                "Invalid type for key '" + std::string(key) + "'"
            );
        }
    }

}  // namespace


// AppConfigs
namespace pngstash {

    void AppConfigs::fill_default() {
        default_chunk_type_ = DEFAULT_CHUNK_TYPE;
        require_valid_chunk_type_ = true;
        insert_before_iend_ = true;
        print_data_preview_ = DEFAULT_PRINT_DATA_PREVIEW;
    }

    void AppConfigs::import_json(const nlohmann::json& json_data) {
        if (!json_data.is_object())
            throw std::runtime_error("Config root must be a JSON object");

        default_chunk_type_ = try_get<std::string>(
            json_data, "default_chunk_type", default_chunk_type_
        );
        require_valid_chunk_type_ = try_get<bool>(
            json_data, "require_valid_chunk_type", require_valid_chunk_type_
        );
        insert_before_iend_ = try_get<bool>(
            json_data, "insert_before_iend", insert_before_iend_
        );
        print_data_preview_ = try_get<int>(
            json_data, "print_data_preview", print_data_preview_
        );

        if (print_data_preview_ < 0)
            throw std::runtime_error("'print_data_preview' must not be negative");
    }

    nlohmann::json AppConfigs::export_json() const {
        nlohmann::json output;
        output["default_chunk_type"] = default_chunk_type_;
        output["require_valid_chunk_type"] = require_valid_chunk_type_;
        output["insert_before_iend"] = insert_before_iend_;
        output["print_data_preview"] = print_data_preview_;
        return output;
    }

}  // namespace pngstash


namespace pngstash {

    Path find_config_path() {
        if (const char* env = std::getenv(CONFIG_PATH_ENV)) {
            if (env[0] != '\0')
                return fromstr(env);
        }
        return fromstr(DEFAULT_CONFIG_FILE);
    }

    std::expected<AppConfigs, std::string> load_app_configs(const Path& path) {
        AppConfigs configs;
        configs.fill_default();

        std::error_code ec;
        if (!fs::exists(path, ec))
            return configs;

        std::string content;
        if (!read_file(path, content))
            return std::unexpected("Failed to read config: " + tostr(path));

        try {
            const auto json_data = nlohmann::json::parse(content);
            configs.import_json(json_data);
        } catch (const std::exception& e) {
            return std::unexpected(
                "Invalid config " + tostr(path) + ": " + e.what()
            );
        }

        return configs;
    }

}  // namespace pngstash
