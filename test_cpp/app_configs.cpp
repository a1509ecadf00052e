#include <fstream>

#include "check.hpp"
#include "pngstash/auxiliary/app_configs.hpp"
#include "pngstash/auxiliary/filesys.hpp"


namespace {

    pngstash::Path temp_path(const char* name) {
        return pngstash::fs::temp_directory_path() / name;
    }

    void write_text(const pngstash::Path& path, const std::string& text) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        ofs << text;
    }


    void test_defaults() {
        pngstash::AppConfigs configs;
        configs.fill_default();
        test::check(configs.default_chunk_type_ == "ruSt", "default type");
        test::check(configs.require_valid_chunk_type_, "require valid");
        test::check(configs.insert_before_iend_, "insert before IEND");
        test::check(configs.print_data_preview_ == 16, "preview size");
    }

    void test_json_round_trip() {
        pngstash::AppConfigs configs;
        configs.fill_default();
        configs.default_chunk_type_ = "stEg";
        configs.insert_before_iend_ = false;
        configs.print_data_preview_ = 4;

        pngstash::AppConfigs loaded;
        loaded.fill_default();
        loaded.import_json(configs.export_json());
        test::check(loaded.default_chunk_type_ == "stEg", "type kept");
        test::check(!loaded.insert_before_iend_, "placement kept");
        test::check(loaded.print_data_preview_ == 4, "preview kept");
    }

    void test_partial_json() {
        pngstash::AppConfigs configs;
        configs.fill_default();
        configs.import_json(nlohmann::json{ { "print_data_preview", 0 } });
        test::check(configs.print_data_preview_ == 0, "key applied");
        test::check(configs.default_chunk_type_ == "ruSt", "others default");
    }

    void test_wrong_types() {
        const nlohmann::json bad_values[] = {
            { { "require_valid_chunk_type", "yes" } },
            { { "print_data_preview", -1 } },
            { { "print_data_preview", true } },
            { { "print_data_preview", 3.7 } },
            { { "print_data_preview", 5000000000u } },
            { { "print_data_preview", -5000000000 } },
            { { "default_chunk_type", 42 } },
            nlohmann::json::array(),
        };

        for (const auto& j : bad_values) {
            pngstash::AppConfigs configs;
            configs.fill_default();

            bool thrown = false;
            try {
                configs.import_json(j);
            } catch (const std::runtime_error&) {
                thrown = true;
            }
            test::check(thrown, "rejected: " + j.dump());
        }
    }

    void test_load_from_file() {
        const auto missing = ::temp_path("pngstash_no_such_config.json");
        std::error_code ec;
        pngstash::fs::remove(missing, ec);

        const auto defaults = pngstash::load_app_configs(missing);
        test::check(
            defaults && defaults->default_chunk_type_ == "ruSt",
            "missing file gives defaults"
        );

        const auto good = ::temp_path("pngstash_good_config.json");
        ::write_text(good, R"({ "default_chunk_type": "heRe" })");
        const auto loaded = pngstash::load_app_configs(good);
        test::check(
            loaded && loaded->default_chunk_type_ == "heRe", "file loaded"
        );
        pngstash::fs::remove(good, ec);

        const auto broken = ::temp_path("pngstash_broken_config.json");
        ::write_text(broken, "{ not json");
        const auto failed = pngstash::load_app_configs(broken);
        test::check(!failed, "malformed file is an error");
        pngstash::fs::remove(broken, ec);
    }

    void test_replace_file() {
        const auto path = ::temp_path("pngstash_replace_test.bin");
        const std::vector<uint8_t> data{ 1, 2, 3, 4, 5 };

        const auto res = pngstash::replace_file(path, data);
        test::check(res.has_value(), "replace_file succeeds");

        const auto read_back = pngstash::read_file(path);
        test::check(read_back && *read_back == data, "content written");
        test::check(
            !pngstash::fs::exists(pngstash::path_concat(path, ".tmp")),
            "temp file gone"
        );

        std::error_code ec;
        pngstash::fs::remove(path, ec);

        const auto missing = pngstash::read_file(path);
        test::check(!missing, "reading a missing file fails");
    }

    void test_replace_file_keeps_mode() {
        const auto path = ::temp_path("pngstash_replace_mode.bin");
        ::write_text(path, "old");

        namespace fs = pngstash::fs;
        const auto mode = fs::perms::owner_read | fs::perms::owner_write |
                          fs::perms::owner_exec | fs::perms::group_read;
        fs::permissions(path, mode);

        const auto res = pngstash::replace_file(path, { 'n', 'e', 'w' });
        test::check(res.has_value(), "replace_file succeeds");
        test::check(
            (fs::status(path).permissions() & fs::perms::mask) == mode,
            "mode bits kept"
        );

        std::error_code ec;
        fs::remove(path, ec);
    }

    void test_replace_file_stale_tmp() {
        const auto path = ::temp_path("pngstash_replace_stale.bin");
        const auto tmp_path = pngstash::path_concat(path, ".tmp");
        ::write_text(path, "original");
        ::write_text(tmp_path, "someone else's");

        const auto res = pngstash::replace_file(path, { 1, 2, 3 });
        test::check(!res, "existing temp file is not overwritten");

        std::string content;
        test::check(
            pngstash::read_file(tmp_path, content) &&
                content == "someone else's",
            "temp file untouched"
        );
        test::check(
            pngstash::read_file(path, content) && content == "original",
            "target untouched"
        );

        std::error_code ec;
        pngstash::fs::remove(path, ec);
        pngstash::fs::remove(tmp_path, ec);
    }

}  // namespace


int main() {
    ::test_defaults();
    ::test_json_round_trip();
    ::test_partial_json();
    ::test_wrong_types();
    ::test_load_from_file();
    ::test_replace_file();
    ::test_replace_file_keeps_mode();
    ::test_replace_file_stale_tmp();
    return test::finish("app_configs");
}
