#include <string>
#include <vector>

#include "check.hpp"
#include "command/commands.hpp"
#include "fixtures.hpp"
#include "pngstash/auxiliary/filesys.hpp"
#include "pngstash/image/message.hpp"


namespace {

    using pngstash::AppConfigs;
    using pngstash::CommandRunner;
    using pngstash::Png;


    AppConfigs default_configs() {
        AppConfigs configs;
        configs.fill_default();
        return configs;
    }

    pngstash::Path write_test_png(const char* name) {
        const auto path = pngstash::fs::temp_directory_path() / name;
        const auto bytes = test::make_test_png().as_bytes();
        std::error_code ec;
        pngstash::fs::remove(pngstash::path_concat(path, ".tmp"), ec);
        test::check(
            pngstash::write_file(path, bytes.data(), bytes.size()),
            "fixture written to " + pngstash::tostr(path)
        );
        return path;
    }

    std::vector<std::string> types_on_disk(const pngstash::Path& path) {
        std::vector<std::string> output;
        const auto content = pngstash::read_file(path);
        if (!content)
            return output;
        const auto png = Png::from_bytes(*content);
        if (!png)
            return output;
        for (const auto& chunk : png->chunks())
            output.push_back(chunk.chunk_type().to_string());
        return output;
    }

    std::string decode_on_disk(const pngstash::Path& path, const char* type) {
        const auto content = pngstash::read_file(path);
        if (!content)
            return "<unreadable>";
        const auto png = Png::from_bytes(*content);
        if (!png)
            return "<not a png>";
        const auto message = pngstash::decode_message(*png, type);
        return message ? *message : "<missing>";
    }

    void remove_file(const pngstash::Path& path) {
        std::error_code ec;
        pngstash::fs::remove(path, ec);
    }


    void test_encode_default_type_before_iend() {
        const auto configs = ::default_configs();
        const auto path = ::write_test_png("pngstash_cmd_encode.png");

        CommandRunner runner{ configs };
        const auto code = runner.run(
            pngstash::EncodeArgs{ path, "-", "hidden message", std::nullopt }
        );
        test::check(code == pngstash::EXIT_OK, "encode exit code");
        test::check(
            ::types_on_disk(path) ==
                std::vector<std::string>{ "IHDR", "IDAT", "ruSt", "IEND" },
            "default type inserted before IEND"
        );
        test::check(
            ::decode_on_disk(path, "ruSt") == "hidden message",
            "message written back to input"
        );

        ::remove_file(path);
    }

    void test_encode_append() {
        auto configs = ::default_configs();
        configs.insert_before_iend_ = false;
        configs.default_chunk_type_ = "stEg";
        const auto path = ::write_test_png("pngstash_cmd_append.png");

        CommandRunner runner{ configs };
        const auto code = runner.run(
            pngstash::EncodeArgs{ path, "-", "tail", std::nullopt }
        );
        test::check(code == pngstash::EXIT_OK, "append exit code");
        test::check(
            ::types_on_disk(path) ==
                std::vector<std::string>{ "IHDR", "IDAT", "IEND", "stEg" },
            "configured default type appended last"
        );

        ::remove_file(path);
    }

    void test_encode_output_path() {
        const auto configs = ::default_configs();
        const auto path = ::write_test_png("pngstash_cmd_in.png");
        const auto out_path = pngstash::fs::temp_directory_path() /
                              "pngstash_cmd_out.png";
        ::remove_file(out_path);
        const auto original = pngstash::read_file(path);

        CommandRunner runner{ configs };
        const auto code = runner.run(
            pngstash::EncodeArgs{ path, "ruSt", "elsewhere", out_path }
        );
        test::check(code == pngstash::EXIT_OK, "encode to output exit code");
        test::check(
            ::decode_on_disk(out_path, "ruSt") == "elsewhere",
            "output file has the message"
        );
        test::check(
            original && pngstash::read_file(path) == original,
            "input file unchanged"
        );

        ::remove_file(path);
        ::remove_file(out_path);
    }

    void test_require_valid_chunk_type() {
        auto configs = ::default_configs();
        const auto path = ::write_test_png("pngstash_cmd_reserved.png");
        const auto original = pngstash::read_file(path);

        CommandRunner strict{ configs };
        const auto code = strict.run(
            pngstash::EncodeArgs{ path, "Rust", "msg", std::nullopt }
        );
        test::check(
            code == pngstash::EXIT_INVALID_FORMAT,
            "reserved bit set -> exit code 11"
        );
        test::check(
            pngstash::read_file(path) == original, "file untouched on failure"
        );

        const auto digit_code = strict.run(
            pngstash::EncodeArgs{ path, "ru1t", "m", std::nullopt }
        );
        test::check(
            digit_code == pngstash::EXIT_INVALID_FORMAT,
            "digit in type -> exit code 11"
        );

        configs.require_valid_chunk_type_ = false;
        CommandRunner lenient{ configs };
        const auto lenient_code = lenient.run(
            pngstash::EncodeArgs{ path, "Rust", "msg", std::nullopt }
        );
        test::check(lenient_code == pngstash::EXIT_OK, "lenient accepts Rust");
        test::check(::decode_on_disk(path, "Rust") == "msg", "Rust stored");

        ::remove_file(path);
    }

    void test_decode() {
        const auto configs = ::default_configs();
        const auto path = ::write_test_png("pngstash_cmd_decode.png");
        CommandRunner runner{ configs };

        test::check(
            runner.run(pngstash::DecodeArgs{ path, "ruSt" }) ==
                pngstash::EXIT_CHUNK_NOT_FOUND,
            "decode before encode -> exit code 14"
        );

        runner.run(pngstash::EncodeArgs{ path, "ruSt", "hi", std::nullopt });
        test::check(
            runner.run(pngstash::DecodeArgs{ path, "-" }) == pngstash::EXIT_OK,
            "decode with default type"
        );

        const auto missing = pngstash::fs::temp_directory_path() /
                             "pngstash_cmd_no_such_file.png";
        ::remove_file(missing);
        test::check(
            runner.run(pngstash::DecodeArgs{ missing, "ruSt" }) ==
                pngstash::EXIT_IO,
            "missing file -> exit code 2"
        );

        const std::string not_png = "definitely not a png";
        pngstash::write_file(path, not_png.data(), not_png.size());
        test::check(
            runner.run(pngstash::DecodeArgs{ path, "ruSt" }) ==
                pngstash::EXIT_INVALID_SIGNATURE,
            "not a png -> exit code 10"
        );

        ::remove_file(path);
    }

    void test_remove() {
        const auto configs = ::default_configs();
        const auto path = ::write_test_png("pngstash_cmd_remove.png");
        CommandRunner runner{ configs };

        runner.run(pngstash::EncodeArgs{ path, "ruSt", "one", std::nullopt });
        runner.run(pngstash::EncodeArgs{ path, "ruSt", "two", std::nullopt });

        test::check(
            runner.run(pngstash::RemoveArgs{ path, "ruSt" }) ==
                pngstash::EXIT_OK,
            "remove exit code"
        );
        test::check(
            ::types_on_disk(path) ==
                std::vector<std::string>{ "IHDR", "IDAT", "ruSt", "IEND" },
            "one chunk removed from the file"
        );
        test::check(
            ::decode_on_disk(path, "ruSt") == "two", "second message left"
        );

        runner.run(pngstash::RemoveArgs{ path, "-" });
        test::check(
            runner.run(pngstash::RemoveArgs{ path, "ruSt" }) ==
                pngstash::EXIT_CHUNK_NOT_FOUND,
            "remove with nothing left -> exit code 14"
        );
        test::check(
            ::types_on_disk(path) ==
                std::vector<std::string>{ "IHDR", "IDAT", "IEND" },
            "file back to the original chunks"
        );

        ::remove_file(path);
    }

    void test_png_json() {
        auto png = test::make_test_png();
        png.insert_chunk_before_end(test::make_chunk("ruSt", "abc"));

        const auto j = pngstash::make_png_json(png, {});
        test::check(j.at("chunkCount") == 4, "chunk count");
        test::check(j.at("chunks").size() == 4, "all chunks listed");

        const auto& ihdr = j.at("chunks").at(0);
        test::check(ihdr.at("type") == "IHDR", "IHDR type");
        test::check(ihdr.at("length") == 13, "IHDR length");
        test::check(ihdr.at("critical") == true, "IHDR critical");
        test::check(ihdr.at("public") == true, "IHDR public");

        const auto filtered = pngstash::make_png_json(png, { "ruSt", "IEND" });
        test::check(filtered.at("chunkCount") == 4, "count ignores filter");
        test::check(filtered.at("chunks").size() == 2, "filter applied");

        const auto& hidden = filtered.at("chunks").at(0);
        test::check(hidden.at("index") == 2, "original index kept");
        test::check(hidden.at("type") == "ruSt", "hidden type");
        test::check(hidden.at("length") == 3, "hidden length");
        test::check(hidden.at("crc") == png.chunks()[2].crc(), "hidden crc");
        test::check(hidden.at("critical") == false, "ruSt ancillary");
        test::check(hidden.at("public") == false, "ruSt private");
        test::check(hidden.at("reservedBitValid") == true, "reserved bit");
        test::check(hidden.at("safeToCopy") == true, "safe to copy");
        test::check(hidden.at("valid") == true, "valid");
    }

    void test_print() {
        const auto configs = ::default_configs();
        const auto path = ::write_test_png("pngstash_cmd_print.png");
        CommandRunner runner{ configs };

        pngstash::PrintArgs text_args;
        text_args.file_path_ = path;
        test::check(
            runner.run(text_args) == pngstash::EXIT_OK, "print text exit code"
        );

        pngstash::PrintArgs json_args;
        json_args.file_path_ = path;
        json_args.json_ = true;
        json_args.filter_ = { "IHDR" };
        test::check(
            runner.run(json_args) == pngstash::EXIT_OK, "print json exit code"
        );

        ::remove_file(path);
    }

}  // namespace


int main() {
    ::test_encode_default_type_before_iend();
    ::test_encode_append();
    ::test_encode_output_path();
    ::test_require_valid_chunk_type();
    ::test_decode();
    ::test_remove();
    ::test_png_json();
    ::test_print();
    return test::finish("commands");
}
