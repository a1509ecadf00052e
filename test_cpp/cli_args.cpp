#include <string>
#include <vector>

#include "check.hpp"
#include "command/args.hpp"
#include "command/commands.hpp"


namespace {

    using Args = std::vector<std::string>;


    void test_encode() {
        const auto res = pngstash::parse_args(
            Args{ "encode", "a.png", "ruSt", "hello world" }
        );
        if (!test::check(res.has_value(), "encode parses"))
            return;

        const auto* encode = std::get_if<pngstash::EncodeArgs>(&*res);
        if (!test::check(encode != nullptr, "encode variant"))
            return;

        test::check(pngstash::tostr(encode->file_path_) == "a.png", "file");
        test::check(encode->chunk_type_ == "ruSt", "type");
        test::check(encode->message_ == "hello world", "message");
        test::check(!encode->output_path_.has_value(), "no output path");

        const auto with_out = pngstash::parse_args(
            Args{ "encode", "a.png", "ruSt", "msg", "b.png" }
        );
        if (test::check(with_out.has_value(), "encode with output parses")) {
            const auto& args = std::get<pngstash::EncodeArgs>(*with_out);
            test::check(
                args.output_path_ &&
                    pngstash::tostr(*args.output_path_) == "b.png",
                "output path"
            );
        }

        test::check(
            !pngstash::parse_args(Args{ "encode", "a.png", "ruSt" }),
            "encode without message rejected"
        );
    }

    void test_decode_remove() {
        const auto decode = pngstash::parse_args(
            Args{ "decode", "a.png", "ruSt" }
        );
        test::check(
            decode && std::holds_alternative<pngstash::DecodeArgs>(*decode),
            "decode"
        );

        const auto remove = pngstash::parse_args(
            Args{ "remove", "a.png", "-" }
        );
        test::check(
            remove && std::holds_alternative<pngstash::RemoveArgs>(*remove),
            "remove"
        );

        test::check(
            !pngstash::parse_args(Args{ "decode", "a.png" }),
            "decode needs a type"
        );
        test::check(
            !pngstash::parse_args(Args{ "remove", "a.png", "ruSt", "x" }),
            "remove takes two arguments"
        );
    }

    void test_print() {
        const auto res = pngstash::parse_args(
            Args{ "print", "--json", "a.png", "--filter", " IHDR, ruSt ,," }
        );
        const auto* print = res ? std::get_if<pngstash::PrintArgs>(&*res)
                                : nullptr;
        if (!test::check(print != nullptr, "print parses"))
            return;

        test::check(print->json_, "json flag");
        test::check(
            print->filter_ == std::vector<std::string>{ "IHDR", "ruSt" },
            "filter split and trimmed"
        );

        test::check(!pngstash::parse_args(Args{ "print" }), "print needs file");
        test::check(
            !pngstash::parse_args(Args{ "print", "a.png", "--bogus" }),
            "unknown option"
        );
        test::check(
            !pngstash::parse_args(Args{ "print", "a.png", "--filter" }),
            "filter needs value"
        );
    }

    void test_misc() {
        test::check(!pngstash::parse_args(Args{}), "empty args");
        test::check(!pngstash::parse_args(Args{ "explode" }), "unknown cmd");

        const auto help = pngstash::parse_args(Args{ "--help" });
        test::check(
            help && std::holds_alternative<pngstash::HelpArgs>(*help), "help"
        );
    }

    void test_exit_codes() {
        using pngstash::PngErrc;
        const PngErrc codes[] = {
            PngErrc::invalid_signature, PngErrc::invalid_format,
            PngErrc::unexpected_eof,    PngErrc::crc_mismatch,
            PngErrc::chunk_not_found,   PngErrc::invalid_utf8,
        };

        std::vector<int> seen;
        for (const auto code : codes) {
            const int exit_code = pngstash::to_exit_code(code);
            test::check(exit_code != 0, "non-zero exit code");
            for (const auto x : seen)
                test::check(x != exit_code, "distinct exit codes");
            seen.push_back(exit_code);
        }
    }

}  // namespace


int main() {
    ::test_encode();
    ::test_decode_remove();
    ::test_print();
    ::test_misc();
    ::test_exit_codes();
    return test::finish("cli_args");
}
