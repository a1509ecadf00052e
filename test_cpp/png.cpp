#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "check.hpp"
#include "fixtures.hpp"
#include "pngstash/image/png.hpp"


namespace {

    using pngstash::Png;
    using pngstash::PngErrc;


    std::vector<std::string> type_list(const Png& png) {
        std::vector<std::string> output;
        for (const auto& chunk : png.chunks())
            output.push_back(chunk.chunk_type().to_string());
        return output;
    }


    void test_round_trip() {
        const auto png = test::make_test_png();
        const auto bytes = png.as_bytes();

        test::check(
            std::equal(
                Png::STANDARD_HEADER.begin(),
                Png::STANDARD_HEADER.end(),
                bytes.begin()
            ),
            "output starts with signature"
        );

        const auto parsed = Png::from_bytes(bytes);
        if (!test::check(parsed.has_value(), "serialized png parses"))
            return;

        test::check(parsed->as_bytes() == bytes, "round trip is identical");
        test::check(
            ::type_list(*parsed) ==
                std::vector<std::string>{ "IHDR", "IDAT", "IEND" },
            "chunk order kept"
        );
        test::check(parsed->header() == Png::STANDARD_HEADER, "header");
    }

    void test_signature_only() {
        const std::vector<uint8_t> bytes(
            Png::STANDARD_HEADER.begin(), Png::STANDARD_HEADER.end()
        );
        const auto png = Png::from_bytes(bytes);
        test::check(png && png->chunks().empty(), "signature alone is empty");
    }

    void test_invalid_signature() {
        auto bytes = test::make_test_png().as_bytes();
        bytes[1] = 'Q';
        const auto png = Png::from_bytes(bytes);
        test::check(
            !png && png.error().code_ == PngErrc::invalid_signature,
            "bad signature rejected"
        );

        const std::vector<uint8_t> short_input{ 0x89, 0x50, 0x4E };
        const auto png_short = Png::from_bytes(short_input);
        test::check(
            !png_short && png_short.error().code_ == PngErrc::invalid_signature,
            "short input -> InvalidSignature"
        );

        const auto text = test::to_bytes("not a png at all");
        const auto png_text = Png::from_bytes(text);
        test::check(
            !png_text && png_text.error().code_ == PngErrc::invalid_signature,
            "text -> InvalidSignature"
        );
    }

    void test_truncated_stream() {
        const auto bytes = test::make_test_png().as_bytes();
        const std::span<const uint8_t> part(bytes.data(), bytes.size() - 3);
        const auto png = Png::from_bytes(part);
        test::check(
            !png && png.error().code_ == PngErrc::unexpected_eof,
            "stream ending mid-chunk -> UnexpectedEof"
        );
    }

    void test_corrupted_chunk() {
        auto bytes = test::make_test_png().as_bytes();
        // First data byte of IHDR
        bytes[8 + 8] ^= 0x01;
        const auto png = Png::from_bytes(bytes);
        test::check(
            !png && png.error().code_ == PngErrc::crc_mismatch,
            "corrupted IHDR -> CrcMismatch"
        );
    }

    void test_append_and_lookup() {
        auto png = test::make_test_png();
        png.append_chunk(test::make_chunk("ruSt", "first"));

        test::check(png.chunks().size() == 4, "appended");
        test::check(
            png.chunks().back().chunk_type() == test::type_of("ruSt"),
            "append goes last"
        );

        const auto found = png.chunk_by_type(test::type_of("ruSt"));
        test::check(found && found->data() == test::to_bytes("first"), "find");
        test::check(
            png.chunk_by_type(test::type_of("FAKE")) == nullptr, "not found"
        );
    }

    void test_insert_before_end() {
        auto png = test::make_test_png();
        png.insert_chunk_before_end(test::make_chunk("ruSt", "x"));
        test::check(
            ::type_list(png) ==
                std::vector<std::string>{ "IHDR", "IDAT", "ruSt", "IEND" },
            "inserted before IEND"
        );

        auto no_end = Png::from_chunks({ test::make_chunk("IHDR", "") });
        no_end.insert_chunk_before_end(test::make_chunk("ruSt", "x"));
        test::check(
            ::type_list(no_end) == std::vector<std::string>{ "IHDR", "ruSt" },
            "appended when there is no IEND"
        );
    }

    void test_remove() {
        auto png = test::make_test_png();
        png.append_chunk(test::make_chunk("ruSt", "first"));
        png.append_chunk(test::make_chunk("ruSt", "second"));
        const auto count_before = png.chunks().size();

        const auto removed = png.remove_first_chunk_by_type(
            test::type_of("ruSt")
        );
        if (!test::check(removed.has_value(), "remove succeeds"))
            return;

        test::check(
            removed->data() == test::to_bytes("first"), "first removed"
        );
        test::check(png.chunks().size() == count_before - 1, "one fewer");
        test::check(
            png.count_chunks_by_type(test::type_of("ruSt")) == 1,
            "one ruSt left"
        );

        const auto left = png.chunk_by_type(test::type_of("ruSt"));
        test::check(left && left->data() == test::to_bytes("second"), "second");

        const auto missing = png.remove_first_chunk_by_type(
            test::type_of("FAKE")
        );
        test::check(
            !missing && missing.error().code_ == PngErrc::chunk_not_found,
            "remove of missing type -> ChunkNotFound"
        );
        test::check(png.chunks().size() == count_before - 1, "unchanged");
    }

    void test_round_trip_after_mutation() {
        auto png = test::make_test_png();
        png.insert_chunk_before_end(test::make_chunk("ruSt", "payload"));
        png.append_chunk(test::make_chunk("zzZz", ""));

        const auto bytes = png.as_bytes();
        const auto parsed = Png::from_bytes(bytes);
        test::check(
            parsed && parsed->as_bytes() == bytes, "mutated png round trips"
        );
    }

    void test_to_string() {
        const auto text = test::make_test_png().to_string();
        test::check(text.starts_with("PNG with 3 chunks"), "summary line");
        test::check(text.find("IEND") != std::string::npos, "lists IEND");
    }

}  // namespace


int main() {
    ::test_round_trip();
    ::test_signature_only();
    ::test_invalid_signature();
    ::test_truncated_stream();
    ::test_corrupted_chunk();
    ::test_append_and_lookup();
    ::test_insert_before_end();
    ::test_remove();
    ::test_round_trip_after_mutation();
    ::test_to_string();
    return test::finish("png");
}
