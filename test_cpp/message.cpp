#include <cstdint>
#include <string>
#include <vector>

#include "check.hpp"
#include "fixtures.hpp"
#include "pngstash/image/message.hpp"


namespace {

    using pngstash::MessagePlacement;
    using pngstash::Png;
    using pngstash::PngErrc;


    void test_hide_and_reveal() {
        auto png = test::make_test_png();
        const auto encoded = pngstash::encode_message(
            png, "ruSt", "hidden message"
        );
        if (!test::check(encoded.has_value(), "encode succeeds"))
            return;

        test::check(*encoded == png.as_bytes(), "returns serialized png");

        // Decode from the written bytes, as a reader of the file would
        const auto reloaded = Png::from_bytes(*encoded);
        if (!test::check(reloaded.has_value(), "encoded file parses"))
            return;

        const auto message = pngstash::decode_message(*reloaded, "ruSt");
        test::check(
            message && *message == "hidden message", "message recovered"
        );

        const auto missing = pngstash::decode_message(*reloaded, "FAKE");
        test::check(
            !missing && missing.error().code_ == PngErrc::chunk_not_found,
            "unused type -> ChunkNotFound"
        );
    }

    void test_binary_payload() {
        auto png = test::make_test_png();
        const std::vector<uint8_t> payload{ 0x00, 0xFF, 0x80, 0x7F, 0xC0 };
        const auto encoded = pngstash::encode_message(png, "biNy", payload);
        test::check(encoded.has_value(), "binary encode");

        const auto bytes = pngstash::decode_message_bytes(png, "biNy");
        test::check(bytes && *bytes == payload, "binary payload recovered");

        const auto text = pngstash::decode_message(png, "biNy");
        test::check(
            !text && text.error().code_ == PngErrc::invalid_utf8,
            "binary payload as text -> InvalidUtf8"
        );
    }

    void test_placement() {
        auto png = test::make_test_png();
        const auto encoded = pngstash::encode_message(
            png, "ruSt", "x", MessagePlacement::before_iend
        );
        test::check(encoded.has_value(), "encode before IEND");
        test::check(
            png.chunks().back().chunk_type() == pngstash::iend_chunk_type(),
            "IEND stays last"
        );
        test::check(
            png.chunks()[png.chunks().size() - 2].chunk_type() ==
                test::type_of("ruSt"),
            "message right before IEND"
        );
    }

    void test_bad_chunk_type() {
        auto png = test::make_test_png();
        const auto before = png.as_bytes();

        for (const auto type : { "ru", "ruStX", "ru5t" }) {
            const auto encoded = pngstash::encode_message(png, type, "msg");
            test::check(
                !encoded && encoded.error().code_ == PngErrc::invalid_format,
                std::string("rejected type ") + type
            );
        }
        test::check(png.as_bytes() == before, "png untouched on failure");

        const auto decoded = pngstash::decode_message(png, "r");
        test::check(
            !decoded && decoded.error().code_ == PngErrc::invalid_format,
            "decode with bad type -> InvalidFormat"
        );
    }

    void test_remove() {
        auto png = test::make_test_png();
        const auto count = png.chunks().size();
        test::check(
            pngstash::encode_message(png, "ruSt", "hidden message").has_value(),
            "encode"
        );

        const auto removed = pngstash::remove_message(png, "ruSt");
        if (!test::check(removed.has_value(), "remove succeeds"))
            return;

        test::check(
            removed->data() == test::to_bytes("hidden message"),
            "removed chunk carries the payload"
        );
        test::check(png.chunks().size() == count, "chunk count restored");

        const auto decoded = pngstash::decode_message(png, "ruSt");
        test::check(
            !decoded && decoded.error().code_ == PngErrc::chunk_not_found,
            "decode after remove -> ChunkNotFound"
        );

        const auto again = pngstash::remove_message(png, "ruSt");
        test::check(
            !again && again.error().code_ == PngErrc::chunk_not_found,
            "second remove -> ChunkNotFound"
        );
    }

    void test_duplicates() {
        auto png = test::make_test_png();
        test::check(
            pngstash::encode_message(png, "ruSt", "one").has_value() &&
                pngstash::encode_message(png, "ruSt", "two").has_value(),
            "encode twice"
        );
        const auto count = png.chunks().size();

        const auto first = pngstash::decode_message(png, "ruSt");
        test::check(first && *first == "one", "decode returns first");

        const auto removed = pngstash::remove_message(png, "ruSt");
        test::check(
            removed && removed->data() == test::to_bytes("one"),
            "first one removed"
        );
        test::check(png.chunks().size() == count - 1, "exactly one removed");

        const auto second = pngstash::decode_message(png, "ruSt");
        test::check(second && *second == "two", "second one left");
    }

}  // namespace


int main() {
    ::test_hide_and_reveal();
    ::test_binary_payload();
    ::test_placement();
    ::test_bad_chunk_type();
    ::test_remove();
    ::test_duplicates();
    return test::finish("message");
}
