#include "check.hpp"
#include "pngstash/image/chunk_type.hpp"


namespace {

    using pngstash::ChunkType;
    using pngstash::PngErrc;


    ChunkType parse(const char* str) {
        const auto type = ChunkType::from_str(str);
        if (!type) {
            test::check(false, std::string("from_str failed for ") + str);
            return ChunkType::from_bytes({ 'X', 'X', 'X', 'X' });
        }
        return *type;
    }


    void test_from_bytes() {
        const ChunkType::Bytes expected{ 82, 117, 83, 116 };
        const auto actual = ChunkType::from_bytes({ 82, 117, 83, 116 });
        test::check(actual.bytes() == expected, "bytes are kept");
        test::check(actual == ::parse("RuSt"), "from_bytes == from_str");
    }

    void test_properties() {
        test::check(::parse("RuSt").is_critical(), "RuSt is critical");
        test::check(!::parse("ruSt").is_critical(), "ruSt is ancillary");
        test::check(::parse("RUSt").is_public(), "RUSt is public");
        test::check(!::parse("RuSt").is_public(), "RuSt is private");
        test::check(
            ::parse("RuSt").is_reserved_bit_valid(), "RuSt reserved bit"
        );
        test::check(
            !::parse("Rust").is_reserved_bit_valid(), "Rust reserved bit"
        );
        test::check(::parse("RuSt").is_safe_to_copy(), "RuSt safe to copy");
        test::check(!::parse("RuST").is_safe_to_copy(), "RuST unsafe");
    }

    void test_validity() {
        test::check(
            ChunkType::from_bytes({ 82, 117, 83, 116 }).is_valid(),
            "RuSt is valid"
        );
        test::check(!::parse("Rust").is_valid(), "Rust has reserved bit set");
        test::check(
            ::parse("Rust").is_ascii_letters(), "Rust is still all letters"
        );

        const auto with_digit = ChunkType::from_bytes({ 82, 117, 115, 49 });
        test::check(!with_digit.is_valid(), "Rus1 is invalid");
        test::check(!with_digit.is_ascii_letters(), "Rus1 has a digit");
    }

    void test_from_str_errors() {
        const auto digit = ChunkType::from_str("Ru1t");
        test::check(!digit, "digit rejected");
        if (!digit) {
            test::check(
                digit.error().code_ == PngErrc::invalid_format,
                "digit -> InvalidFormat"
            );
        }

        for (const auto str : { "", "RuS", "RuStt", "Ru St" }) {
            const auto res = ChunkType::from_str(str);
            test::check(!res, std::string("rejected: '") + str + "'");
            if (!res) {
                test::check(
                    res.error().code_ == PngErrc::invalid_format,
                    std::string("InvalidFormat for '") + str + "'"
                );
            }
        }

        // Non-ASCII bytes are never letters
        test::check(!ChunkType::from_str("Ru\xC3\x9F"), "UTF-8 rejected");
    }

    void test_to_string() {
        test::check(::parse("RuSt").to_string() == "RuSt", "to_string");

        const auto raw = ChunkType::from_bytes({ 'a', 0x00, 'c', 'D' });
        test::check(raw.to_string() == "a\\x00cD", "unprintable escaped");
    }

}  // namespace


int main() {
    ::test_from_bytes();
    ::test_properties();
    ::test_validity();
    ::test_from_str_errors();
    ::test_to_string();
    return test::finish("chunk_type");
}
