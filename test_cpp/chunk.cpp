#include <cstdint>
#include <string>
#include <vector>

#include "check.hpp"
#include "fixtures.hpp"
#include "pngstash/image/chunk.hpp"


namespace {

    using pngstash::Chunk;
    using pngstash::PngErrc;

    const std::string SECRET = "This is where your secret message will be!";
    constexpr uint32_t SECRET_CRC = 2882656334;


    std::vector<uint8_t> make_raw_chunk(uint32_t length, uint32_t crc) {
        std::vector<uint8_t> raw{
            static_cast<uint8_t>(length >> 24),
            static_cast<uint8_t>(length >> 16),
            static_cast<uint8_t>(length >> 8),
            static_cast<uint8_t>(length),
            'R',
            'u',
            'S',
            't',
        };
        raw.insert(raw.end(), SECRET.begin(), SECRET.end());
        raw.push_back(static_cast<uint8_t>(crc >> 24));
        raw.push_back(static_cast<uint8_t>(crc >> 16));
        raw.push_back(static_cast<uint8_t>(crc >> 8));
        raw.push_back(static_cast<uint8_t>(crc));
        return raw;
    }


    void test_new_chunk() {
        const auto chunk = test::make_chunk("RuSt", SECRET);
        test::check(chunk.length() == 42, "length");
        test::check(chunk.chunk_type().to_string() == "RuSt", "type");
        test::check(chunk.crc() == SECRET_CRC, "crc");
        test::check(chunk.encoded_size() == 54, "encoded size");

        const auto text = chunk.data_as_string();
        test::check(text && *text == SECRET, "data as string");
    }

    void test_valid_from_bytes() {
        const auto raw = ::make_raw_chunk(42, SECRET_CRC);
        const auto chunk = Chunk::from_bytes(raw);
        if (!test::check(chunk.has_value(), "valid chunk parses"))
            return;

        test::check(chunk->length() == 42, "parsed length");
        test::check(chunk->chunk_type().to_string() == "RuSt", "parsed type");
        test::check(chunk->crc() == SECRET_CRC, "parsed crc");
        test::check(chunk->as_bytes() == raw, "re-serialized bytes match");

        const auto exact = Chunk::from_bytes_exact(raw);
        test::check(exact.has_value(), "exact parse");
    }

    void test_invalid_crc() {
        const auto raw = ::make_raw_chunk(42, SECRET_CRC - 1);
        const auto chunk = Chunk::from_bytes(raw);
        test::check(!chunk, "bad crc rejected");
        if (!chunk) {
            test::check(
                chunk.error().code_ == PngErrc::crc_mismatch, "CrcMismatch"
            );
        }
    }

    void test_every_bit_flip_detected() {
        const auto raw = ::make_raw_chunk(42, SECRET_CRC);

        // Type and data region only, the length field is covered elsewhere
        const size_t begin = Chunk::LENGTH_SIZE;
        const size_t end = raw.size() - Chunk::CRC_SIZE;
        int undetected = 0;

        for (size_t i = begin; i < end; ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                auto corrupted = raw;
                corrupted[i] ^= static_cast<uint8_t>(1 << bit);

                const auto chunk = Chunk::from_bytes(corrupted);
                if (chunk || chunk.error().code_ != PngErrc::crc_mismatch)
                    ++undetected;
            }
        }

        test::check(undetected == 0, "all single bit flips detected");
    }

    void test_truncated() {
        const auto raw = ::make_raw_chunk(42, SECRET_CRC);

        const size_t sizes[] = { 0, 11, raw.size() - 1 };
        for (const auto size : sizes) {
            const std::span<const uint8_t> part(raw.data(), size);
            const auto chunk = Chunk::from_bytes(part);
            test::check(!chunk, "truncated input rejected");
            if (!chunk) {
                test::check(
                    chunk.error().code_ == PngErrc::unexpected_eof,
                    "UnexpectedEof for " + std::to_string(size) + " bytes"
                );
            }
        }

        // Declared length far past the buffer
        const auto huge = ::make_raw_chunk(0xFFFFFFF0, SECRET_CRC);
        const auto chunk = Chunk::from_bytes(huge);
        test::check(
            !chunk && chunk.error().code_ == PngErrc::unexpected_eof,
            "oversized length -> UnexpectedEof"
        );
    }

    void test_trailing_bytes() {
        auto raw = ::make_raw_chunk(42, SECRET_CRC);
        raw.push_back(0);
        raw.push_back(1);

        const auto chunk = Chunk::from_bytes(raw);
        test::check(
            chunk && chunk->encoded_size() == raw.size() - 2,
            "from_bytes ignores trailing bytes"
        );

        const auto exact = Chunk::from_bytes_exact(raw);
        test::check(
            !exact && exact.error().code_ == PngErrc::invalid_format,
            "from_bytes_exact rejects trailing bytes"
        );
    }

    void test_empty_data() {
        const auto chunk = test::make_chunk("IEND", "");
        const std::vector<uint8_t> expected{
            0, 0, 0, 0, 'I', 'E', 'N', 'D', 0xAE, 0x42, 0x60, 0x82
        };
        test::check(chunk.as_bytes() == expected, "IEND bytes");

        const auto text = chunk.data_as_string();
        test::check(text && text->empty(), "empty string");
    }

    void test_invalid_utf8() {
        for (const auto data : {
                 std::string("\xFF\xFE"),
                 std::string("abc\xC3"),
                 std::string("\xC0\xAF"),
                 std::string("\xED\xA0\x80"),
             }) {
            const auto chunk = test::make_chunk("ruSt", data);
            const auto text = chunk.data_as_string();
            test::check(
                !text && text.error().code_ == PngErrc::invalid_utf8,
                "invalid UTF-8 rejected"
            );
        }

        const auto chunk = test::make_chunk(
            "ruSt", "caf\xC3\xA9 \xF0\x9F\x90\x8D"
        );
        test::check(chunk.data_as_string().has_value(), "multi-byte UTF-8");
    }

}  // namespace


int main() {
    ::test_new_chunk();
    ::test_valid_from_bytes();
    ::test_invalid_crc();
    ::test_every_bit_flip_detected();
    ::test_truncated();
    ::test_trailing_bytes();
    ::test_empty_data();
    ::test_invalid_utf8();
    return test::finish("chunk");
}
