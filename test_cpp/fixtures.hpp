#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "pngstash/image/png.hpp"


namespace test {

    // No validation, unlike ChunkType::from_str()
    inline pngstash::ChunkType type_of(std::string_view str) {
        pngstash::ChunkType::Bytes bytes{};
        for (size_t i = 0; i < bytes.size() && i < str.size(); ++i)
            bytes[i] = static_cast<uint8_t>(str[i]);
        return pngstash::ChunkType::from_bytes(bytes);
    }

    inline std::vector<uint8_t> to_bytes(std::string_view str) {
        return std::vector<uint8_t>(str.begin(), str.end());
    }

    inline pngstash::Chunk make_chunk(
        std::string_view type, std::string_view data
    ) {
        return pngstash::Chunk{ type_of(type), to_bytes(data) };
    }

    // 1x1 greyscale image: IHDR, IDAT, IEND
    inline pngstash::Png make_test_png() {
        const std::vector<uint8_t> ihdr{
            0, 0, 0, 1,  // width
            0, 0, 0, 1,  // height
            8,           // bit depth
            0,           // colour type
            0,           // compression
            0,           // filter
            0,           // interlace
        };
        // zlib stream of a single zero filter byte and one zero pixel
        const std::vector<uint8_t> idat{ 0x78, 0x9C, 0x63, 0x60, 0x00,
                                         0x00, 0x00, 0x02, 0x00, 0x01 };

        std::vector<pngstash::Chunk> chunks;
        chunks.emplace_back(type_of("IHDR"), ihdr);
        chunks.emplace_back(type_of("IDAT"), idat);
        chunks.emplace_back(type_of("IEND"), std::vector<uint8_t>{});
        return pngstash::Png::from_chunks(std::move(chunks));
    }

}  // namespace test
