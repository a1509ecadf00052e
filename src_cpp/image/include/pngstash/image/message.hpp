#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pngstash/image/png.hpp"


namespace pngstash {

    enum class MessagePlacement {
        append,      // after every existing chunk
        before_iend  // see Png::insert_chunk_before_end
    };


    // Hides `payload` in a new chunk of type `chunk_type` and returns the
    // re-serialized file. Fails only if `chunk_type` does not parse.
    PngResult<std::vector<uint8_t>> encode_message(
        Png& png,
        std::string_view chunk_type,
        std::span<const uint8_t> payload,
        MessagePlacement placement = MessagePlacement::append
    );

    PngResult<std::vector<uint8_t>> encode_message(
        Png& png,
        std::string_view chunk_type,
        std::string_view message,
        MessagePlacement placement = MessagePlacement::append
    );

    PngResult<std::string> decode_message(
        const Png& png, std::string_view chunk_type
    );

    PngResult<std::vector<uint8_t>> decode_message_bytes(
        const Png& png, std::string_view chunk_type
    );

    // Returns the removed chunk, the caller re-serializes `png`
    PngResult<Chunk> remove_message(Png& png, std::string_view chunk_type);

}  // namespace pngstash
