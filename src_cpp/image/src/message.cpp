#include "pngstash/image/message.hpp"

#include <format>


namespace {

    pngstash::PngResult<const pngstash::Chunk*> find_message_chunk(
        const pngstash::Png& png, std::string_view chunk_type
    ) {
        const auto type = pngstash::ChunkType::from_str(chunk_type);
        if (!type)
            return std::unexpected(type.error());

        const auto chunk = png.chunk_by_type(*type);
        if (!chunk) {
            return pngstash::make_png_err(
                pngstash::PngErrc::chunk_not_found,
                std::format("No message hidden under '{}'", type->to_string())
            );
        }

        return chunk;
    }

}  // namespace


namespace pngstash {

    PngResult<std::vector<uint8_t>> encode_message(
        Png& png,
        std::string_view chunk_type,
        std::span<const uint8_t> payload,
        MessagePlacement placement
    ) {
        const auto type = ChunkType::from_str(chunk_type);
        if (!type)
            return std::unexpected(type.error());

        std::vector<uint8_t> data(payload.begin(), payload.end());
        Chunk chunk{ *type, std::move(data) };

        switch (placement) {
            case MessagePlacement::before_iend:
                png.insert_chunk_before_end(std::move(chunk));
                break;
            case MessagePlacement::append:
                png.append_chunk(std::move(chunk));
                break;
        }

        return png.as_bytes();
    }

    PngResult<std::vector<uint8_t>> encode_message(
        Png& png,
        std::string_view chunk_type,
        std::string_view message,
        MessagePlacement placement
    ) {
        const auto data = reinterpret_cast<const uint8_t*>(message.data());
        return encode_message(
            png,
            chunk_type,
            std::span<const uint8_t>(data, message.size()),
            placement
        );
    }

    PngResult<std::string> decode_message(
        const Png& png, std::string_view chunk_type
    ) {
        const auto chunk = ::find_message_chunk(png, chunk_type);
        if (!chunk)
            return std::unexpected(chunk.error());

        return (*chunk)->data_as_string();
    }

    PngResult<std::vector<uint8_t>> decode_message_bytes(
        const Png& png, std::string_view chunk_type
    ) {
        const auto chunk = ::find_message_chunk(png, chunk_type);
        if (!chunk)
            return std::unexpected(chunk.error());

        return (*chunk)->data();
    }

    PngResult<Chunk> remove_message(Png& png, std::string_view chunk_type) {
        const auto type = ChunkType::from_str(chunk_type);
        if (!type)
            return std::unexpected(type.error());

        return png.remove_first_chunk_by_type(*type);
    }

}  // namespace pngstash
