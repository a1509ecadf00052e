#include "pngstash/image/png.hpp"

#include <algorithm>
#include <format>

#include <png.h>


namespace pngstash {

    Png Png::from_chunks(std::vector<Chunk> chunks) {
        Png output;
        output.chunks_ = std::move(chunks);
        return output;
    }

    PngResult<Png> Png::from_bytes(std::span<const uint8_t> raw) {
        if (!has_png_signature(raw)) {
            return make_png_err(
                PngErrc::invalid_signature,
                "Input does not start with the PNG signature"
            );
        }

        Png output;
        size_t offset = STANDARD_HEADER.size();

        while (offset < raw.size()) {
            auto chunk = Chunk::from_bytes(raw.subspan(offset));
            if (!chunk) {
                auto err = chunk.error();
                err.msg_ = std::format(
                    "{} (chunk #{} at offset {})",
                    err.msg_,
                    output.chunks_.size(),
                    offset
                );
                return std::unexpected(std::move(err));
            }

            offset += chunk->encoded_size();
            output.chunks_.push_back(std::move(*chunk));
        }

        return output;
    }

    void Png::append_chunk(Chunk chunk) {
        chunks_.push_back(std::move(chunk));
    }

    void Png::insert_chunk_before_end(Chunk chunk) {
        const auto iend = iend_chunk_type();
        if (!chunks_.empty() && chunks_.back().chunk_type() == iend) {
            chunks_.insert(chunks_.end() - 1, std::move(chunk));
            return;
        }

        chunks_.push_back(std::move(chunk));
    }

    PngResult<Chunk> Png::remove_first_chunk_by_type(const ChunkType& type) {
        const auto it = std::find_if(
            chunks_.begin(), chunks_.end(), [&type](const Chunk& c) {
                return c.chunk_type() == type;
            }
        );

        if (it == chunks_.end()) {
            return make_png_err(
                PngErrc::chunk_not_found,
                std::format("No chunk of type '{}'", type.to_string())
            );
        }

        Chunk removed = std::move(*it);
        chunks_.erase(it);
        return removed;
    }

    const Chunk* Png::chunk_by_type(const ChunkType& type) const {
        for (const auto& chunk : chunks_) {
            if (chunk.chunk_type() == type)
                return &chunk;
        }
        return nullptr;
    }

    size_t Png::count_chunks_by_type(const ChunkType& type) const {
        return static_cast<size_t>(std::count_if(
            chunks_.begin(), chunks_.end(), [&type](const Chunk& c) {
                return c.chunk_type() == type;
            }
        ));
    }

    std::vector<uint8_t> Png::as_bytes() const {
        size_t total_size = STANDARD_HEADER.size();
        for (const auto& chunk : chunks_)
            total_size += chunk.encoded_size();

        std::vector<uint8_t> output;
        output.reserve(total_size);
        output.insert(
            output.end(), STANDARD_HEADER.begin(), STANDARD_HEADER.end()
        );
        for (const auto& chunk : chunks_)
            chunk.append_to(output);
        return output;
    }

    std::string Png::to_string() const {
        auto output = std::format("PNG with {} chunks\n", chunks_.size());
        for (size_t i = 0; i < chunks_.size(); ++i) {
            output += std::format("  [{:>3}] {}\n", i, chunks_[i].to_string());
        }
        return output;
    }


    bool has_png_signature(std::span<const uint8_t> raw) {
        if (raw.size() < Png::STANDARD_HEADER.size())
            return false;

        return png_sig_cmp(raw.data(), 0, Png::STANDARD_HEADER.size()) == 0;
    }

    ChunkType iend_chunk_type() {
        return ChunkType::from_bytes({ 'I', 'E', 'N', 'D' });
    }

}  // namespace pngstash
