#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "pngstash/image/chunk.hpp"
#include "pngstash/image/png_error.hpp"


namespace pngstash {

    // Signature followed by chunks in file order
    class Png {

    public:
        using Header = std::array<uint8_t, 8>;

        static constexpr Header STANDARD_HEADER{ 0x89, 0x50, 0x4E, 0x47,
                                                 0x0D, 0x0A, 0x1A, 0x0A };

    public:
        Png() = default;

        static Png from_chunks(std::vector<Chunk> chunks);
        static PngResult<Png> from_bytes(std::span<const uint8_t> raw);

        void append_chunk(Chunk chunk);

        // Before the last chunk if it is IEND, otherwise same as append
        void insert_chunk_before_end(Chunk chunk);

        // Only the first match is removed
        PngResult<Chunk> remove_first_chunk_by_type(const ChunkType& type);

        // nullptr if not found. Invalidated by any mutation.
        const Chunk* chunk_by_type(const ChunkType& type) const;
        size_t count_chunks_by_type(const ChunkType& type) const;

        const Header& header() const { return STANDARD_HEADER; }
        const std::vector<Chunk>& chunks() const { return chunks_; }

        std::vector<uint8_t> as_bytes() const;

        std::string to_string() const;

    private:
        std::vector<Chunk> chunks_;
    };


    bool has_png_signature(std::span<const uint8_t> raw);

    ChunkType iend_chunk_type();

}  // namespace pngstash
