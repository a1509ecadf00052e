#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "pngstash/image/chunk_type.hpp"
#include "pngstash/image/png_error.hpp"


namespace pngstash {

    /*
    One PNG chunk. Wire layout, all integers big-endian, no padding:

        length  4 bytes   size of `data` only
        type    4 bytes
        data    `length` bytes
        crc     4 bytes   CRC-32 of type || data

    Length and CRC are derived from the type and data on every call.
    */
    class Chunk {

    public:
        static constexpr size_t LENGTH_SIZE = 4;
        static constexpr size_t TYPE_SIZE = 4;
        static constexpr size_t CRC_SIZE = 4;
        static constexpr size_t METADATA_SIZE = LENGTH_SIZE + TYPE_SIZE +
                                                CRC_SIZE;
        static constexpr size_t MAX_DATA_SIZE = 0xFFFFFFFF;

    public:
        // Throws std::length_error if data exceeds MAX_DATA_SIZE
        Chunk(const ChunkType& chunk_type, std::vector<uint8_t> data);

        // Parses the chunk at the front of `raw`, trailing bytes are left
        // for the caller. See encoded_size() for how many were consumed.
        static PngResult<Chunk> from_bytes(std::span<const uint8_t> raw);

        // Same as from_bytes() but `raw` must hold exactly one chunk
        static PngResult<Chunk> from_bytes_exact(std::span<const uint8_t> raw);

        uint32_t length() const { return static_cast<uint32_t>(data_.size()); }
        uint32_t crc() const;
        const ChunkType& chunk_type() const { return type_; }
        const std::vector<uint8_t>& data() const { return data_; }

        // Size of the serialized chunk
        size_t encoded_size() const { return METADATA_SIZE + data_.size(); }

        // Fails with PngErrc::invalid_utf8 unless data is well-formed UTF-8
        PngResult<std::string> data_as_string() const;

        std::vector<uint8_t> as_bytes() const;
        void append_to(std::vector<uint8_t>& out) const;

        std::string to_string() const;

    private:
        ChunkType type_;
        std::vector<uint8_t> data_;
    };


    bool is_valid_utf8(const uint8_t* data, size_t size);

}  // namespace pngstash
