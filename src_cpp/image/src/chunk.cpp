#include "pngstash/image/chunk.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "pngstash/image/crc.hpp"


namespace {

    uint32_t read_u32_be(const uint8_t* p) {
        return (static_cast<uint32_t>(p[0]) << 24) |
               (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) |
               (static_cast<uint32_t>(p[3]) << 0);
    }

    void append_u32_be(std::vector<uint8_t>& out, uint32_t value) {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value >> 0));
    }

    uint32_t compute_crc(
        const pngstash::ChunkType::Bytes& type, const uint8_t* data, size_t size
    ) {
        const auto crc = pngstash::crc32(type.data(), type.size());
        return pngstash::crc32(crc, data, size);
    }

}  // namespace


namespace pngstash {

    Chunk::Chunk(const ChunkType& chunk_type, std::vector<uint8_t> data)
        : type_(chunk_type), data_(std::move(data)) {
        if (data_.size() > MAX_DATA_SIZE) {
            throw std::length_error(
                std::format(
                    "Chunk data too large ({} bytes) for a 32-bit length",
                    data_.size()
                )
            );
        }
    }

    PngResult<Chunk> Chunk::from_bytes(std::span<const uint8_t> raw) {
        if (raw.size() < METADATA_SIZE) {
            return make_png_err(
                PngErrc::unexpected_eof,
                std::format(
                    "Chunk needs at least {} bytes, only {} left",
                    METADATA_SIZE,
                    raw.size()
                )
            );
        }

        const auto length = ::read_u32_be(raw.data());
        if (raw.size() - METADATA_SIZE < length) {
            return make_png_err(
                PngErrc::unexpected_eof,
                std::format(
                    "Chunk declares {} data bytes but only {} are left",
                    length,
                    raw.size() - METADATA_SIZE
                )
            );
        }

        ChunkType::Bytes type_bytes;
        std::copy_n(raw.data() + LENGTH_SIZE, TYPE_SIZE, type_bytes.begin());
        const auto type = ChunkType::from_bytes(type_bytes);

        const auto data_begin = raw.data() + LENGTH_SIZE + TYPE_SIZE;
        const auto stored_crc = ::read_u32_be(data_begin + length);
        const auto computed_crc = ::compute_crc(type_bytes, data_begin, length);
        if (stored_crc != computed_crc) {
            return make_png_err(
                PngErrc::crc_mismatch,
                std::format(
                    "Chunk '{}' stores CRC 0x{:08X} but data hashes to 0x{:08X}",
                    type.to_string(),
                    stored_crc,
                    computed_crc
                )
            );
        }

        return Chunk{ type,
                      std::vector<uint8_t>(data_begin, data_begin + length) };
    }

    PngResult<Chunk> Chunk::from_bytes_exact(std::span<const uint8_t> raw) {
        auto chunk = Chunk::from_bytes(raw);
        if (!chunk)
            return chunk;

        if (chunk->encoded_size() != raw.size()) {
            return make_png_err(
                PngErrc::invalid_format,
                std::format(
                    "Chunk length mismatch, declared {} bytes but got {}",
                    chunk->encoded_size(),
                    raw.size()
                )
            );
        }

        return chunk;
    }

    uint32_t Chunk::crc() const {
        return ::compute_crc(type_.bytes(), data_.data(), data_.size());
    }

    PngResult<std::string> Chunk::data_as_string() const {
        if (!is_valid_utf8(data_.data(), data_.size())) {
            return make_png_err(
                PngErrc::invalid_utf8,
                std::format(
                    "Data of chunk '{}' is not valid UTF-8", type_.to_string()
                )
            );
        }

        return std::string(data_.begin(), data_.end());
    }

    std::vector<uint8_t> Chunk::as_bytes() const {
        std::vector<uint8_t> output;
        output.reserve(this->encoded_size());
        this->append_to(output);
        return output;
    }

    void Chunk::append_to(std::vector<uint8_t>& out) const {
        ::append_u32_be(out, this->length());
        out.insert(out.end(), type_.bytes().begin(), type_.bytes().end());
        out.insert(out.end(), data_.begin(), data_.end());
        ::append_u32_be(out, this->crc());
    }

    std::string Chunk::to_string() const {
        return std::format(
            "{}  length={}  crc=0x{:08X}",
            type_.to_string(),
            this->length(),
            this->crc()
        );
    }


    bool is_valid_utf8(const uint8_t* data, size_t size) {
        size_t i = 0;
        while (i < size) {
            const auto c = data[i];

            size_t extra = 0;
            uint32_t cp = 0;
            uint32_t min_cp = 0;
            if (c < 0x80) {
                ++i;
                continue;
            } else if ((c & 0xE0) == 0xC0) {
                extra = 1;
                cp = c & 0x1F;
                min_cp = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
                cp = c & 0x0F;
                min_cp = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3;
                cp = c & 0x07;
                min_cp = 0x10000;
            } else {
                return false;
            }

            if (size - i <= extra)
                return false;

            for (size_t k = 1; k <= extra; ++k) {
                const auto cc = data[i + k];
                if ((cc & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cc & 0x3F);
            }

            // Overlong forms, UTF-16 surrogates, beyond U+10FFFF
            if (cp < min_cp)
                return false;
            if (cp >= 0xD800 && cp <= 0xDFFF)
                return false;
            if (cp > 0x10FFFF)
                return false;

            i += extra + 1;
        }

        return true;
    }

}  // namespace pngstash
