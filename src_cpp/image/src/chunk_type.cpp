#include "pngstash/image/chunk_type.hpp"

#include <format>


namespace pngstash {

    bool is_ascii_letter(uint8_t c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }


    ChunkType ChunkType::from_bytes(const Bytes& bytes) {
        return ChunkType{ bytes };
    }

    PngResult<ChunkType> ChunkType::from_str(std::string_view str) {
        if (str.size() != 4) {
            return make_png_err(
                PngErrc::invalid_format,
                std::format(
                    "Chunk type must be 4 bytes long, got {} ('{}')",
                    str.size(),
                    str
                )
            );
        }

        Bytes bytes;
        for (size_t i = 0; i < bytes.size(); ++i) {
            const auto c = static_cast<uint8_t>(str[i]);
            if (!is_ascii_letter(c)) {
                return make_png_err(
                    PngErrc::invalid_format,
                    std::format(
                        "Chunk type byte {} is not an ASCII letter (0x{:02X})",
                        i,
                        c
                    )
                );
            }
            bytes[i] = c;
        }

        return ChunkType{ bytes };
    }

    bool ChunkType::is_valid() const {
        return this->is_ascii_letters() && this->is_reserved_bit_valid();
    }

    bool ChunkType::is_ascii_letters() const {
        for (const auto c : bytes_) {
            if (!is_ascii_letter(c))
                return false;
        }
        return true;
    }

    std::string ChunkType::to_string() const {
        std::string output;
        output.reserve(bytes_.size());
        for (const auto c : bytes_) {
            // Printable ASCII as is, anything else escaped
            if (c >= 0x20 && c <= 0x7E)
                output.push_back(static_cast<char>(c));
            else
                output += std::format("\\x{:02X}", c);
        }
        return output;
    }

}  // namespace pngstash
