#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "pngstash/image/png_error.hpp"


namespace pngstash {

    /*
    Four byte chunk type code. The case of each letter carries a property bit
    (bit 5, 0x20) defined by the PNG specification:

        byte 0: ancillary bit      clear -> critical
        byte 1: private bit        clear -> public
        byte 2: reserved bit       must be clear
        byte 3: safe-to-copy bit   set   -> safe to copy
    */
    class ChunkType {

    public:
        using Bytes = std::array<uint8_t, 4>;

        // Accepts any four bytes, validity is checked with is_valid()
        static ChunkType from_bytes(const Bytes& bytes);

        // Requires exactly four ASCII letters
        static PngResult<ChunkType> from_str(std::string_view str);

        const Bytes& bytes() const { return bytes_; }

        bool is_valid() const;
        bool is_ascii_letters() const;

        bool is_critical() const { return (bytes_[0] & PROPERTY_BIT) == 0; }
        bool is_public() const { return (bytes_[1] & PROPERTY_BIT) == 0; }
        bool is_reserved_bit_valid() const {
            return (bytes_[2] & PROPERTY_BIT) == 0;
        }
        bool is_safe_to_copy() const {
            return (bytes_[3] & PROPERTY_BIT) != 0;
        }

        std::string to_string() const;

        bool operator==(const ChunkType& rhs) const = default;

    private:
        static constexpr uint8_t PROPERTY_BIT = 0x20;

        explicit ChunkType(const Bytes& bytes) : bytes_(bytes) {}

        Bytes bytes_;
    };


    bool is_ascii_letter(uint8_t c);

}  // namespace pngstash
