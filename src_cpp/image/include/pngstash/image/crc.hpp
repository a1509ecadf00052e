#pragma once

#include <cstddef>
#include <cstdint>
#include <span>


namespace pngstash {

    /*
    CRC-32 as used by PNG chunks (ISO 3309 / ITU-T V.42, reflected polynomial
    0xEDB88320). Identical to zlib's crc32, which does the actual work.

    The overload taking `prev` continues a running checksum, so
    crc32(crc32(a), b) == crc32(a || b).
    */
    uint32_t crc32(uint32_t prev, const uint8_t* data, size_t size);

    uint32_t crc32(const uint8_t* data, size_t size);

    uint32_t crc32(std::span<const uint8_t> bytes);

}  // namespace pngstash
