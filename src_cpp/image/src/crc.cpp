#include "pngstash/image/crc.hpp"

#include <algorithm>
#include <limits>

#include <zlib.h>


namespace pngstash {

    uint32_t crc32(uint32_t prev, const uint8_t* data, size_t size) {
        uLong crc = prev;

        // zlib takes uInt lengths
        constexpr size_t MAX_BLOCK = std::numeric_limits<uInt>::max();
        while (size > 0) {
            const auto block = static_cast<uInt>(std::min(size, MAX_BLOCK));
            crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), block);
            data += block;
            size -= block;
        }

        return static_cast<uint32_t>(crc);
    }

    uint32_t crc32(const uint8_t* data, size_t size) {
        return crc32(0, data, size);
    }

    uint32_t crc32(std::span<const uint8_t> bytes) {
        return crc32(0, bytes.data(), bytes.size());
    }

}  // namespace pngstash
