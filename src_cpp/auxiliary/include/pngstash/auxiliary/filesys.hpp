#pragma once

#include <cstdint>
#include <expected>
#include <vector>

#include "pngstash/auxiliary/err_str.hpp"
#include "pngstash/auxiliary/path.hpp"


namespace pngstash {

    bool read_file(const Path& path, std::string& out);

    bool read_file(const Path& path, std::vector<uint8_t>& out);

    std::expected<std::vector<uint8_t>, std::string> read_file(
        const Path& path
    );

    bool write_file(const Path& path, const void* data, size_t size);

    // Writes to a sibling temp file first, then renames it over `path`
    ErrStr replace_file(const Path& path, const std::vector<uint8_t>& data);

}  // namespace pngstash
