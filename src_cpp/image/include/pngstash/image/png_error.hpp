#pragma once

#include <expected>
#include <string>


namespace pngstash {

    enum class PngErrc {
        invalid_signature,
        invalid_format,
        unexpected_eof,
        crc_mismatch,
        chunk_not_found,
        invalid_utf8,
    };

    const char* to_str(PngErrc code);


    struct PngError {
        std::string to_string() const;

        PngErrc code_;
        std::string msg_;
    };


    template <typename T>
    using PngResult = std::expected<T, PngError>;

    std::unexpected<PngError> make_png_err(PngErrc code, std::string msg);

}  // namespace pngstash
