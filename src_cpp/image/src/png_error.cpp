#include "pngstash/image/png_error.hpp"

#include <format>


namespace pngstash {

    const char* to_str(PngErrc code) {
        switch (code) {
            case PngErrc::invalid_signature:
                return "InvalidSignature";
            case PngErrc::invalid_format:
                return "InvalidFormat";
            case PngErrc::unexpected_eof:
                return "UnexpectedEof";
            case PngErrc::crc_mismatch:
                return "CrcMismatch";
            case PngErrc::chunk_not_found:
                return "ChunkNotFound";
            case PngErrc::invalid_utf8:
                return "InvalidUtf8";
        }
        return "Unknown";
    }

    std::string PngError::to_string() const {
        if (msg_.empty())
            return to_str(code_);
        return std::format("{}: {}", to_str(code_), msg_);
    }

    std::unexpected<PngError> make_png_err(PngErrc code, std::string msg) {
        return std::unexpected(PngError{ code, std::move(msg) });
    }

}  // namespace pngstash
