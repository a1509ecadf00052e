#include "command/commands.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <span>

#include "pngstash/auxiliary/filesys.hpp"
#include "pngstash/image/message.hpp"


namespace {

    struct LoadError {
        int exit_code_;
        std::string msg_;
    };


    std::expected<pngstash::Png, LoadError> load_png(
        const pngstash::Path& path
    ) {
        const auto content = pngstash::read_file(path);
        if (!content)
            return std::unexpected(
                LoadError{ pngstash::EXIT_IO, content.error() }
            );

        auto png = pngstash::Png::from_bytes(*content);
        if (!png) {
            return std::unexpected(
                LoadError{ pngstash::to_exit_code(png.error().code_),
                           std::format(
                               "{}: {}",
                               pngstash::tostr(path),
                               png.error().to_string()
                           ) }
            );
        }

        return std::move(*png);
    }

    int report(const pngstash::PngError& err) {
        std::println(stderr, "Error: {}", err.to_string());
        return pngstash::to_exit_code(err.code_);
    }

    int report(const LoadError& err) {
        std::println(stderr, "Error: {}", err.msg_);
        return err.exit_code_;
    }

    std::string hex_preview(std::span<const uint8_t> data, size_t limit) {
        std::string output;
        const auto count = std::min(data.size(), limit);
        for (size_t i = 0; i < count; ++i) {
            if (i != 0)
                output += ' ';
            output += std::format("{:02x}", data[i]);
        }
        if (data.size() > count)
            output += " ...";
        return output;
    }

    bool match_filter(
        const pngstash::Chunk& chunk, const std::vector<std::string>& filter
    ) {
        if (filter.empty())
            return true;

        const auto type_str = chunk.chunk_type().to_string();
        for (const auto& x : filter) {
            if (x == type_str)
                return true;
        }
        return false;
    }

}  // namespace


namespace pngstash {

    ExitCode to_exit_code(PngErrc code) {
        switch (code) {
            case PngErrc::invalid_signature:
                return EXIT_INVALID_SIGNATURE;
            case PngErrc::invalid_format:
                return EXIT_INVALID_FORMAT;
            case PngErrc::unexpected_eof:
                return EXIT_UNEXPECTED_EOF;
            case PngErrc::crc_mismatch:
                return EXIT_CRC_MISMATCH;
            case PngErrc::chunk_not_found:
                return EXIT_CHUNK_NOT_FOUND;
            case PngErrc::invalid_utf8:
                return EXIT_INVALID_UTF8;
        }
        return EXIT_USAGE;
    }

    nlohmann::json make_png_json(
        const Png& png, const std::vector<std::string>& filter
    ) {
        nlohmann::json j;
        j["chunkCount"] = png.chunks().size();

        auto& j_chunks = j["chunks"];
        j_chunks = nlohmann::json::array();

        for (size_t i = 0; i < png.chunks().size(); ++i) {
            const auto& chunk = png.chunks()[i];
            if (!::match_filter(chunk, filter))
                continue;

            const auto& type = chunk.chunk_type();
            nlohmann::json j_chunk;
            j_chunk["index"] = i;
            j_chunk["type"] = type.to_string();
            j_chunk["length"] = chunk.length();
            j_chunk["crc"] = chunk.crc();
            j_chunk["critical"] = type.is_critical();
            j_chunk["public"] = type.is_public();
            j_chunk["reservedBitValid"] = type.is_reserved_bit_valid();
            j_chunk["safeToCopy"] = type.is_safe_to_copy();
            j_chunk["valid"] = type.is_valid();
            j_chunks.push_back(std::move(j_chunk));
        }

        return j;
    }

}  // namespace pngstash


// CommandRunner
namespace pngstash {

    int CommandRunner::run(const CommandArgs& args) {
        return std::visit(
            [this](const auto& x) { return this->run_one(x); }, args
        );
    }

    int CommandRunner::run_one(const EncodeArgs& args) {
        const auto chunk_type = this->resolve_chunk_type(args.chunk_type_);
        if (!chunk_type)
            return ::report(chunk_type.error());

        auto png = ::load_png(args.file_path_);
        if (!png)
            return ::report(png.error());

        const auto placement = configs_.insert_before_iend_
                                   ? MessagePlacement::before_iend
                                   : MessagePlacement::append;
        const auto encoded = encode_message(
            *png, *chunk_type, args.message_, placement
        );
        if (!encoded)
            return ::report(encoded.error());

        const auto& out_path = args.output_path_.value_or(args.file_path_);
        if (const auto res = replace_file(out_path, *encoded); !res) {
            std::println(stderr, "Error: {}", res.error());
            return EXIT_IO;
        }

        std::println(
            "Hid {} bytes in chunk '{}' of {}",
            args.message_.size(),
            *chunk_type,
            tostr(out_path)
        );
        return EXIT_OK;
    }

    int CommandRunner::run_one(const DecodeArgs& args) {
        const auto chunk_type = this->resolve_chunk_type(args.chunk_type_);
        if (!chunk_type)
            return ::report(chunk_type.error());

        const auto png = ::load_png(args.file_path_);
        if (!png)
            return ::report(png.error());

        const auto message = decode_message(*png, *chunk_type);
        if (!message)
            return ::report(message.error());

        std::println("{}", *message);
        return EXIT_OK;
    }

    int CommandRunner::run_one(const RemoveArgs& args) {
        const auto chunk_type = this->resolve_chunk_type(args.chunk_type_);
        if (!chunk_type)
            return ::report(chunk_type.error());

        auto png = ::load_png(args.file_path_);
        if (!png)
            return ::report(png.error());

        const auto removed = remove_message(*png, *chunk_type);
        if (!removed)
            return ::report(removed.error());

        if (const auto res = replace_file(args.file_path_, png->as_bytes());
            !res) {
            std::println(stderr, "Error: {}", res.error());
            return EXIT_IO;
        }

        std::println(
            "Removed chunk '{}' ({} bytes) from {}",
            removed->chunk_type().to_string(),
            removed->length(),
            tostr(args.file_path_)
        );
        return EXIT_OK;
    }

    int CommandRunner::run_one(const PrintArgs& args) {
        const auto png = ::load_png(args.file_path_);
        if (!png)
            return ::report(png.error());

        if (args.json_) {
            std::println("{}", make_png_json(*png, args.filter_).dump(2));
            return EXIT_OK;
        }

        std::println("File: {}", tostr(args.file_path_));
        std::println(
            "Signature: {}",
            ::hex_preview(png->header(), png->header().size())
        );
        std::println("Chunks: {}", png->chunks().size());

        const auto preview = static_cast<size_t>(configs_.print_data_preview_);
        for (size_t i = 0; i < png->chunks().size(); ++i) {
            const auto& chunk = png->chunks()[i];
            if (!::match_filter(chunk, args.filter_))
                continue;

            const auto& type = chunk.chunk_type();
            std::println("  [{:>3}] {}", i, chunk.to_string());
            std::println(
                "        {} {} {}{}",
                type.is_critical() ? "critical" : "ancillary",
                type.is_public() ? "public" : "private",
                type.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy",
                type.is_valid() ? "" : " (invalid type)"
            );
            if (preview > 0 && chunk.length() > 0) {
                std::println(
                    "        {}", ::hex_preview(chunk.data(), preview)
                );
            }
        }

        return EXIT_OK;
    }

    int CommandRunner::run_one(const HelpArgs&) {
        std::println("{}", usage_text("pngstash"));
        return EXIT_OK;
    }

    PngResult<std::string> CommandRunner::resolve_chunk_type(
        const std::string& arg
    ) const {
        const auto& type_str = arg == DEFAULT_CHUNK_TYPE_ARG
                                   ? configs_.default_chunk_type_
                                   : arg;

        const auto type = ChunkType::from_str(type_str);
        if (!type)
            return std::unexpected(type.error());

        if (configs_.require_valid_chunk_type_ && !type->is_valid()) {
            return make_png_err(
                PngErrc::invalid_format,
                std::format(
                    "Chunk type '{}' has the reserved bit set (third letter "
                    "must be uppercase)",
                    type_str
                )
            );
        }

        return type_str;
    }

}  // namespace pngstash
