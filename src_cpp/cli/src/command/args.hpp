#pragma once

#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "pngstash/auxiliary/path.hpp"


namespace pngstash {

    // "-" as chunk type selects AppConfigs::default_chunk_type_
    constexpr const char* DEFAULT_CHUNK_TYPE_ARG = "-";


    struct EncodeArgs {
        Path file_path_;
        std::string chunk_type_;
        std::string message_;
        std::optional<Path> output_path_;
    };

    struct DecodeArgs {
        Path file_path_;
        std::string chunk_type_;
    };

    struct RemoveArgs {
        Path file_path_;
        std::string chunk_type_;
    };

    struct PrintArgs {
        Path file_path_;
        std::vector<std::string> filter_;
        bool json_ = false;
    };

    struct HelpArgs {};

    using CommandArgs =
        std::variant<EncodeArgs, DecodeArgs, RemoveArgs, PrintArgs, HelpArgs>;


    // `args` excludes the program name
    std::expected<CommandArgs, std::string> parse_args(
        const std::vector<std::string>& args
    );

    std::string usage_text(const std::string& program_name);

}  // namespace pngstash
