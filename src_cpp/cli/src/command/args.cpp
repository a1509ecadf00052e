#include "command/args.hpp"

#include <format>

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>


namespace {

    std::vector<std::string> parse_filter(const std::string& filter) {
        std::vector<std::string> output;

        auto parts = absl::StrSplit(filter, ',');
        for (auto part : parts) {
            if (!part.empty()) {
                part = absl::StripAsciiWhitespace(part);

                if (!part.empty())
                    output.push_back(std::string{ part });
            }
        }

        return output;
    }

    std::expected<pngstash::PrintArgs, std::string> parse_print(
        const std::vector<std::string>& args
    ) {
        pngstash::PrintArgs output;
        bool has_file = false;

        for (size_t i = 1; i < args.size(); ++i) {
            const auto& arg = args[i];

            if (arg == "--json") {
                output.json_ = true;
            } else if (arg == "--filter") {
                if (i + 1 >= args.size())
                    return std::unexpected("'--filter' needs a value");
                const auto types = ::parse_filter(args[++i]);
                output.filter_.insert(
                    output.filter_.end(), types.begin(), types.end()
                );
            } else if (arg.starts_with("--")) {
                return std::unexpected("Unknown option: " + arg);
            } else if (!has_file) {
                output.file_path_ = pngstash::fromstr(arg);
                has_file = true;
            } else {
                return std::unexpected("Unexpected argument: " + arg);
            }
        }

        if (!has_file)
            return std::unexpected("'print' needs a file path");

        return output;
    }

    std::expected<void, std::string> check_arg_count(
        const std::vector<std::string>& args, size_t min, size_t max
    ) {
        // args[0] is the command name
        const auto count = args.size() - 1;
        if (count < min || count > max) {
            return std::unexpected(
                std::format(
                    "'{}' takes {} to {} arguments, got {}",
                    args[0],
                    min,
                    max,
                    count
                )
            );
        }
        return {};
    }

}  // namespace


namespace pngstash {

    std::expected<CommandArgs, std::string> parse_args(
        const std::vector<std::string>& args
    ) {
        if (args.empty())
            return std::unexpected("No command given");

        const auto& command = args[0];

        if (command == "help" || command == "--help" || command == "-h")
            return HelpArgs{};

        if (command == "encode") {
            if (auto res = ::check_arg_count(args, 3, 4); !res)
                return std::unexpected(res.error());

            EncodeArgs output;
            output.file_path_ = fromstr(args[1]);
            output.chunk_type_ = args[2];
            output.message_ = args[3];
            if (args.size() > 4)
                output.output_path_ = fromstr(args[4]);
            return output;
        }

        if (command == "decode") {
            if (auto res = ::check_arg_count(args, 2, 2); !res)
                return std::unexpected(res.error());

            return DecodeArgs{ fromstr(args[1]), args[2] };
        }

        if (command == "remove") {
            if (auto res = ::check_arg_count(args, 2, 2); !res)
                return std::unexpected(res.error());

            return RemoveArgs{ fromstr(args[1]), args[2] };
        }

        if (command == "print") {
            auto print_args = ::parse_print(args);
            if (!print_args)
                return std::unexpected(print_args.error());
            return *print_args;
        }

        return std::unexpected("Unknown command: " + command);
    }

    std::string usage_text(const std::string& program_name) {
        return std::format(
            "Usage:\n"
            "  {0} encode <file> <chunk_type> <message> [output_file]\n"
            "  {0} decode <file> <chunk_type>\n"
            "  {0} remove <file> <chunk_type>\n"
            "  {0} print <file> [--json] [--filter TYPE,TYPE,...]\n"
            "\n"
            "Pass '-' as <chunk_type> to use the configured default.",
            program_name
        );
    }

}  // namespace pngstash
