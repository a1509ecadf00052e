#pragma once

#include <nlohmann/json.hpp>

#include "command/args.hpp"
#include "pngstash/auxiliary/app_configs.hpp"
#include "pngstash/image/png.hpp"


namespace pngstash {

    enum ExitCode : int {
        EXIT_OK = 0,
        EXIT_USAGE = 1,
        EXIT_IO = 2,
        EXIT_INVALID_SIGNATURE = 10,
        EXIT_INVALID_FORMAT = 11,
        EXIT_UNEXPECTED_EOF = 12,
        EXIT_CRC_MISMATCH = 13,
        EXIT_CHUNK_NOT_FOUND = 14,
        EXIT_INVALID_UTF8 = 15,
    };

    ExitCode to_exit_code(PngErrc code);


    nlohmann::json make_png_json(
        const Png& png, const std::vector<std::string>& filter
    );


    class CommandRunner {

    public:
        explicit CommandRunner(const AppConfigs& configs) : configs_(configs) {}

        int run(const CommandArgs& args);

    private:
        int run_one(const EncodeArgs& args);
        int run_one(const DecodeArgs& args);
        int run_one(const RemoveArgs& args);
        int run_one(const PrintArgs& args);
        int run_one(const HelpArgs& args);

        PngResult<std::string> resolve_chunk_type(const std::string& arg) const;

        const AppConfigs& configs_;
    };

}  // namespace pngstash
