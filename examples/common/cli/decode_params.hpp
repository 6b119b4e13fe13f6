#pragma once

#include <string>
#include <ostream>
#include <cstdlib>
#include <iostream>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"
#include "rallycode/config/decoder.hpp"

namespace rallycode::examples::cli::decode {

struct Params {
    std::string input;
    unsigned workers      = rallycode::config::decoder::DEFAULT_WORKERS;
    std::string log_level = "info";
    bool print            = false;
    bool color            = false;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Input     : " << input << "\n"
           << "  Workers   : " << workers << "\n"
           << "  Log Level : " << log_level << "\n"
           << "  Print     : " << (print ? "yes" : "no") << "\n"
           << "  Color     : " << (color ? "yes" : "no") << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-i,--input", params.input, "JSON file with charted point rows")
        ->required()->check(CLI::ExistingFile)->check(json_file_validator);
    app.add_option("-w,--workers", params.workers, "Decoder worker threads")
        ->check(CLI::Range(1u, rallycode::config::decoder::MAX_WORKERS))->default_val(params.workers);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")
        ->check(log_level_validator)->default_val(params.log_level);
    app.add_flag("-p,--print", params.print, "Print every decoded point shot by shot");
    app.add_flag("--color", params.color, "Colored log output");

    app.footer(
        "Rows that cannot be decoded are logged and skipped.\n"
        "The summary only covers the points that decoded."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    configure_logger(params.log_level, params.color);
    return params;
}

} // namespace rallycode::examples::cli::decode
