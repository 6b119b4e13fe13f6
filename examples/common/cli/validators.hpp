#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace rallycode::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"});


// -------------------------------------------------------------
// JSON input validator
// -------------------------------------------------------------
inline auto json_file_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.size() >= 5 && value.compare(value.size() - 5, 5, ".json") == 0) {
            return {};
        }
        return "Input must be a .json file of charted point rows";
    },
    "JSON file validator"
);

} // namespace rallycode::examples::cli
