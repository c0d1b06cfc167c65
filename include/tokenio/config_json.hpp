#pragma once
#include "tokenio/reader_config.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace tio {

// JSON reader description, every key optional:
//
//   {
//     "token":  {"literal": "\n"} | {"regex": "\\s+"} | "\n",
//     "stop":   {"literal": "--end--"} | {"regex": "..."} | null,
//     "normalize": "trim" | ["trim", "lower"] | "none",
//     "filter": {"non_empty": true, "min_length": 3, "max_length": 64,
//                "regex": "^[a-z]+$", "numeric": false},
//     "fail_on_error": true,
//     "fail_on_invalid": false,
//     "chunk_bytes": 65536,
//     "max_token_bytes": 8388608
//   }
//
// Filter keys are combined with AND. Unknown keys are an error. Fields not
// present keep their value from `base`.
std::optional<ReaderConfig> parse_reader_config(std::string_view json,
                                                std::string* err_out = nullptr,
                                                const ReaderConfig& base = ReaderConfig{});

std::optional<ReaderConfig> load_reader_config(const std::string& path,
                                               std::string* err_out = nullptr,
                                               const ReaderConfig& base = ReaderConfig{});

// Builds a normalizer from a name: trim, upper, lower, none.
std::optional<NormalizeFn> normalizer_by_name(std::string_view name);

}
