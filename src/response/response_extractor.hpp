#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace harbor::response {

// Pulls a JSON object out of free-form backend text: prose before or after
// it, markdown fences, comments and trailing commas are all tolerated.
class ResponseExtractor {
public:
    // Substring from the first '{' to the brace that balances it. Braces
    // inside string literals are not counted.
    static std::optional<std::string> extract_json(const std::string& raw_text);

    // Same scan, starting at `from`.
    static std::optional<std::string> extract_json_from(const std::string& raw_text,
                                                        std::size_t from,
                                                        std::size_t* start_out = nullptr);

    // Removes `//` line comments and trailing commas outside string literals.
    static std::string sanitize(const std::string& candidate);

    // Best effort: the first balanced fragment that parses as a JSON object,
    // or, failing that, `key: value` lines naming a completion field.
    static core::errors::Result<nlohmann::json> parse_object(const std::string& raw_text);

    static std::optional<nlohmann::json> parse_key_values(const std::string& raw_text);
};

}  // namespace harbor::response
