#include "response/response_extractor.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include "response/response_normalizer.hpp"

namespace harbor::response {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxFragments = 16;

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string strip_quotes(const std::string& value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

json typed_value(const std::string& text) {
    std::string lowered = text;
    for (auto& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lowered == "true") {
        return true;
    }
    if (lowered == "false") {
        return false;
    }
    if (lowered == "null" || lowered == "none") {
        return nullptr;
    }
    if (!text.empty() && (text.front() == '{' || text.front() == '[')) {
        auto parsed = json::parse(text, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }
    char* end = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (!text.empty() && end == text.c_str() + text.size()) {
        return number;
    }
    return strip_quotes(text);
}

std::optional<json> try_parse_object(const std::string& candidate) {
    auto parsed = json::parse(candidate, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        return parsed;
    }
    parsed = json::parse(ResponseExtractor::sanitize(candidate), nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        return parsed;
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> ResponseExtractor::extract_json(const std::string& raw_text) {
    return extract_json_from(raw_text, 0);
}

std::optional<std::string> ResponseExtractor::extract_json_from(const std::string& raw_text,
                                                                const std::size_t from,
                                                                std::size_t* start_out) {
    const auto start = raw_text.find('{', from);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    if (start_out != nullptr) {
        *start_out = start;
    }

    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (std::size_t i = start; i < raw_text.size(); ++i) {
        const char c = raw_text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0) {
                return raw_text.substr(start, i - start + 1);
            }
        }
    }
    return std::nullopt;
}

std::string ResponseExtractor::sanitize(const std::string& candidate) {
    std::string out;
    out.reserve(candidate.size());
    bool in_string = false;
    bool escaped = false;

    for (std::size_t i = 0; i < candidate.size(); ++i) {
        const char c = candidate[i];
        if (in_string) {
            out.push_back(c);
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
            out.push_back(c);
            continue;
        }
        if (c == '/' && i + 1 < candidate.size() && candidate[i + 1] == '/') {
            while (i < candidate.size() && candidate[i] != '\n') {
                ++i;
            }
            if (i < candidate.size()) {
                out.push_back('\n');
            }
            continue;
        }
        if (c == ',') {
            std::size_t next = i + 1;
            while (next < candidate.size() &&
                   std::isspace(static_cast<unsigned char>(candidate[next])) != 0) {
                ++next;
            }
            if (next < candidate.size() && (candidate[next] == '}' || candidate[next] == ']')) {
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

core::errors::Result<json> ResponseExtractor::parse_object(const std::string& raw_text) {
    std::size_t from = 0;
    for (std::size_t fragment = 0; fragment < kMaxFragments; ++fragment) {
        std::size_t start = 0;
        const auto candidate = extract_json_from(raw_text, from, &start);
        if (!candidate.has_value()) {
            break;
        }
        if (auto parsed = try_parse_object(candidate.value())) {
            return parsed.value();
        }
        from = start + 1;
    }

    if (auto fallback = parse_key_values(raw_text)) {
        return fallback.value();
    }

    return AgentError{ErrorCategory::Provider,
                      "Backend response did not contain a usable JSON object.",
                      "malformed_response",
                      "Respond with a single JSON object."};
}

std::optional<json> ResponseExtractor::parse_key_values(const std::string& raw_text) {
    json object = json::object();
    bool names_completion = false;

    std::istringstream in(raw_text);
    std::string line;
    while (std::getline(in, line)) {
        const auto separator = line.find_first_of(":=");
        if (separator == std::string::npos || separator == 0) {
            continue;
        }
        std::string key = trim(line.substr(0, separator));
        while (!key.empty() && (key.front() == '-' || key.front() == '*')) {
            key = trim(key.substr(1));
        }
        key = strip_quotes(key);
        const std::string value = trim(line.substr(separator + 1));
        if (key.empty() || value.empty()) {
            continue;
        }

        const auto field = ResponseNormalizer::canonical_field(key);
        if (field == CanonicalField::Unknown) {
            continue;
        }
        if (field == CanonicalField::TaskCompleted) {
            names_completion = true;
        }
        object[key] = typed_value(value);
    }

    if (!names_completion) {
        return std::nullopt;
    }
    return object;
}

}  // namespace harbor::response
