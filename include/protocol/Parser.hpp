#pragma once
#include <optional>
#include <string>

namespace urdash::protocol {

/**
 * ReplyFields: parsed dashboard reply
 * - valid: reply had the "Key: value" shape
 * - key: text before the first ':' (e.g., "Robotmode", "Program running")
 * - value: trimmed text after it (e.g., "RUNNING", "true")
 * - raw: original reply
 */
struct ReplyFields {
    bool valid{false};
    std::string key;
    std::string value;
    std::string raw;
};

struct Parser {
    static ReplyFields parse(const std::string& reply);

    // "true"/"false" as the value of a "Key: value" reply or as the leading word
    // ("isProgramSaved" answers "true <program>"). std::nullopt otherwise.
    static std::optional<bool> parseBool(const std::string& reply);

    static bool startsWith(const std::string& text, const std::string& prefix);

    static std::string trim(const std::string& s);
};

} // namespace urdash::protocol
