// src/protocol/Parser.cpp
#include "protocol/Parser.hpp"

#include <algorithm>
#include <cctype>

namespace urdash::protocol {

namespace {
    static std::string to_lower(const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    static std::string first_word(const std::string& s) {
        auto end = s.find_first_of(" \t");
        return s.substr(0, end);
    }
} // namespace

std::string Parser::trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool Parser::startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

ReplyFields Parser::parse(const std::string& reply) {
    ReplyFields fields;
    fields.raw = reply;

    auto pos = reply.find(':');
    if (pos == std::string::npos) {
        return fields;
    }
    fields.key = trim(reply.substr(0, pos));
    fields.value = trim(reply.substr(pos + 1));
    fields.valid = !fields.key.empty();
    return fields;
}

std::optional<bool> Parser::parseBool(const std::string& reply) {
    auto fields = parse(reply);
    std::string word = fields.valid ? first_word(fields.value) : first_word(trim(reply));
    word = to_lower(word);
    if (word == "true") return true;
    if (word == "false") return false;
    return std::nullopt;
}

} // namespace urdash::protocol
