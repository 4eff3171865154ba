#include "protocol/ReplyDecoder.hpp"

#include "spdlog/spdlog.h"

#include <utility>

namespace urdash::protocol {

ReplyDecoder::ReplyDecoder(std::size_t maxPending)
    : maxPending_(maxPending) {}

std::vector<std::string> ReplyDecoder::feed(const std::string& chunk) {
    std::vector<std::string> replies;
    pending_ += chunk;

    std::size_t start = 0;
    std::size_t nl = pending_.find('\n', start);
    while (nl != std::string::npos) {
        auto line = stripTerminator(pending_.substr(start, nl - start + 1));
        if (!line.empty()) replies.push_back(std::move(line)); // blank lines carry no reply
        start = nl + 1;
        nl = pending_.find('\n', start);
    }
    pending_.erase(0, start);

    if (pending_.size() > maxPending_) {
        spdlog::warn("Reply exceeded {} bytes without a line terminator, publishing as is.", maxPending_);
        replies.push_back(std::move(pending_));
        pending_.clear();
    }
    return replies;
}

void ReplyDecoder::reset() {
    if (!pending_.empty()) {
        spdlog::debug("Discarding {} bytes of partial reply.", pending_.size());
    }
    pending_.clear();
}

std::string ReplyDecoder::stripTerminator(std::string text) {
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    return text;
}

} // namespace urdash::protocol
