#pragma once
/**
 * ReplyDecoder.hpp
 *
 * 소켓에서 읽은 raw chunk 를 응답 문자열로 변환.
 *
 * 규칙:
 *  - 응답은 '\n' 으로 끝나는 raw text (length prefix 없음)
 *  - 한 줄 = 한 응답. 한 chunk 에 여러 줄이 오면 도착 순서대로 여러 응답 ("\n" / "\r\n" 제거)
 *  - 빈 줄은 응답으로 치지 않음
 *  - 종료자가 아직 오지 않은 마지막 부분 줄은 다음 chunk 까지 보관
 *  - 남은 부분 줄이 maxPending 을 넘으면 종료자 없이도 그대로 내보냄
 *  - 빈 chunk 는 연결 종료 신호이므로 feed 대상이 아님 (worker 가 처리)
 */

#include <cstddef>
#include <string>
#include <vector>

namespace urdash::protocol {

class ReplyDecoder {
public:
    explicit ReplyDecoder(std::size_t maxPending);

    // complete replies contained in pending + chunk, oldest first (may be empty)
    std::vector<std::string> feed(const std::string& chunk);

    // drop any partial reply (after reconnect)
    void reset();

    std::size_t pendingSize() const noexcept { return pending_.size(); }

    // strip one trailing "\n" or "\r\n"
    static std::string stripTerminator(std::string text);

private:
    std::size_t maxPending_;
    std::string pending_;
};

} // namespace urdash::protocol
