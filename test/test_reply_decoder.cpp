#include "test_util.hpp"

#include "protocol/ReplyDecoder.hpp"

#include <string>

using namespace urdash::protocol;

static void test_complete_line() {
    std::fprintf(stderr, "-- test_complete_line\n");
    ReplyDecoder dec(64);
    auto r = dec.feed("Starting program\n");
    CHECK_EQ(r.size(), 1u);
    CHECK(r.size() == 1 && r[0] == "Starting program");
    CHECK_EQ(dec.pendingSize(), 0u);
}

static void test_crlf_terminator() {
    std::fprintf(stderr, "-- test_crlf_terminator\n");
    ReplyDecoder dec(64);
    auto r = dec.feed("Robotmode: RUNNING\r\n");
    CHECK(r.size() == 1 && r[0] == "Robotmode: RUNNING");
}

static void test_split_reply() {
    std::fprintf(stderr, "-- test_split_reply\n");
    ReplyDecoder dec(64);
    CHECK(dec.feed("Program run").empty());
    CHECK_EQ(dec.pendingSize(), 11u);
    CHECK(dec.feed("ning: ").empty());
    auto r = dec.feed("true\n");
    CHECK(r.size() == 1 && r[0] == "Program running: true");
    CHECK_EQ(dec.pendingSize(), 0u);
}

static void test_two_replies_in_one_read() {
    std::fprintf(stderr, "-- test_two_replies_in_one_read\n");
    ReplyDecoder dec(64);
    auto r = dec.feed("Starting program\nStopped\r\nPaus");
    CHECK_EQ(r.size(), 2u);
    CHECK(r.size() == 2 && r[0] == "Starting program");
    CHECK(r.size() == 2 && r[1] == "Stopped");
    CHECK_EQ(dec.pendingSize(), 4u);

    r = dec.feed("ing program\n");
    CHECK(r.size() == 1 && r[0] == "Pausing program");
}

static void test_blank_lines_skipped() {
    std::fprintf(stderr, "-- test_blank_lines_skipped\n");
    ReplyDecoder dec(64);
    auto r = dec.feed("\n\r\nStopped\n\n");
    CHECK(r.size() == 1 && r[0] == "Stopped");
    CHECK(dec.feed("").empty());
    CHECK_EQ(dec.pendingSize(), 0u);
}

static void test_oversized_without_terminator() {
    std::fprintf(stderr, "-- test_oversized_without_terminator\n");
    ReplyDecoder dec(8);
    CHECK(dec.feed("12345678").empty());
    auto r = dec.feed("9");
    CHECK(r.size() == 1 && r[0] == "123456789");
    CHECK_EQ(dec.pendingSize(), 0u);
}

static void test_reset_discards_partial() {
    std::fprintf(stderr, "-- test_reset_discards_partial\n");
    ReplyDecoder dec(64);
    dec.feed("Loading prog");
    dec.reset();
    CHECK_EQ(dec.pendingSize(), 0u);
    auto r = dec.feed("Stopped\n");
    CHECK(r.size() == 1 && r[0] == "Stopped");
}

static void test_strip_terminator() {
    std::fprintf(stderr, "-- test_strip_terminator\n");
    CHECK(ReplyDecoder::stripTerminator("play\n") == "play");
    CHECK(ReplyDecoder::stripTerminator("play\r\n") == "play");
    CHECK(ReplyDecoder::stripTerminator("play") == "play");
    CHECK(ReplyDecoder::stripTerminator("").empty());
    CHECK(ReplyDecoder::stripTerminator("a\n\n") == "a\n");
}

int main() {
    test_complete_line();
    test_crlf_terminator();
    test_split_reply();
    test_two_replies_in_one_read();
    test_blank_lines_skipped();
    test_oversized_without_terminator();
    test_reset_discards_partial();
    test_strip_terminator();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
