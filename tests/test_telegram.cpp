#include "test_common.hpp"
#include <matebridge/channels/telegram/telegram.hpp>

using namespace matebridge;
using namespace matebridge::test;

namespace {

void test_label_chunks() {
    test_header("label_chunks");
    std::vector<std::string> parts = TelegramTransport::label_chunks("short reply", 4000);
    if (parts.size() != 1) test_fail("short text should stay whole");
    expect_eq(parts[0], "short reply", "no label on a single part");
    test_pass("fitting text unchanged");

    parts = TelegramTransport::label_chunks(std::string(50, 'a'), 40);
    if (parts.size() != 3) test_fail("expected 3 parts, got " + str(parts.size()));
    expect_eq(parts[0], "[1/3]\n" + std::string(24, 'a'), "first part");
    expect_eq(parts[2], "[3/3]\n" + std::string(2, 'a'), "last part");
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].size() > 40) test_fail("part exceeds the limit");
    }
    test_pass("hard splits labelled [i/n]");

    std::string text = std::string(20, 'x') + "\n" + std::string(20, 'y');
    parts = TelegramTransport::label_chunks(text, 40);
    if (parts.size() != 2) test_fail("newline split expected");
    expect_eq(parts[0], "[1/2]\n" + std::string(20, 'x'), "split at the newline");
    expect_eq(parts[1], "[2/2]\n" + std::string(20, 'y'), "newline dropped");
    test_pass("prefers newline boundaries");

    std::string cjk;
    for (int i = 0; i < 3000; ++i) cjk += "记";
    parts = TelegramTransport::label_chunks(cjk, TelegramTransport::MAX_MESSAGE_BYTES);
    std::string rejoined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].size() > TelegramTransport::MAX_MESSAGE_BYTES) test_fail("part too large");
        rejoined += parts[i].substr(parts[i].find('\n') + 1);
    }
    if (rejoined != cjk) test_fail("multi-byte text damaged by splitting");
    test_pass("UTF-8 sequences never cut");
}

void test_parse_message() {
    test_header("parse_update message");
    Json update = Json::parse(
        "{\"update_id\": 1001, \"message\": {\"message_id\": 55,"
        " \"from\": {\"id\": 9, \"first_name\": \"Ada\", \"last_name\": \"L\", \"username\": \"ada\"},"
        " \"chat\": {\"id\": -100200300, \"type\": \"group\"}, \"text\": \"/status@mate_bot\"}}");
    ChatUpdate u;
    if (!TelegramTransport::parse_update(update, u)) test_fail("message rejected");
    if (u.kind != ChatUpdate::MESSAGE) test_fail("kind");
    if (u.update_id != 1001 || u.chat_id != -100200300 || u.message_id != 55) test_fail("ids");
    expect_eq(u.text, "/status@mate_bot", "text");
    expect_eq(u.from_name, "Ada L (@ada)", "sender");
    test_pass("text message");

    update = Json::parse(
        "{\"update_id\": 1002, \"message\": {\"message_id\": 56, \"chat\": {\"id\": 5},"
        " \"caption\": \"look at this\"}}");
    if (!TelegramTransport::parse_update(update, u)) test_fail("caption rejected");
    expect_eq(u.text, "look at this", "caption used as text");

    update = Json::parse("{\"update_id\": 1003, \"message\": {\"message_id\": 57, \"chat\": {\"id\": 5}}}");
    if (TelegramTransport::parse_update(update, u)) test_fail("message without text accepted");
    if (u.update_id != 1003) test_fail("update id still reported");
    test_pass("captions accepted, empty messages skipped");
}

void test_parse_callback() {
    test_header("parse_update callback");
    Json update = Json::parse(
        "{\"update_id\": 2001, \"callback_query\": {\"id\": \"cbq-1\", \"data\": \"resume:abc\","
        " \"from\": {\"first_name\": \"Bo\"},"
        " \"message\": {\"message_id\": 77, \"chat\": {\"id\": 12}}}}");
    ChatUpdate u;
    if (!TelegramTransport::parse_update(update, u)) test_fail("callback rejected");
    if (u.kind != ChatUpdate::INTERACTION) test_fail("kind");
    expect_eq(u.interaction_id, "cbq-1", "callback id");
    expect_eq(u.interaction_data, "resume:abc", "callback data");
    if (u.chat_id != 12 || u.message_id != 77) test_fail("origin message");
    expect_eq(u.from_name, "Bo", "sender");
    test_pass("menu button press");

    update = Json::parse("{\"update_id\": 2002, \"edited_message\": {\"text\": \"x\"}}");
    if (TelegramTransport::parse_update(update, u)) test_fail("edited messages unsupported");
    test_pass("other update kinds ignored");
}

} // namespace

int main() {
    quiet_logs();
    test_label_chunks();
    test_parse_message();
    test_parse_callback();
    std::cout << "\nAll telegram tests passed" << std::endl;
    return 0;
}
