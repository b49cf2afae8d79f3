#include "test_common.hpp"
#include <matebridge/bridge/state_files.hpp>
#include <matebridge/core/utils.hpp>

using namespace matebridge;
using namespace matebridge::test;

namespace {

void test_cursor() {
    test_header("update cursor");
    TempDir dir;
    StateFiles state(dir.file("state"));

    if (state.load_cursor() != 0) test_fail("missing cursor should default to 0");
    if (!state.save_cursor(812345678)) test_fail("save into a missing directory");
    if (state.load_cursor() != 812345678) test_fail("cursor round trip");
    test_pass("cursor persisted, directory created on demand");

    write_text(state.cursor_path(), "  42\n");
    if (state.load_cursor() != 42) test_fail("surrounding whitespace tolerated");
    write_text(state.cursor_path(), "42abc");
    if (state.load_cursor() != 0) test_fail("corrupt cursor should fall back to 0");
    write_text(state.cursor_path(), "");
    if (state.load_cursor() != 0) test_fail("empty cursor file");
    test_pass("unreadable values fall back to the default");
}

void test_active_chat() {
    test_header("active chat");
    TempDir dir;
    StateFiles state(dir.path());

    int64_t chat = 7;
    if (state.load_active_chat(chat)) test_fail("no chat saved yet");
    if (chat != 7) test_fail("failed load must not touch the output");

    if (!state.save_active_chat(-1001234567890LL)) test_fail("save");
    if (!state.load_active_chat(chat) || chat != -1001234567890LL) test_fail("negative ids survive");
    expect_eq(basename(state.active_chat_path()), "telegram_chat_id", "file name");
    expect_eq(basename(state.cursor_path()), "telegram_offset", "cursor file name");
    test_pass("chat id persisted");
}

} // namespace

int main() {
    quiet_logs();
    test_cursor();
    test_active_chat();
    std::cout << "\nAll state file tests passed" << std::endl;
    return 0;
}
