#include "test_common.hpp"
#include <matebridge/terminal/tmux_driver.hpp>

using namespace matebridge;
using namespace matebridge::test;

namespace {

// "true" and "false" accept any arguments, which stands in for tmux
void test_success() {
    test_header("successful commands");
    TmuxDriver driver("claude", "true");
    expect_eq(driver.session(), "claude", "session name");
    if (!driver.session_exists()) test_fail("has-session");
    if (!driver.send_literal_text("hello \"world\" $HOME")) test_fail("send-keys -l");
    if (!driver.send_enter()) test_fail("Enter");
    if (!driver.send_interrupt()) test_fail("Escape");
    expect_eq(driver.last_error(), "", "no error recorded");
    test_pass("exit status 0 is success");
}

void test_failure() {
    test_header("failing commands");
    TmuxDriver driver("claude", "false");
    if (driver.session_exists()) test_fail("missing session reported as present");
    expect_eq(driver.last_error(), "false has-session exited with status 1", "exit status error");
    if (driver.send_literal_text("x")) test_fail("send-keys should fail");
    expect_eq(driver.last_error(), "false send-keys exited with status 1", "send-keys error");
    test_pass("non-zero exit reported with the subcommand");
}

void test_missing_binary() {
    test_header("missing binary");
    TmuxDriver driver("claude", "/nonexistent/matebridge-tmux");
    if (driver.session_exists()) test_fail("missing binary");
    expect_eq(driver.last_error(), "/nonexistent/matebridge-tmux could not be started", "start error");
    test_pass("unstartable binary reported");
}

} // namespace

int main() {
    quiet_logs();
    test_success();
    test_failure();
    test_missing_binary();
    std::cout << "\nAll tmux driver tests passed" << std::endl;
    return 0;
}
