#include "test_common.hpp"
#include <matebridge/bridge/conversation.hpp>
#include <matebridge/bridge/typing_indicator.hpp>
#include <functional>

using namespace matebridge;
using namespace matebridge::test;

namespace {

void test_contexts() {
    test_header("contexts");
    ManualClock clock;
    ConversationRegistry registry(std::ref(clock));

    expect_eq(ConversationRegistry::owner_for(-100123), "-100123", "owner string");
    ConversationContext ctx = registry.ensure(-100123);
    expect_eq(ctx.owner, "-100123", "ensured owner");
    if (ctx.chat_id != -100123) test_fail("chat id kept");

    ConversationContext missing;
    if (registry.get("999", missing)) test_fail("unknown owner found");

    registry.record_user_message("-100123", "fix the build", "[memory]\n\nfix the build");
    registry.ensure(-100123);
    if (!registry.get("-100123", ctx)) test_fail("owner lost");
    expect_eq(ctx.last_user_message, "fix the build", "user message survives ensure");
    expect_eq(ctx.last_prompt, "[memory]\n\nfix the build", "prompt recorded");
    test_pass("ensure is idempotent and keeps recorded messages");

    registry.record_user_message("999", "x", "x");
    if (registry.owners().size() != 1) test_fail("recording for unknown owner created a context");
    test_pass("unknown owners ignored");
}

void test_pending() {
    test_header("pending marker");
    ManualClock clock;
    ConversationRegistry registry(std::ref(clock));
    registry.ensure(1);

    if (registry.is_pending("1")) test_fail("fresh context pending");
    if (registry.pending_age_ms("1") != 0) test_fail("age without pending");

    registry.set_pending("1");
    clock.now += 1500;
    if (!registry.is_pending("1")) test_fail("pending not set");
    if (registry.pending_age_ms("1") != 1500) test_fail("age " + str(registry.pending_age_ms("1")));
    test_pass("age follows the clock");

    registry.clear_pending("1");
    if (registry.is_pending("1") || registry.pending_age_ms("1") != 0) test_fail("clear");
    test_pass("clear resets the marker");
}

void test_active_owner() {
    test_header("active owner");
    ManualClock clock;
    ConversationRegistry registry(std::ref(clock));
    registry.ensure(1);
    registry.ensure(2);

    std::string owner;
    if (registry.active_owner(owner)) test_fail("no owner should be active");

    registry.set_pending("2");
    clock.now += 10;
    registry.set_pending("1");
    if (!registry.active_owner(owner)) test_fail("active owner missing");
    expect_eq(owner, "1", "newest pending wins");

    registry.clear_pending("1");
    registry.active_owner(owner);
    expect_eq(owner, "2", "falls back to the remaining pending owner");
    test_pass("active owner is the newest pending dispatch");
}

void test_typing() {
    test_header("typing indicator");
    ManualClock clock;
    ConversationRegistry registry(std::ref(clock));
    FakeTransport transport;
    TypingIndicator typing(transport, registry);
    typing.set_interval(4000);

    registry.ensure(5);
    registry.set_pending("5");
    typing.start_typing("5");
    if (transport.typing_count != 1) test_fail("first indicator should be immediate");

    typing.tick();
    if (transport.typing_count != 1) test_fail("indicator not throttled");
    clock.now += 4000;
    typing.tick();
    if (transport.typing_count != 2) test_fail("indicator not refreshed after the interval");
    test_pass("refreshed once per interval");

    registry.clear_pending("5");
    clock.now += 4000;
    typing.tick();
    if (transport.typing_count != 2) test_fail("indicator sent after the reply");
    if (!typing.active_chats().empty()) test_fail("chat still marked typing");
    test_pass("stops once the reply is no longer pending");

    registry.set_pending("5");
    typing.start_typing("5");
    typing.stop_typing("5");
    clock.now += 4000;
    typing.tick();
    if (transport.typing_count != 3) test_fail("explicit stop ignored");
    test_pass("explicit stop");
}

} // namespace

int main() {
    quiet_logs();
    test_contexts();
    test_pending();
    test_active_owner();
    test_typing();
    std::cout << "\nAll conversation tests passed" << std::endl;
    return 0;
}
