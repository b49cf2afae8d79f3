#include "test_common.hpp"
#include <matebridge/core/commands.hpp>
#include <matebridge/core/utils.hpp>
#include <functional>

using namespace matebridge;
using namespace matebridge::test;

namespace {

const int64_t CHAT = 4242;

void no_sleep(int) {}

// Router with fakes on both ends and a manually drained queue
struct Bridge {
    ManualClock clock;
    FakeTransport transport;
    FakeTerminal terminal;
    ConversationRegistry registry;
    std::vector<int> sleeps;
    DispatchQueue queue;
    MemoryStore store;
    PromptBuilder prompts;
    StateFiles state;
    RouterOptions opts;
    CommandRouter router;

    Bridge(const TempDir& dir, bool with_memory = true)
        : registry(std::ref(clock))
        , queue(registry, dispatcher(), nullptr, false)
        , prompts(&store, PromptOptions())
        , state(dir.file("state"))
        , opts(options(dir))
        , router(transport, terminal, registry, queue, prompts,
                 with_memory ? &store : nullptr, nullptr, &state, opts) {
        if (!store.open(dir.file("memory.db")) || !store.ensure_schema()) {
            test_fail("store setup: " + store.last_error());
        }
        router.set_sleep(no_sleep);
    }

    static RouterOptions options(const TempDir& dir) {
        RouterOptions o;
        o.history_file = dir.file("history.jsonl");
        o.projects_dir = dir.file("projects");
        return o;
    }

    DispatchFn dispatcher() {
        return [this](const DispatchItem& item) -> bool {
            SleepFn record = [this](int ms) { sleeps.push_back(ms); };
            return CommandRouter::type_into_terminal(terminal, item, record);
        };
    }

    void say(const std::string& text, int64_t message_id = 0) {
        ChatUpdate u;
        u.kind = ChatUpdate::MESSAGE;
        u.chat_id = CHAT;
        u.message_id = message_id;
        u.text = text;
        router.handle_update(u);
    }

    void press(const std::string& data) {
        ChatUpdate u;
        u.kind = ChatUpdate::INTERACTION;
        u.chat_id = CHAT;
        u.interaction_id = "cb-" + data;
        u.interaction_data = data;
        router.handle_update(u);
    }
};

void expect_keys(FakeTerminal& terminal, const std::vector<std::string>& expected, const std::string& what) {
    std::vector<std::string> keys = terminal.snapshot();
    expect_eq(join(keys, " | "), join(expected, " | "), what);
}

void test_parsing() {
    test_header("parse_command / is_blocked");
    std::string command, args;
    CommandRouter::parse_command("  /Status@mate_bot   now please ", command, args);
    expect_eq(command, "/status", "command lowercased, bot suffix dropped");
    expect_eq(args, "now please", "args trimmed");
    CommandRouter::parse_command("/loop\nmulti\nline", command, args);
    expect_eq(command, "/loop", "newline ends the command");
    expect_eq(args, "multi\nline", "args keep their newlines");
    test_pass("command parsing");

    if (!CommandRouter::is_blocked("/model") || !CommandRouter::is_blocked("/compact")) test_fail("blocked");
    if (CommandRouter::is_blocked("/help") || CommandRouter::is_blocked("/status")) test_fail("not blocked");
    test_pass("interactive commands blocked");
}

void test_registration() {
    test_header("registration");
    TempDir dir;
    Bridge b(dir);
    std::vector<BotCommand> cmds = b.router.bot_commands();
    if (cmds.size() != 13) test_fail("expected 13 commands, got " + str(cmds.size()));
    expect_eq(cmds[0].command, "clear", "first command");
    expect_eq(cmds[2].command, "continue_", "continue command name");
    expect_eq(cmds[12].command, "help", "last command");
    test_pass("commands advertised in order without slashes");

    b.say("/help");
    std::string help = b.transport.last_text();
    if (help.find("/loop - Ralph Loop: /loop <prompt>") == std::string::npos) test_fail("help lists commands");
    if (help.find("claude") == std::string::npos) test_fail("help names the session");
    test_pass("/help");
}

void test_plain_message() {
    test_header("plain message");
    TempDir dir;
    Bridge b(dir);
    b.say("run the tests", 91);

    if (b.transport.reactions.size() != 1) test_fail("message should be acknowledged");
    expect_eq(b.transport.reactions[0], "91:✅", "reaction");
    if (!b.queue.has_queued("4242")) test_fail("message should be queued");
    if (b.queue.drain_once() != 1) test_fail("dispatch");

    std::vector<std::string> expected;
    expected.push_back("text:run the tests");
    expected.push_back("Enter");
    expect_keys(b.terminal, expected, "typed into the terminal");
    if (!b.sleeps.empty()) test_fail("plain prompts need no pause");
    if (!b.registry.is_pending("4242")) test_fail("reply should be pending");

    int64_t chat = 0;
    if (!b.state.load_active_chat(chat) || chat != CHAT) test_fail("active chat persisted");
    test_pass("message acknowledged, queued and typed");

    b.store.add("4242", "the tests need docker running", MemoryMetadata(), MemoryKind::MANUAL);
    b.registry.clear_pending("4242");
    b.say("tests");
    b.queue.drain_once();
    std::vector<std::string> keys = b.terminal.snapshot();
    if (keys.size() != 4 || keys[2].find("text:【历史记忆】") != 0) test_fail("memories injected");
    if (keys[2].find("\n\n---\n\ntests") == std::string::npos) test_fail("user text last");
    test_pass("relevant memories prepended");
}

void test_missing_terminal() {
    test_header("missing terminal");
    TempDir dir;
    Bridge b(dir);
    b.terminal.exists = false;
    b.say("hello");
    expect_eq(b.transport.last_text(), "tmux not found", "warning");
    if (b.queue.queued() != 0) test_fail("nothing should be queued");

    b.say("/loop do it");
    expect_eq(b.transport.last_text(), "tmux not found", "loop warning");
    b.say("/status");
    expect_eq(b.transport.last_text(), "tmux 'claude': not found", "status");
    test_pass("messages refused without a session");
}

void test_loops() {
    test_header("loops");
    TempDir dir;
    Bridge b(dir);
    b.say("/loop");
    expect_eq(b.transport.last_text(), "Usage: /loop <prompt>", "usage");

    b.say("/loop fix \"all\" warnings");
    expect_eq(b.transport.last_text(), "Ralph Loop started (max 5 iterations)", "loop reply");
    b.queue.drain_once();
    std::vector<std::string> expected;
    expected.push_back("text:/ralph-loop:ralph-loop \"fix \\\"all\\\" warnings Output <promise>DONE</promise>"
                       " when complete.\" --max-iterations 5 --completion-promise \"DONE\"");
    expected.push_back("Enter");
    expect_keys(b.terminal, expected, "loop payload");
    if (b.sleeps.size() != 1 || b.sleeps[0] != 300) test_fail("pause before Enter");
    test_pass("/loop wraps the task");

    b.registry.clear_pending("4242");
    b.say("/meta_loop learn the layout");
    expect_eq(b.transport.last_text(), "Meta Loop started (auto-memory enabled, max 5 iterations)", "meta reply");
    b.queue.drain_once();
    std::vector<std::string> keys = b.terminal.snapshot();
    if (keys[2].find("用户请求: learn the layout") == std::string::npos) test_fail("meta loop prompt");
    ConversationContext ctx;
    b.registry.get("4242", ctx);
    expect_eq(ctx.last_user_message, "learn the layout", "user message kept apart from the prompt");
    test_pass("/meta_loop sends the self-updating prompt");
}

void test_stop_and_clear() {
    test_header("/stop and /clear");
    TempDir dir;
    Bridge b(dir);
    b.say("first");
    b.queue.drain_once();
    b.say("second");

    b.say("/stop");
    expect_eq(b.transport.last_text(), "Interrupted", "stop reply");
    if (b.queue.has_queued("4242")) test_fail("queued item should be dropped");
    if (b.registry.is_pending("4242")) test_fail("pending should be cleared");
    if (b.terminal.snapshot().back() != "Escape") test_fail("Escape sent");
    test_pass("/stop interrupts and forgets the turn");

    b.say("/clear");
    expect_eq(b.transport.last_text(), "Cleared", "clear reply");
    std::vector<std::string> keys = b.terminal.snapshot();
    if (keys.size() < 3) test_fail("clear keystrokes");
    expect_eq(keys[keys.size() - 3], "Escape", "escape first");
    expect_eq(keys[keys.size() - 2], "text:/clear", "clear command");
    expect_eq(keys[keys.size() - 1], "Enter", "enter last");
    test_pass("/clear");
}

void test_memory_commands() {
    test_header("memory commands");
    TempDir dir;
    Bridge b(dir);

    b.say("/remember");
    expect_eq(b.transport.last_text(), "Usage: /remember <text>", "usage");
    b.say("/remember user likes green tea");
    expect_eq(b.transport.last_text(), "✅ Saved to memory", "saved");

    b.say("/recall tea");
    expect_eq(b.transport.last_text(), "📚 Your memories:\n\n1. user likes green tea", "recall");
    b.say("/recall coffee");
    expect_eq(b.transport.last_text(), "No memories found", "no match");
    b.say("/recall");
    expect_eq(b.transport.last_text(), "📚 Your memories:\n\n1. user likes green tea", "recent");
    test_pass("/remember and /recall");

    b.say("/memstats");
    std::string stats = b.transport.last_text();
    if (stats.find("Total: 1 memories") == std::string::npos) test_fail("total");
    if (stats.find("manual: 1") == std::string::npos) test_fail("by kind");
    b.say("/metamem");
    expect_eq(b.transport.last_text(), "No meta-update memories found", "metamem empty");
    test_pass("/memstats and /metamem");

    b.say("/forget tea");
    expect_eq(b.transport.last_text(), "🗑️ Deleted 1 memory(s)", "forget");
    b.say("/forget tea");
    expect_eq(b.transport.last_text(), "🗑️ Deleted 0 memory(s)", "forget with nothing left to match");
    b.say("/remember a");
    b.say("/remember b");
    b.say("/forget ALL");
    expect_eq(b.transport.last_text(), "🗑️ All memories cleared", "forget all");
    if (b.store.stats("4242").count != 0) test_fail("records left");
    test_pass("/forget");

    TempDir other;
    Bridge off(other, false);
    off.say("/recall x");
    expect_eq(off.transport.last_text(), "Memory is disabled", "disabled");
    test_pass("memory commands report when disabled");
}

void test_other_commands() {
    test_header("blocked and unknown commands");
    TempDir dir;
    Bridge b(dir);
    b.say("/model");
    expect_eq(b.transport.last_text(), "'/model' not supported (interactive)", "blocked");
    size_t before = b.transport.sent_count();
    b.say("/nonsense");
    if (b.transport.sent_count() != before) test_fail("unknown command answered");
    if (!b.terminal.snapshot().empty()) test_fail("unknown command typed");
    test_pass("blocked commands refused, unknown ignored");
}

void test_resume() {
    test_header("/resume");
    TempDir dir;
    Bridge b(dir);
    b.say("/resume");
    expect_eq(b.transport.last_text(), "No sessions", "no history");

    write_text(dir.file("history.jsonl"),
               "{\"display\":\"fix the login bug\",\"project\":\"/home/u/app\",\"timestamp\":20}\n"
               "{\"display\":\"orphan\",\"project\":\"/gone\",\"timestamp\":10}\n");
    mkdir_p(dir.file("projects/-home-u-app"));
    write_text(dir.file("projects/-home-u-app/abcdef123456.jsonl"), "{}\n");

    b.say("/resume");
    expect_eq(b.transport.menu_prompt, "Select session:", "menu prompt");
    if (b.transport.menu.size() != 2) test_fail("expected 2 options, got " + str(b.transport.menu.size()));
    expect_eq(b.transport.menu[0].data, "continue_recent", "continue option first");
    expect_eq(b.transport.menu[1].label, "fix the login bug...", "session label");
    expect_eq(b.transport.menu[1].data, "resume:abcdef123456", "session payload");
    test_pass("menu lists sessions that still have transcripts");

    b.press("resume:abcdef123456");
    if (b.transport.answered.size() != 1) test_fail("callback acknowledged");
    std::vector<std::string> expected;
    expected.push_back("Escape");
    expected.push_back("text:/exit");
    expected.push_back("Enter");
    expected.push_back("text:claude --resume abcdef123456 --dangerously-skip-permissions");
    expected.push_back("Enter");
    expect_keys(b.terminal, expected, "restart sequence");
    expect_eq(b.transport.last_text(), "Resuming: abcdef12...", "resume reply");
    test_pass("menu choice restarts the agent on that session");

    b.press("continue_recent");
    expect_eq(b.terminal.snapshot().back(), "Enter", "continue sequence");
    expect_eq(b.terminal.snapshot()[8], "text:claude --continue --dangerously-skip-permissions", "continue args");
    expect_eq(b.transport.last_text(), "Continuing most recent...", "continue reply");
    test_pass("continue option");
}

} // namespace

int main() {
    quiet_logs();
    test_parsing();
    test_registration();
    test_plain_message();
    test_missing_terminal();
    test_loops();
    test_stop_and_clear();
    test_memory_commands();
    test_other_commands();
    test_resume();
    std::cout << "\nAll command tests passed" << std::endl;
    return 0;
}
