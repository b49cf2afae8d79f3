#include "test_common.hpp"
#include <matebridge/bridge/response_coordinator.hpp>
#include <matebridge/bridge/dispatch_queue.hpp>
#include <functional>
#include <cstdio>

using namespace matebridge;
using namespace matebridge::test;

namespace {

// Shared wiring for one coordinator under test
struct Harness {
    ManualClock clock;
    ConversationRegistry registry;
    FakeTransport transport;
    MemoryStore store;
    std::string transcript;
    ResponseCoordinator coordinator;

    Harness(const TempDir& dir, const CoordinatorOptions& opts = CoordinatorOptions())
        : registry(std::ref(clock))
        , coordinator(registry, transport, &store, locator(), opts) {
        if (!store.open(dir.file("memory.db")) || !store.ensure_schema()) {
            test_fail("store setup: " + store.last_error());
        }
    }

    LocateFn locator() {
        return [this]() { return transcript; };
    }

    void ask(int64_t chat_id, const std::string& question) {
        std::string owner = ConversationRegistry::owner_for(chat_id);
        registry.ensure(chat_id);
        registry.record_user_message(owner, question, question);
        registry.set_pending(owner);
    }
};

void expect_result(CheckResult actual, CheckResult expected, const std::string& what) {
    expect_eq(check_result_str(actual), check_result_str(expected), what);
}

int64_t offset_of(const ResponseCoordinator& c, const std::string& path) {
    TailState ts;
    if (!c.get_tail_state(path, ts)) return -1;
    return ts.read_offset;
}

void test_idle_and_missing_log() {
    test_header("idle / missing transcript");
    TempDir dir;
    Harness h(dir);
    expect_result(h.coordinator.check_for_responses(), CheckResult::IDLE, "nobody waiting");
    if (h.coordinator.state() != CoordinatorState::IDLE) test_fail("state should be idle");

    h.ask(1, "hello");
    expect_result(h.coordinator.check_for_responses(), CheckResult::NO_LOG, "no transcript located");
    h.transcript = dir.file("missing.jsonl");
    expect_result(h.coordinator.check_for_responses(), CheckResult::NO_LOG, "located file absent");
    if (!h.registry.is_pending("1")) test_fail("missing transcript should not clear pending");
    test_pass("nothing to read leaves the request pending");
}

void test_delivery_with_annotation() {
    test_header("delivery with annotation");
    TempDir dir;
    Harness h(dir);
    h.transcript = dir.file("session.jsonl");
    write_text(h.transcript, "");
    h.ask(77, "what is the context?");

    expect_result(h.coordinator.check_for_responses(), CheckResult::NO_CONTENT, "empty transcript");

    append_text(h.transcript, user_line("what is the context?"));
    append_text(h.transcript, assistant_line("A -- memory\nctx = x\n-- done"));
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "reply delivered");

    if (h.transport.sent_count() != 1) test_fail("one message expected");
    if (h.transport.sent[0].chat_id != 77) test_fail("wrong chat");
    expect_eq(h.transport.last_text(), "A", "annotation stripped from the reply");
    if (h.registry.is_pending("77")) test_fail("delivery should clear pending");
    if (offset_of(h.coordinator, h.transcript) != file_size(h.transcript)) test_fail("offset committed");
    test_pass("display text sent, pending cleared, offset committed");

    std::vector<MemoryRecord> meta = h.store.get_by_kind("77", MemoryKind::META_UPDATE, 10);
    if (meta.size() != 1) test_fail("annotation not stored");
    if (meta[0].content.find("ctx = x") == std::string::npos) test_fail("annotation content");
    expect_eq(meta[0].metadata["source"], "transcript", "annotation source");
    std::vector<MemoryRecord> conv = h.store.get_by_kind("77", MemoryKind::CONVERSATION, 10);
    if (conv.size() != 1) test_fail("Q/A not stored");
    expect_eq(conv[0].content, "Q: what is the context?\nA: A", "Q/A record");
    expect_eq(conv[0].metadata["chat_id"], "77", "chat id metadata");
    test_pass("annotation and Q/A stored for the owner");

    expect_result(h.coordinator.check_for_responses(), CheckResult::IDLE, "nothing pending after delivery");
    h.ask(77, "again?");
    expect_result(h.coordinator.check_for_responses(), CheckResult::NO_CONTENT, "no replay");
    if (h.transport.sent_count() != 1) test_fail("old output delivered twice");
    test_pass("delivered output never replayed");
}

void test_annotation_only() {
    test_header("annotation-only output");
    TempDir dir;
    Harness h(dir);
    h.transcript = dir.file("session.jsonl");
    write_text(h.transcript, assistant_line("<fact>user prefers rust</fact>"));
    h.ask(5, "note this");

    expect_result(h.coordinator.check_for_responses(), CheckResult::ANNOTATION_ONLY, "annotation only");
    if (h.transport.sent_count() != 0) test_fail("nothing should be sent");
    if (!h.registry.is_pending("5")) test_fail("still waiting for visible text");
    if (h.store.get_by_kind("5", MemoryKind::META_UPDATE, 10).size() != 1) test_fail("annotation stored");
    if (!h.store.get_by_kind("5", MemoryKind::CONVERSATION, 10).empty()) test_fail("no Q/A without a reply");
    test_pass("annotation stored, request still pending");

    append_text(h.transcript, assistant_line("Noted."));
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "visible reply");
    expect_eq(h.transport.last_text(), "Noted.", "only the new text");
    test_pass("later visible reply delivered alone");
}

void test_timeout() {
    test_header("pending timeout");
    TempDir dir;
    Harness h(dir);
    h.transcript = dir.file("session.jsonl");
    write_text(h.transcript, "");

    int dispatched = 0;
    DispatchFn fn = [&dispatched](const DispatchItem&) -> bool { dispatched++; return true; };
    DispatchQueue queue(h.registry, fn, nullptr, false);

    DispatchItem item;
    item.chat_id = 9;
    item.owner = "9";
    item.text = "first";
    queue.enqueue(item);
    queue.drain_once();
    if (!h.registry.is_pending("9")) test_fail("dispatch should be pending");

    item.text = "second";
    queue.enqueue(item);
    h.clock.now += 599999;
    expect_result(h.coordinator.check_for_responses(), CheckResult::NO_CONTENT, "just under the limit");
    if (queue.drain_once() != 0) test_fail("queued request dispatched while pending");

    h.clock.now += 1;
    expect_result(h.coordinator.check_for_responses(), CheckResult::TIMED_OUT, "limit reached");
    if (h.registry.is_pending("9")) test_fail("timeout should clear pending");
    if (h.transport.sent_count() != 0) test_fail("timeout sends nothing");
    if (queue.drain_once() != 1 || dispatched != 2) test_fail("queued request should follow the timeout");
    test_pass("stale request expires and the queue moves on");
}

void test_timeout_every_owner() {
    test_header("pending timeout across owners");
    TempDir dir;
    Harness h(dir);

    h.ask(10, "older request");
    h.clock.now += 540000;
    h.ask(20, "newer request");
    h.clock.now += 120000;

    expect_result(h.coordinator.check_for_responses(), CheckResult::NO_LOG, "newer owner still waiting");
    if (h.registry.is_pending("10")) test_fail("older owner should expire behind a newer one");
    if (!h.registry.is_pending("20")) test_fail("newer owner cleared too early");
    test_pass("older request expires while another is pending");

    h.clock.now += 480000;
    expect_result(h.coordinator.check_for_responses(), CheckResult::TIMED_OUT, "newer owner expires");
    if (h.registry.is_pending("20")) test_fail("newer owner should expire after its own limit");
    test_pass("each owner expires on its own clock");
}

void test_delivery_failure_retry() {
    test_header("delivery failure");
    TempDir dir;
    Harness h(dir);
    h.transcript = dir.file("session.jsonl");
    write_text(h.transcript, "");
    h.ask(3, "ping");
    append_text(h.transcript, assistant_line("pong"));

    h.transport.fail_sends = true;
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERY_FAILED, "send fails");
    if (!h.registry.is_pending("3")) test_fail("failed delivery must keep pending");
    if (offset_of(h.coordinator, h.transcript) != 0) test_fail("failed delivery must not advance");
    if (!h.store.get_recent("3", 10).empty()) test_fail("nothing stored before delivery");
    test_pass("nothing committed on failure");

    h.transport.fail_sends = false;
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "retry succeeds");
    expect_eq(h.transport.last_text(), "pong", "same text retried");
    test_pass("retried on the next trigger");
}

void test_transcript_switch() {
    test_header("transcript switch");
    TempDir dir;
    Harness h(dir);
    std::string a = dir.file("a.jsonl");
    std::string b = dir.file("b.jsonl");
    write_text(a, "");
    write_text(b, "");

    h.transcript = a;
    h.ask(1, "one");
    append_text(a, assistant_line("reply from a"));
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "file a");
    int64_t a_offset = file_size(a);
    if (offset_of(h.coordinator, a) != a_offset) test_fail("a offset");

    h.transcript = b;
    h.ask(1, "two");
    append_text(b, assistant_line("reply from b"));
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "file b");
    expect_eq(h.coordinator.current_path(), b, "current path follows the locator");
    if (offset_of(h.coordinator, a) != a_offset) test_fail("a offset lost on switch");
    test_pass("each transcript keeps its own offset");

    h.transcript = a;
    h.ask(1, "three");
    append_text(a, assistant_line("second reply from a"));
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "back to a");
    expect_eq(h.transport.last_text(), "second reply from a", "resumed where a was left");
    if (h.transport.sent_count() != 3) test_fail("earlier output of a replayed");
    test_pass("switching back resumes the old offset");
}

void test_replaced_and_truncated() {
    test_header("replaced / truncated transcript");
    TempDir dir;
    Harness h(dir);
    h.transcript = dir.file("session.jsonl");
    write_text(h.transcript, "");
    h.ask(2, "q");
    append_text(h.transcript, assistant_line("a fairly long first reply to move the offset along"));
    h.coordinator.check_for_responses();

    std::string tmp = h.transcript + ".new";
    write_text(tmp, assistant_line("new file"));
    if (rename(tmp.c_str(), h.transcript.c_str()) != 0) test_fail("rename");
    h.ask(2, "q2");
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "replacement read");
    expect_eq(h.transport.last_text(), "new file", "replaced file read from the start");
    test_pass("new file identity restarts at zero");

    write_text(h.transcript, assistant_line("tiny"));
    h.ask(2, "q3");
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "truncated read");
    expect_eq(h.transport.last_text(), "tiny", "shrunk file read from the start");
    test_pass("shrinking below the offset restarts at zero");
}

void test_eviction() {
    test_header("tail state eviction");
    TempDir dir;
    CoordinatorOptions opts;
    opts.max_tracked_files = 2;
    Harness h(dir, opts);
    const char* names[] = {"a.jsonl", "b.jsonl", "c.jsonl"};
    for (int i = 0; i < 3; ++i) {
        h.transcript = dir.file(names[i]);
        write_text(h.transcript, "");
        h.ask(1, "x");
        h.coordinator.check_for_responses();
    }
    if (h.coordinator.tracked_files() != 2) test_fail("tracked " + str(h.coordinator.tracked_files()));
    TailState ts;
    if (h.coordinator.get_tail_state(dir.file("a.jsonl"), ts)) test_fail("least recent should go");
    if (!h.coordinator.get_tail_state(dir.file("c.jsonl"), ts)) test_fail("current must stay");
    test_pass("least recently used state evicted");
}

void test_prime() {
    test_header("prime");
    TempDir dir;
    Harness h(dir);
    h.transcript = dir.file("session.jsonl");
    if (h.coordinator.prime()) test_fail("priming a missing file");
    write_text(h.transcript, assistant_line("old history") + assistant_line("more history"));

    if (!h.coordinator.prime()) test_fail("prime failed");
    if (offset_of(h.coordinator, h.transcript) != file_size(h.transcript)) test_fail("prime offset");
    h.ask(4, "new question");
    expect_result(h.coordinator.check_for_responses(), CheckResult::NO_CONTENT, "history skipped");
    test_pass("existing history not replayed");

    append_text(h.transcript, assistant_line("fresh answer"));
    int64_t before = file_size(h.transcript);
    if (!h.coordinator.prime()) test_fail("second prime");
    if (offset_of(h.coordinator, h.transcript) == before) test_fail("prime must not skip a tracked file");
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "new output");
    expect_eq(h.transport.last_text(), "fresh answer", "only new output");
    test_pass("tracked file keeps its offset");
}

void test_salvage() {
    test_header("salvage");
    TempDir dir;
    Harness h(dir);
    h.transcript = dir.file("session.jsonl");
    write_text(h.transcript, "");

    h.ask(6, "long task");
    append_text(h.transcript, assistant_line("partial progress"));
    if (!h.coordinator.salvage("6")) test_fail("salvage should deliver");
    expect_eq(h.transport.last_text(), "partial progress", "salvaged text");
    if (h.registry.is_pending("6")) test_fail("salvage clears pending");
    test_pass("partial output delivered on stop");

    h.ask(6, "another");
    if (h.coordinator.salvage("6")) test_fail("nothing to salvage");
    if (h.registry.is_pending("6")) test_fail("pending cleared even without output");
    if (h.transport.sent_count() != 1) test_fail("no extra message");
    test_pass("empty salvage only clears pending");
}

void test_checkpoint() {
    test_header("checkpoint");
    TempDir dir;
    CoordinatorOptions opts;
    opts.checkpoint_path = dir.file("state/tail.json");
    std::string path = dir.file("session.jsonl");
    write_text(path, "");

    {
        Harness h(dir, opts);
        h.transcript = path;
        h.ask(8, "first");
        append_text(path, assistant_line("first answer"));
        expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "first run");
        if (!h.coordinator.save_checkpoint()) test_fail("save");
    }
    append_text(path, assistant_line("written while the bridge was down"));

    Harness h(dir, opts);
    h.transcript = path;
    if (!h.coordinator.load_checkpoint()) test_fail("load");
    expect_eq(h.coordinator.current_path(), path, "current path restored");
    h.ask(8, "second");
    expect_result(h.coordinator.check_for_responses(), CheckResult::DELIVERED, "after restart");
    expect_eq(h.transport.last_text(), "written while the bridge was down", "resumed at the saved offset");
    test_pass("offsets survive a restart");

    write_text(opts.checkpoint_path, "{not json");
    Harness broken(dir, opts);
    if (broken.coordinator.load_checkpoint()) test_fail("corrupt checkpoint accepted");
    test_pass("corrupt checkpoint ignored");
}

} // namespace

int main() {
    quiet_logs();
    test_idle_and_missing_log();
    test_delivery_with_annotation();
    test_annotation_only();
    test_timeout();
    test_timeout_every_owner();
    test_delivery_failure_retry();
    test_transcript_switch();
    test_replaced_and_truncated();
    test_eviction();
    test_prime();
    test_salvage();
    test_checkpoint();
    std::cout << "\nAll response coordinator tests passed" << std::endl;
    return 0;
}
