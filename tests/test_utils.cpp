#include "test_common.hpp"
#include <matebridge/core/utils.hpp>

using namespace matebridge;
using namespace matebridge::test;

void test_string_helpers() {
    test_header("String Helpers");
    
    expect_eq(trim("  \t hello \n"), "hello", "trim");
    expect_eq(rtrim("x  \n"), "x", "rtrim");
    expect_eq(to_lower("/StAtUs"), "/status", "to_lower");
    if (!starts_with("/loop go", "/loop") || starts_with("/lo", "/loop")) test_fail("starts_with");
    if (!ends_with("a.jsonl", ".jsonl") || ends_with("l", ".jsonl")) test_fail("ends_with");
    expect_eq(replace_all("say \"hi\"", "\"", "\\\""), "say \\\"hi\\\"", "replace_all");
    expect_eq(join(split("a,b,,c", ','), "|"), "a|b||c", "split/join");
    test_pass("Basic string helpers");
}

void test_utf8_helpers() {
    test_header("UTF-8 Helpers");
    
    // Three 3-byte characters
    std::string cjk = "\xe8\xae\xb0\xe5\xbf\x86\xe5\xba\x93";
    if (utf8_length(cjk) != 3) test_fail("utf8_length");
    expect_eq(truncate_safe(cjk, 4), "\xe8\xae\xb0", "truncate inside second char");
    expect_eq(truncate_safe(cjk, 6), "\xe8\xae\xb0\xe5\xbf\x86", "truncate on boundary");
    expect_eq(truncate_safe("abc", 10), "abc", "no truncation");
    expect_eq(truncate_chars(cjk, 2), "\xe8\xae\xb0\xe5\xbf\x86", "two characters");
    expect_eq(truncate_chars(cjk, 3), cjk, "exact character count");
    expect_eq(truncate_chars("abc", 0), "", "zero characters");
    test_pass("Truncation never splits a character");
}

void test_message_chunks() {
    test_header("Message Chunks");
    
    std::vector<std::string> one = split_message_chunks("short", 10);
    if (one.size() != 1 || one[0] != "short") test_fail("short text should stay whole");
    
    std::vector<std::string> lines = split_message_chunks("aaaa\nbbbb\ncccc", 9);
    if (lines.size() != 2) test_fail("expected 2 chunks, got " + str(lines.size()));
    expect_eq(lines[0], "aaaa\nbbbb", "first chunk ends at newline");
    expect_eq(lines[1], "cccc", "second chunk");
    test_pass("Prefers newline boundaries");
    
    std::string cjk;
    for (int i = 0; i < 10; ++i) cjk += "\xe5\xbf\x86";
    std::vector<std::string> parts = split_message_chunks(cjk, 8);
    std::string rebuilt;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].size() > 8) test_fail("chunk exceeds limit");
        if (parts[i].size() % 3 != 0) test_fail("chunk split a character");
        rebuilt += parts[i];
    }
    expect_eq(rebuilt, cjk, "chunks reassemble");
    test_pass("Hard splits stay on UTF-8 boundaries");
}

void test_files() {
    test_header("Files");
    
    TempDir dir;
    std::string path = join_path(dir.path(), "nested/deeper/value.txt");
    if (!write_file_atomic(path, "123")) test_fail("write_file_atomic into new dirs");
    std::string content;
    if (!read_file(path, content) || content != "123") test_fail("read back");
    if (!write_file_atomic(path, "456") || !read_file(path, content) || content != "456") {
        test_fail("overwrite");
    }
    test_pass("Atomic write creates parents and replaces content");
    
    if (read_file(dir.file("missing"), content)) test_fail("missing file read");
    if (!is_directory(dir.path()) || path_exists(dir.file("nope"))) test_fail("path checks");
    expect_eq(basename("/a/b/c.jsonl"), "c.jsonl", "basename");
    expect_eq(dirname("/a/b/c.jsonl"), "/a/b", "dirname");
    test_pass("Path helpers");
}

void test_hash_and_time() {
    test_header("Hash and Time");
    
    expect_eq(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256");
    test_pass("SHA-256 hex digest");
    
    std::string stamp = format_local_minutes(1700000000000LL);
    if (stamp.size() != 16 || stamp[4] != '-' || stamp[10] != ' ' || stamp[13] != ':') {
        test_fail("format_local_minutes shape: " + stamp);
    }
    if (current_timestamp_ms() / 1000 - current_timestamp() > 1) test_fail("clock mismatch");
    test_pass("Timestamps");
}

int main() {
    std::cout << "MateBridge Utils Tests" << std::endl;
    
    test_string_helpers();
    test_utf8_helpers();
    test_message_chunks();
    test_files();
    test_hash_and_time();
    
    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
