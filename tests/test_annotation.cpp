#include "test_common.hpp"
#include <matebridge/bridge/annotation.hpp>

using namespace matebridge;
using namespace matebridge::test;

namespace {

void test_kv_block() {
    test_header("key-value block");
    Extraction e = AnnotationExtractor::extract("A -- memory\nctx = x\n-- done");
    expect_eq(e.display, "A", "prose before the marker");
    expect_eq(e.annotation, "ctx = x", "block interior");
    test_pass("marker line keeps its prose, interior captured");

    e = AnnotationExtractor::extract("Before\n\nDone here -- memory\n  task = build\n  state = green  \n  -- done  \n\nAfter");
    expect_eq(e.display, "Before\n\nDone here\n\nAfter", "surrounding prose");
    expect_eq(e.annotation, "task = build\n  state = green", "interior trimmed at the ends");
    test_pass("block in the middle of a reply");

    e = AnnotationExtractor::extract("-- memory\nonly = meta\n-- done\n");
    expect_eq(e.display, "", "nothing left to show");
    expect_eq(e.annotation, "only = meta", "annotation-only reply");
    test_pass("bare marker line");

    e = AnnotationExtractor::extract("one -- memory\na = 1\n-- done\ntwo -- memory\nb = 2\n-- done");
    expect_eq(e.display, "one\ntwo", "two blocks");
    expect_eq(e.annotation, "a = 1\nb = 2", "both interiors in order");
    test_pass("multiple blocks");
}

void test_kv_edge_cases() {
    test_header("key-value edge cases");
    Extraction e = AnnotationExtractor::extract("Note -- memory\nk = v");
    expect_eq(e.display, "Note -- memory\nk = v", "unterminated block stays visible");
    expect_eq(e.annotation, "", "nothing captured");
    test_pass("unterminated block");

    e = AnnotationExtractor::extract("see x-- memory\nk = v\n-- done");
    expect_eq(e.display, "see x-- memory\nk = v\n-- done", "marker glued to a word");
    test_pass("marker must follow whitespace");

    e = AnnotationExtractor::extract("A -- memory\n\n-- done\nB");
    expect_eq(e.display, "A\nB", "empty block removed");
    expect_eq(e.annotation, "", "empty interior not captured");
    test_pass("empty block");
}

void test_tagged_elements() {
    test_header("tagged elements");
    Extraction e = AnnotationExtractor::extract("Hello\n<fact>sky is blue</fact>\nBye");
    expect_eq(e.display, "Hello\n\nBye", "element removed from prose");
    expect_eq(e.annotation, "<fact>sky is blue</fact>", "element captured verbatim");
    test_pass("single element");

    e = AnnotationExtractor::extract("<observation kind=\"x\">seen</observation><concept>c</concept>Reply");
    expect_eq(e.display, "Reply", "prose after elements");
    expect_eq(e.annotation, "<observation kind=\"x\">seen</observation>\n<concept>c</concept>",
              "attributes kept, order preserved");
    test_pass("elements with attributes");

    e = AnnotationExtractor::extract("<memory_update>\nuser likes tea\n</memory_update>");
    expect_eq(e.display, "", "annotation-only output");
    test_pass("multi-line element");

    e = AnnotationExtractor::extract("ok -- memory\nk = v\n-- done\n<narrative>story</narrative>");
    expect_eq(e.display, "ok", "mixed syntaxes");
    expect_eq(e.annotation, "k = v\n<narrative>story</narrative>", "key-value blocks come first");
    test_pass("both syntaxes");
}

void test_literal_markup() {
    test_header("literal markup");
    Extraction e = AnnotationExtractor::extract("if a<b and <3 then");
    expect_eq(e.display, "if a<b and <3 then", "comparisons untouched");
    e = AnnotationExtractor::extract("<fact>never closed");
    expect_eq(e.display, "<fact>never closed", "unclosed element stays");
    expect_eq(e.annotation, "", "unclosed element not captured");
    e = AnnotationExtractor::extract("<b>bold</b> and <facts>x</facts>");
    expect_eq(e.display, "<b>bold</b> and <facts>x</facts>", "other tags untouched");
    test_pass("only complete annotation elements are removed");
}

void test_collapse() {
    test_header("collapse_blank_lines");
    expect_eq(AnnotationExtractor::collapse_blank_lines("a\n\n\n\nb"), "a\n\nb", "runs collapse");
    expect_eq(AnnotationExtractor::collapse_blank_lines("a\n  \n\t\nb"), "a\n\nb", "whitespace lines are blank");
    expect_eq(AnnotationExtractor::collapse_blank_lines("a\nb"), "a\nb", "no blank lines");
    test_pass("blank line runs");

    Extraction e = AnnotationExtractor::extract("\n\nTop\n\n\n<fact>f</fact>\n\n\nBottom\n\n");
    expect_eq(e.display, "Top\n\nBottom", "display trimmed and collapsed");
    test_pass("display normalisation");
}

void test_bare_tag_segments() {
    test_header("is_bare_tag_segment");
    if (!AnnotationExtractor::is_bare_tag_segment("<system-reminder>be nice</system-reminder>")) {
        test_fail("system reminder should be bare");
    }
    if (!AnnotationExtractor::is_bare_tag_segment("  <command-name attr=\"1\">/clear</command-name>\n")) {
        test_fail("surrounding whitespace and attributes");
    }
    test_pass("single non-annotation element");

    if (AnnotationExtractor::is_bare_tag_segment("<fact>x</fact>")) test_fail("annotation tag is not bare");
    if (AnnotationExtractor::is_bare_tag_segment("plain text")) test_fail("plain text");
    if (AnnotationExtractor::is_bare_tag_segment("<b>x</b> tail")) test_fail("trailing prose");
    if (AnnotationExtractor::is_bare_tag_segment("<br")) test_fail("truncated tag");
    test_pass("everything else is not bare");
}

} // namespace

int main() {
    test_kv_block();
    test_kv_edge_cases();
    test_tagged_elements();
    test_literal_markup();
    test_collapse();
    test_bare_tag_segments();
    std::cout << "\nAll annotation tests passed" << std::endl;
    return 0;
}
