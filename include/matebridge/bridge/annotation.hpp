/*
 * MateBridge C++11 - Annotation Extractor
 *
 * Splits agent output into user-facing prose and the memory annotations the
 * agent embeds in it. Two syntaxes are recognized:
 *
 *   Some reply -- memory        key-value block: a line ending in "-- memory"
 *   key = value                 opens it, a line "-- done" closes it
 *   -- done
 *
 *   <fact>...</fact>            tagged elements (observation, fact,
 *                               narrative, concept, memory_update)
 */
#ifndef MATEBRIDGE_BRIDGE_ANNOTATION_HPP
#define MATEBRIDGE_BRIDGE_ANNOTATION_HPP

#include <string>
#include <vector>

namespace matebridge {

struct Extraction {
    std::string display;        // Empty means nothing to show the user
    std::string annotation;     // Key-value interiors first, then elements
};

class AnnotationExtractor {
public:
    static Extraction extract(const std::string& raw);

    // True for text that is one element of a non-annotation tag, e.g.
    // "<system-reminder>...</system-reminder>". Quoted markup that happens
    // to match is dropped too.
    static bool is_bare_tag_segment(const std::string& text);

    static bool is_annotation_tag(const std::string& name);
    static const std::vector<std::string>& annotation_tags();

    // Runs of blank lines become a single blank line
    static std::string collapse_blank_lines(const std::string& text);

private:
    static std::string strip_kv_blocks(const std::string& text, std::vector<std::string>& captured);
    static std::string strip_tagged_elements(const std::string& text, std::vector<std::string>& captured);
};

} // namespace matebridge

#endif // MATEBRIDGE_BRIDGE_ANNOTATION_HPP
