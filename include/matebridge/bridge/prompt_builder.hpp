/*
 * MateBridge C++11 - Prompt Builder
 */
#ifndef MATEBRIDGE_BRIDGE_PROMPT_BUILDER_HPP
#define MATEBRIDGE_BRIDGE_PROMPT_BUILDER_HPP

#include <matebridge/bridge/dispatch_queue.hpp>
#include <matebridge/memory/store.hpp>
#include <string>
#include <vector>

namespace matebridge {

struct PromptOptions {
    bool memory_enabled;
    int max_results;
    size_t max_context;                         // Code points of injected memory
    std::vector<std::string> instruction_files; // First readable one wins
    std::string meta_section;                   // Heading line of the meta-prompt
    
    PromptOptions()
        : memory_enabled(true)
        , max_results(5)
        , max_context(2000)
        , meta_section("## 初始提示词") {}
};

class PromptBuilder {
public:
    PromptBuilder(MemoryStore* store, const PromptOptions& opts);
    
    // Relevant memories and the meta-prompt, each separated by a rule,
    // followed by the user text. Plain text when there is nothing to add.
    std::string build_prompt(const std::string& owner, const std::string& text) const;
    
    // Self-updating task prompt used by the meta loop
    std::string build_meta_loop_prompt(const std::string& request) const;
    
    // Meta-prompt section of the first instructions file found
    std::string load_meta_prompt() const;
    
    // Lines after the heading up to the next "## " heading, trimmed
    static std::string extract_meta_section(const std::string& content,
                                            const std::string& heading);
    
    // Final keystroke text for a queued item
    static std::string render_payload(const DispatchItem& item);
    
    static const char* META_LOOP_INSTRUCTION;

private:
    MemoryStore* store_;
    PromptOptions opts_;
};

} // namespace matebridge

#endif // MATEBRIDGE_BRIDGE_PROMPT_BUILDER_HPP
