#include <matebridge/bridge/prompt_builder.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>

namespace matebridge {

namespace {

const char* const SECTION_RULE = "\n\n---\n\n";

std::string loop_command(const std::string& prompt) {
    std::string escaped = replace_all(prompt, "\"", "\\\"");
    return "/ralph-loop:ralph-loop \"" + escaped +
           " Output <promise>DONE</promise> when complete.\""
           " --max-iterations 5 --completion-promise \"DONE\"";
}

} // namespace

const char* PromptBuilder::META_LOOP_INSTRUCTION =
    "\n【自我涉指协议】\n"
    "这是递归自我涉指模式。你需要：\n"
    "1. 完成用户的请求\n"
    "2. 分析本轮交互中的关键信息和学习点\n"
    "3. 在回复末尾使用 <memory_update> 标签输出更新后的系统提示词\n"
    "\n"
    "格式：\n"
    "<memory_update>\n"
    "[更新后的完整提示词内容]\n"
    "</memory_update>\n";

PromptBuilder::PromptBuilder(MemoryStore* store, const PromptOptions& opts)
    : store_(store)
    , opts_(opts) {}

std::string PromptBuilder::build_prompt(const std::string& owner, const std::string& text) const {
    std::vector<std::string> parts;

    if (opts_.memory_enabled && store_ && store_->is_open()) {
        std::vector<MemoryRecord> memories = store_->search(owner, text, opts_.max_results);
        if (!memories.empty()) {
            std::string block = MemoryStore::format_for_injection(memories, opts_.max_context);
            if (!block.empty()) {
                parts.push_back(block);
                LOG_INFO("[Prompt] Injected %zu memories for %s", memories.size(), owner.c_str());
            }
        }
    }

    std::string meta = load_meta_prompt();
    if (!meta.empty()) {
        parts.push_back("【系统指令】\n" + meta);
        LOG_DEBUG("[Prompt] Injected meta-prompt (%zu bytes)", meta.size());
    }

    if (parts.empty()) return text;
    return join(parts, SECTION_RULE) + SECTION_RULE + text;
}

std::string PromptBuilder::build_meta_loop_prompt(const std::string& request) const {
    std::string body = std::string(META_LOOP_INSTRUCTION) + SECTION_RULE +
                       "用户请求: " + request + "\n\n请完成任务并输出记忆更新。";
    std::string meta = load_meta_prompt();
    if (meta.empty()) return body;
    return "【系统角色】\n" + meta + "\n\n" + body;
}

std::string PromptBuilder::load_meta_prompt() const {
    for (size_t i = 0; i < opts_.instruction_files.size(); ++i) {
        std::string path = resolve_user_path(opts_.instruction_files[i]);
        if (!path_exists(path)) continue;

        std::string content;
        if (!read_file(path, content)) {
            LOG_WARN("[Prompt] Cannot read %s", path.c_str());
            continue;
        }
        return extract_meta_section(content, opts_.meta_section);
    }
    return "";
}

std::string PromptBuilder::extract_meta_section(const std::string& content,
                                                const std::string& heading) {
    if (content.empty()) return "";

    std::vector<std::string> lines = split(content, '\n');
    std::vector<std::string> section;
    bool inside = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (!inside) {
            if (trim(line) == heading) inside = true;
            continue;
        }
        if (starts_with(line, "## ")) break;
        section.push_back(line);
    }

    return trim(join(section, "\n"));
}

std::string PromptBuilder::render_payload(const DispatchItem& item) {
    switch (item.tmpl) {
        case PayloadTemplate::LOOP:
        case PayloadTemplate::META_LOOP:
            return loop_command(item.text);
        case PayloadTemplate::PLAIN:
            break;
    }
    return item.text;
}

} // namespace matebridge
