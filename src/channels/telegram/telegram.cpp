#include <matebridge/channels/telegram/telegram.hpp>
#include <matebridge/core/utils.hpp>
#include <sstream>

namespace matebridge {

namespace {

const size_t LABEL_RESERVE = 16;

std::string display_name(const Json& from) {
    std::string name = from["first_name"].as_string();
    std::string last = from["last_name"].as_string();
    if (!last.empty()) {
        name += " " + last;
    }
    std::string username = from["username"].as_string();
    if (!username.empty()) {
        name += " (@" + username + ")";
    }
    return name;
}

} // namespace

const size_t TelegramTransport::MAX_MESSAGE_BYTES;

TelegramTransport::TelegramTransport(const std::string& bot_token, int poll_timeout_s)
    : api_base_("https://api.telegram.org/bot" + bot_token)
    , poll_timeout_(poll_timeout_s) {
    if (poll_timeout_ <= 0 || poll_timeout_ > 60) poll_timeout_ = 30;
    poll_http_.set_timeout((poll_timeout_ + 5) * 1000);
    http_.set_timeout(15000);
}

bool TelegramTransport::connect() {
    HttpResponse resp = http_.get(api_base_ + "/getMe");
    if (!resp.ok()) {
        LOG_ERROR("[Telegram] Failed to connect - %s", resp.error.empty() ?
                  resp.body.c_str() : resp.error.c_str());
        return false;
    }
    
    Json result = resp.json();
    if (!result["ok"].as_bool()) {
        LOG_ERROR("[Telegram] API error - %s", result["description"].as_string().c_str());
        return false;
    }
    
    bot_username_ = result["result"]["username"].as_string();
    LOG_INFO("[Telegram] Connected as @%s (id=%lld)", bot_username_.c_str(),
             static_cast<long long>(result["result"]["id"].as_int()));
    return true;
}

bool TelegramTransport::poll_updates(int64_t cursor,
                                     std::vector<ChatUpdate>& updates,
                                     int64_t& next_cursor) {
    next_cursor = cursor;
    
    std::ostringstream url;
    url << api_base_ << "/getUpdates?timeout=" << poll_timeout_;
    if (cursor > 0) {
        url << "&offset=" << cursor;
    }
    url << "&allowed_updates=%5B%22message%22%2C%22callback_query%22%5D";
    
    HttpResponse resp = poll_http_.get(url.str());
    if (!resp.ok()) {
        LOG_WARN("[Telegram] Poll failed - %s (HTTP %ld)", resp.error.c_str(), resp.status_code);
        return false;
    }
    
    Json result = resp.json();
    if (!result["ok"].as_bool()) {
        LOG_WARN("[Telegram] Poll API error - %s", result["description"].as_string().c_str());
        return false;
    }
    
    const std::vector<Json>& items = result["result"].as_array();
    for (size_t i = 0; i < items.size(); ++i) {
        int64_t update_id = items[i]["update_id"].as_int();
        if (update_id + 1 > next_cursor) {
            next_cursor = update_id + 1;
        }
        
        ChatUpdate u;
        if (parse_update(items[i], u)) {
            updates.push_back(u);
        } else {
            LOG_DEBUG("[Telegram] Ignoring update %lld", static_cast<long long>(update_id));
        }
    }
    return true;
}

bool TelegramTransport::parse_update(const Json& update, ChatUpdate& out) {
    out = ChatUpdate();
    out.update_id = update["update_id"].as_int();
    
    if (update.has("message")) {
        const Json& msg = update["message"];
        out.kind = ChatUpdate::MESSAGE;
        out.chat_id = msg["chat"]["id"].as_int();
        out.message_id = msg["message_id"].as_int();
        out.from_name = display_name(msg["from"]);
        out.text = msg["text"].as_string();
        if (out.text.empty()) {
            out.text = msg["caption"].as_string();
        }
        return out.chat_id != 0 && !out.text.empty();
    }
    
    if (update.has("callback_query")) {
        const Json& cb = update["callback_query"];
        out.kind = ChatUpdate::INTERACTION;
        out.interaction_id = cb["id"].as_string();
        out.interaction_data = cb["data"].as_string();
        out.chat_id = cb["message"]["chat"]["id"].as_int();
        out.message_id = cb["message"]["message_id"].as_int();
        out.from_name = display_name(cb["from"]);
        return !out.interaction_id.empty();
    }
    
    return false;
}

std::vector<std::string> TelegramTransport::label_chunks(const std::string& text, size_t max_bytes) {
    std::vector<std::string> result;
    if (text.size() <= max_bytes) {
        result.push_back(text);
        return result;
    }
    
    size_t body_max = max_bytes > LABEL_RESERVE * 2 ? max_bytes - LABEL_RESERVE : max_bytes;
    std::vector<std::string> parts = split_message_chunks(text, body_max);
    for (size_t i = 0; i < parts.size(); ++i) {
        std::ostringstream oss;
        oss << "[" << (i + 1) << "/" << parts.size() << "]\n" << parts[i];
        result.push_back(oss.str());
    }
    return result;
}

SendResult TelegramTransport::send_text(int64_t chat_id, const std::string& text) {
    std::vector<std::string> parts = label_chunks(text, MAX_MESSAGE_BYTES);
    SendResult last = SendResult::fail("empty message");
    
    for (size_t i = 0; i < parts.size(); ++i) {
        Json params = Json::object();
        params.set("chat_id", Json(chat_id));
        params.set("text", Json(parts[i]));
        
        last = send_message_impl(params);
        if (!last.success) {
            LOG_WARN("[Telegram] Part %zu/%zu to %lld failed - %s", i + 1, parts.size(),
                     static_cast<long long>(chat_id), last.error.c_str());
            return last;
        }
    }
    return last;
}

SendResult TelegramTransport::send_menu(int64_t chat_id,
                                        const std::string& prompt,
                                        const std::vector<MenuOption>& options) {
    Json keyboard = Json::array();
    for (size_t i = 0; i < options.size(); ++i) {
        Json button = Json::object();
        button.set("text", Json(options[i].label));
        button.set("callback_data", Json(options[i].data));
        Json row = Json::array();
        row.push(button);
        keyboard.push(row);
    }
    Json markup = Json::object();
    markup.set("inline_keyboard", keyboard);
    
    Json params = Json::object();
    params.set("chat_id", Json(chat_id));
    params.set("text", Json(prompt));
    params.set("reply_markup", markup);
    return send_message_impl(params);
}

bool TelegramTransport::send_typing(int64_t chat_id) {
    Json params = Json::object();
    params.set("chat_id", Json(chat_id));
    params.set("action", Json("typing"));
    return call("sendChatAction", params);
}

bool TelegramTransport::answer_interaction(const std::string& interaction_id) {
    Json params = Json::object();
    params.set("callback_query_id", Json(interaction_id));
    return call("answerCallbackQuery", params);
}

bool TelegramTransport::react(int64_t chat_id, int64_t message_id, const std::string& emoji) {
    Json reaction = Json::object();
    reaction.set("type", Json("emoji"));
    reaction.set("emoji", Json(emoji));
    Json reactions = Json::array();
    reactions.push(reaction);
    
    Json params = Json::object();
    params.set("chat_id", Json(chat_id));
    params.set("message_id", Json(message_id));
    params.set("reaction", reactions);
    return call("setMessageReaction", params);
}

bool TelegramTransport::register_commands(const std::vector<BotCommand>& commands) {
    Json list = Json::array();
    for (size_t i = 0; i < commands.size(); ++i) {
        Json cmd = Json::object();
        cmd.set("command", Json(commands[i].command));
        cmd.set("description", Json(commands[i].description));
        list.push(cmd);
    }
    Json params = Json::object();
    params.set("commands", list);
    
    if (!call("setMyCommands", params)) return false;
    LOG_INFO("[Telegram] Registered %zu bot commands", commands.size());
    return true;
}

bool TelegramTransport::call(const std::string& method, const Json& params) {
    HttpResponse resp = http_.post_json(api_base_ + "/" + method, params);
    Json body = resp.json();
    
    if (!resp.ok() || !body["ok"].as_bool()) {
        std::string reason = body["description"].as_string();
        if (reason.empty()) reason = resp.error;
        LOG_WARN("[Telegram] %s failed - %s (HTTP %ld)", method.c_str(), reason.c_str(),
                 resp.status_code);
        return false;
    }
    return true;
}

SendResult TelegramTransport::send_message_impl(const Json& params) {
    HttpResponse resp = http_.post_json(api_base_ + "/sendMessage", params);
    
    if (!resp.ok() && resp.status_code == 0) {
        return SendResult::fail("HTTP error: " + resp.error);
    }
    
    Json result = resp.json();
    if (!result["ok"].as_bool()) {
        std::string reason = result["description"].as_string();
        if (reason.empty()) reason = resp.error;
        return SendResult::fail("API error: " + reason);
    }
    
    std::ostringstream msg_id;
    msg_id << result["result"]["message_id"].as_int();
    
    LOG_DEBUG("[Telegram] Sent message to %lld (id=%s)",
              static_cast<long long>(params["chat_id"].as_int()), msg_id.str().c_str());
    return SendResult::ok(msg_id.str());
}

} // namespace matebridge
