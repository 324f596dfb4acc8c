#include "session/history_replay.hpp"

namespace conductor {

namespace {

constexpr size_t kCharsPerToken = 4;

struct Message {
  bool user = false;
  std::string content;
  std::string tool_summary;  // "[Used: a, b]" or empty
};

std::string string_field(const json& j, const char* key) {
  if (j.is_object() && j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return "";
}

const json& field_or_null(const json& j, const char* key) {
  static const json null_value;
  if (j.is_object() && j.contains(key)) return j[key];
  return null_value;
}

const json* inner_update(const StoredUpdate& stored) {
  if (!stored.update.is_object()) return nullptr;
  auto it = stored.update.find("update");
  if (it == stored.update.end() || !it->is_object() || !it->contains("sessionUpdate")) return nullptr;
  return &*it;
}

std::string update_type(const json& inner) {
  return string_field(inner, "sessionUpdate");
}

// Content is either a list of blocks or a single {text} object
std::string user_message_text(const json& content) {
  if (content.is_array()) {
    for (const auto& block : content) {
      if (string_field(block, "type") == "text") {
        return string_field(block, "text");
      }
    }
    return "";
  }
  if (content.is_object() && content.contains("text") && content["text"].is_string()) {
    return content["text"].get<std::string>();
  }
  return "";
}

std::string chunk_text(const json& inner) {
  const auto& content = field_or_null(inner, "content");
  if (string_field(content, "type") != "text") return "";
  return string_field(content, "text");
}

std::vector<Message> extract_messages(const std::vector<StoredUpdate>& updates) {
  std::vector<Message> messages;
  std::string assistant;
  std::vector<std::string> tools;

  auto flush_assistant = [&]() {
    if (assistant.empty() && tools.empty()) return;
    Message m;
    m.content = assistant;
    if (!tools.empty()) {
      std::string joined;
      for (size_t i = 0; i < tools.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += tools[i];
      }
      m.tool_summary = "[Used: " + joined + "]";
    }
    messages.push_back(std::move(m));
    assistant.clear();
    tools.clear();
  };

  for (const auto& stored : updates) {
    const auto* inner = inner_update(stored);
    if (!inner) continue;

    auto type = update_type(*inner);
    if (type == "user_message") {
      flush_assistant();
      auto text = user_message_text(field_or_null(*inner, "content"));
      if (!text.empty()) {
        messages.push_back(Message{true, text, ""});
      }
    } else if (type == "agent_message_chunk") {
      // Chunks carry the cumulative text so far
      auto text = chunk_text(*inner);
      if (!text.empty()) assistant = text;
    } else if (type == "tool_call") {
      auto title = string_field(*inner, "title");
      if (title.empty()) title = string_field(*inner, "name");
      if (title.empty()) title = "Unknown tool";
      tools.push_back(title);
    }
  }
  flush_assistant();

  return messages;
}

std::string format_message(const Message& m) {
  if (m.user) {
    return "USER: " + m.content + "\n";
  }
  std::string line = "ASSISTANT: " + m.content;
  if (!m.tool_summary.empty()) {
    line += "\n" + m.tool_summary;
  }
  return line + "\n";
}

std::string format_messages(const std::vector<Message>& messages, size_t start) {
  std::string out;
  for (size_t i = start; i < messages.size(); ++i) {
    if (i > start) out += "\n";
    out += format_message(messages[i]);
  }
  return out;
}

size_t estimate_tokens(const std::string& text) {
  return (text.size() + kCharsPerToken - 1) / kCharsPerToken;
}

std::string wrap_history(const std::string& content, size_t total, size_t truncated) {
  std::string header = "[Session History - " + std::to_string(total) + " messages";
  if (truncated > 0) {
    header += ", " + std::to_string(truncated) + " truncated";
  }
  header += "]";

  return header + "\n\n" + content + "\n[End of History]\n\nContinue the conversation. The user's new message follows:\n\n";
}

}  // namespace

std::optional<std::string> format_history_for_replay(const std::vector<StoredUpdate>& updates, size_t max_tokens) {
  auto messages = extract_messages(updates);
  if (messages.empty()) {
    return std::nullopt;
  }

  // +1 per message for the separator newline
  std::vector<size_t> tokens;
  size_t total_tokens = 0;
  for (const auto& m : messages) {
    tokens.push_back(estimate_tokens(format_message(m)) + 1);
    total_tokens += tokens.back();
  }

  if (total_tokens <= max_tokens) {
    return wrap_history(format_messages(messages, 0), messages.size(), 0);
  }

  // The newest message is always kept
  size_t start = 0;
  size_t current = total_tokens;
  while (start < messages.size() - 1 && current > max_tokens) {
    current -= tokens[start];
    ++start;
  }

  auto formatted = format_messages(messages, start);
  if (start > 0) {
    formatted = "[" + std::to_string(start) + " earlier messages truncated...]\n\n" + formatted;
  }
  return wrap_history(formatted, messages.size(), start);
}

bool has_replayable_history(const std::vector<StoredUpdate>& updates) {
  bool has_user = false;
  bool has_assistant = false;

  for (const auto& stored : updates) {
    const auto* inner = inner_update(stored);
    if (!inner) continue;

    auto type = update_type(*inner);
    if (type == "user_message") {
      if (!user_message_text(field_or_null(*inner, "content")).empty()) has_user = true;
    } else if (type == "agent_message_chunk") {
      if (!chunk_text(*inner).empty()) has_assistant = true;
    }

    if (has_user && has_assistant) return true;
  }
  return false;
}

}  // namespace conductor
