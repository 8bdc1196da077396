#include "gardener/managers/context_manager.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/common/json_util.hpp"
#include "gardener/config/config.hpp"
#include "gardener/observability/global.hpp"

#include <algorithm>
#include <fstream>
#include <numeric>
#include <sstream>

namespace gardener::managers {

namespace {

bool is_known_role(const std::string &role) {
  return role == "user" || role == "assistant" || role == "system";
}

} // namespace

std::string encode_message_jsonl(const ConversationMessage &message) {
  std::ostringstream out;
  out << "{\"role\":\"" << common::json_escape(message.role) << "\",\"content\":\""
      << common::json_escape(message.content) << "\",\"timestamp\":\""
      << common::json_escape(message.timestamp) << "\"}";
  return out.str();
}

common::Result<ConversationMessage> parse_message_jsonl(const std::string &line) {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty() || trimmed.front() != '{') {
    return common::Result<ConversationMessage>::failure("not a JSON object",
                                                        common::ErrorCode::InvalidArgument);
  }
  ConversationMessage message{
      .role = common::json_get_string(trimmed, "role"),
      .content = common::json_get_string(trimmed, "content"),
      .timestamp = common::json_get_string(trimmed, "timestamp"),
  };
  if (message.role.empty()) {
    return common::Result<ConversationMessage>::failure("message has no role",
                                                        common::ErrorCode::InvalidArgument);
  }
  return common::Result<ConversationMessage>::success(std::move(message));
}

double message_importance(const ConversationMessage &message, const std::size_t position,
                          const std::size_t total) {
  const double recency =
      total <= 1 ? 1.0 : static_cast<double>(position) / static_cast<double>(total - 1);

  double boost = 0.0;
  const std::string lowered = common::to_lower(message.content);
  if (lowered.find("error") != std::string::npos ||
      lowered.find("important") != std::string::npos ||
      lowered.find("remember") != std::string::npos) {
    boost += 0.3;
  }
  if (message.content.size() > 200) {
    boost += 0.2;
  }
  if (message.role == "user") {
    boost += 0.1;
  }
  return std::min(1.0, recency + boost);
}

void prune_messages(std::vector<ConversationMessage> &messages, const std::size_t max_messages) {
  if (messages.size() <= max_messages) {
    return;
  }

  const std::size_t total = messages.size();
  std::vector<std::size_t> order(total);
  std::iota(order.begin(), order.end(), 0);
  std::vector<double> scores(total);
  for (std::size_t i = 0; i < total; ++i) {
    scores[i] = message_importance(messages[i], i, total);
  }
  // Highest score first; on ties the newer message wins.
  std::stable_sort(order.begin(), order.end(), [&scores](std::size_t lhs, std::size_t rhs) {
    if (scores[lhs] != scores[rhs]) {
      return scores[lhs] > scores[rhs];
    }
    return lhs > rhs;
  });
  order.resize(max_messages);
  std::sort(order.begin(), order.end());

  std::vector<ConversationMessage> kept;
  kept.reserve(max_messages);
  for (const std::size_t index : order) {
    kept.push_back(std::move(messages[index]));
  }
  messages = std::move(kept);
}

ContextManager::ContextManager(config::ArtifactsConfig artifacts, config::ContextConfig config)
    : artifacts_(std::move(artifacts)), config_(config), contexts_(config.max_active_contexts) {}

ContextManager::~ContextManager() { unload(); }

std::filesystem::path ContextManager::context_path(const std::string &project_id) const {
  return config::resolve_artifact_path(artifacts_.context_path, artifacts_, project_id);
}

common::Result<ContextManager::Conversation>
ContextManager::load(const std::string &project_id) const {
  Conversation conversation;
  const auto path = context_path(project_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<Conversation>::success(std::move(conversation));
  }

  std::ifstream in(path);
  if (!in) {
    return common::Result<Conversation>::failure("failed to open context " + path.string(),
                                                 common::ErrorCode::Storage);
  }
  std::string line;
  std::size_t skipped = 0;
  while (std::getline(in, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    auto parsed = parse_message_jsonl(line);
    if (!parsed.ok()) {
      ++skipped;
      continue;
    }
    conversation.messages.push_back(std::move(parsed.value()));
  }
  if (skipped > 0) {
    observability::record_warning(std::string(name()), "skipped " + std::to_string(skipped) +
                                                           " malformed lines in " + path.string());
  }
  prune_messages(conversation.messages, config_.max_messages);
  return common::Result<Conversation>::success(std::move(conversation));
}

common::Status ContextManager::persist(const std::string &project_id, Conversation &conversation) {
  std::string content;
  for (const auto &message : conversation.messages) {
    content += encode_message_jsonl(message);
    content += '\n';
  }
  auto written = common::write_file_atomic(context_path(project_id), content);
  if (written.ok()) {
    conversation.dirty = false;
  }
  return written;
}

ContextManager::Conversation *ContextManager::bound_conversation() const {
  const auto &bound = bound_project();
  if (!bound.has_value()) {
    return nullptr;
  }
  return contexts_.find(*bound);
}

common::Status ContextManager::activate(const std::string &project_id) {
  Conversation *resident = contexts_.find(project_id);
  if (resident == nullptr) {
    auto loaded = load(project_id);
    if (!loaded.ok()) {
      return loaded.status();
    }
    if (auto evicted = contexts_.put(project_id, std::move(loaded.value()));
        evicted.has_value() && evicted->second.dirty) {
      if (auto saved = persist(evicted->first, evicted->second); !saved.ok()) {
        observability::record_warning(std::string(name()), saved.error());
      }
    }
  }

  if (bound_project().has_value() && *bound_project() != project_id) {
    release();
  }
  return common::Status::success();
}

void ContextManager::release() {
  const auto &bound = bound_project();
  if (!bound.has_value()) {
    return;
  }
  if (Conversation *conversation = contexts_.find(*bound);
      conversation != nullptr && conversation->dirty) {
    if (auto saved = persist(*bound, *conversation); !saved.ok()) {
      observability::record_warning(std::string(name()), saved.error());
    }
  }
}

common::Result<std::string> ContextManager::add_message(const std::string &role,
                                                        const std::string &content) {
  if (!is_known_role(role)) {
    return common::Result<std::string>::failure("unknown message role '" + role + "'",
                                                common::ErrorCode::InvalidArgument);
  }
  if (common::trim(content).empty()) {
    return common::Result<std::string>::failure("message content must not be empty",
                                                common::ErrorCode::InvalidArgument);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto &bound = bound_project();
  if (!bound.has_value()) {
    return common::Result<std::string>::failure("no active project context",
                                                common::ErrorCode::NotFound);
  }
  Conversation *conversation = contexts_.find(*bound);
  if (conversation == nullptr) {
    auto loaded = load(*bound);
    if (!loaded.ok()) {
      return common::Result<std::string>::failure(loaded.status());
    }
    if (auto evicted = contexts_.put(*bound, std::move(loaded.value()));
        evicted.has_value() && evicted->second.dirty) {
      if (auto saved = persist(evicted->first, evicted->second); !saved.ok()) {
        observability::record_warning(std::string(name()), saved.error());
      }
    }
    conversation = contexts_.find(*bound);
  }

  conversation->messages.push_back(ConversationMessage{
      .role = role,
      .content = content,
      .timestamp = common::now_rfc3339(),
  });
  prune_messages(conversation->messages, config_.max_messages);
  conversation->dirty = true;

  if (auto saved = persist(*bound, *conversation); !saved.ok()) {
    return common::Result<std::string>::failure(saved);
  }
  return common::Result<std::string>::success(*bound);
}

std::vector<ConversationMessage> ContextManager::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Conversation *conversation = bound_conversation();
  if (conversation == nullptr) {
    return {};
  }
  return conversation->messages;
}

std::string ContextManager::recent_context(const std::optional<std::size_t> max_chars) const {
  const std::size_t limit = max_chars.value_or(config_.max_context_chars);
  std::lock_guard<std::mutex> lock(mutex_);
  const Conversation *conversation = bound_conversation();
  if (conversation == nullptr) {
    return "";
  }

  std::vector<std::string> parts;
  std::size_t total = 0;
  for (auto it = conversation->messages.rbegin(); it != conversation->messages.rend(); ++it) {
    std::string text = it->role + ": " + it->content + "\n";
    if (total + text.size() > limit) {
      break;
    }
    total += text.size();
    parts.push_back(std::move(text));
  }

  std::string rendered;
  rendered.reserve(total);
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    rendered += *it;
  }
  return rendered;
}

common::Status ContextManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  Conversation *conversation = bound_conversation();
  if (conversation == nullptr) {
    return common::Status::error("no active project context", common::ErrorCode::NotFound);
  }
  conversation->messages.clear();
  conversation->dirty = true;
  return persist(*bound_project(), *conversation);
}

common::Status ContextManager::save() {
  std::lock_guard<std::mutex> lock(mutex_);
  Conversation *conversation = bound_conversation();
  if (conversation == nullptr || !conversation->dirty) {
    return common::Status::success();
  }
  return persist(*bound_project(), *conversation);
}

std::vector<std::string> ContextManager::resident_contexts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return contexts_.keys();
}

} // namespace gardener::managers
