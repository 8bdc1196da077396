#pragma once

#include "gardener/common/lru_cache.hpp"
#include "gardener/config/schema.hpp"
#include "gardener/managers/resource_manager.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gardener::managers {

struct ConversationMessage {
  std::string role;
  std::string content;
  std::string timestamp;
};

[[nodiscard]] std::string encode_message_jsonl(const ConversationMessage &message);
[[nodiscard]] common::Result<ConversationMessage> parse_message_jsonl(const std::string &line);

/// Pruning weight: position-based recency plus boosts for keywords
/// ("error", "important", "remember"), long messages and user turns.
[[nodiscard]] double message_importance(const ConversationMessage &message, std::size_t position,
                                        std::size_t total);

/// Keep the `max_messages` most important messages in chronological order.
void prune_messages(std::vector<ConversationMessage> &messages, std::size_t max_messages);

/// Conversation buffer of the current project. Messages always land in the
/// project bound at the moment add_message takes the lock; a switch cannot
/// interleave with an append.
class ContextManager final : public ScopedResourceManager {
public:
  ContextManager(config::ArtifactsConfig artifacts, config::ContextConfig config);
  ~ContextManager() override;

  [[nodiscard]] std::string_view name() const override { return "context"; }

  /// Returns the id of the project the message was appended to. A persistence
  /// failure is reported but the message stays in memory and is written on
  /// the next successful save.
  [[nodiscard]] common::Result<std::string> add_message(const std::string &role,
                                                        const std::string &content);
  [[nodiscard]] std::vector<ConversationMessage> history() const;
  /// Newest messages rendered as "role: content" lines, within `max_chars`
  /// (the configured limit when omitted).
  [[nodiscard]] std::string recent_context(std::optional<std::size_t> max_chars = std::nullopt) const;
  [[nodiscard]] common::Status clear();
  [[nodiscard]] common::Status save();

  /// Project ids held in memory, most recently used first.
  [[nodiscard]] std::vector<std::string> resident_contexts() const;
  [[nodiscard]] std::filesystem::path context_path(const std::string &project_id) const;

protected:
  [[nodiscard]] common::Status activate(const std::string &project_id) override;
  void release() override;

private:
  struct Conversation {
    std::vector<ConversationMessage> messages;
    bool dirty = false;
  };

  [[nodiscard]] common::Result<Conversation> load(const std::string &project_id) const;
  [[nodiscard]] common::Status persist(const std::string &project_id, Conversation &conversation);
  [[nodiscard]] Conversation *bound_conversation() const;

  config::ArtifactsConfig artifacts_;
  config::ContextConfig config_;
  // find() promotes entries, so const readers go through this mutable cache.
  mutable common::LruCache<std::string, Conversation> contexts_;
};

} // namespace gardener::managers
