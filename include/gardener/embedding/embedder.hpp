#pragma once

#include "gardener/common/result.hpp"
#include "gardener/config/schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gardener::embedding {

class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  /// Stable description of the backend and model; part of every cache key.
  [[nodiscard]] virtual std::string identity() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

[[nodiscard]] common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::EmbeddingConfig &config);

} // namespace gardener::embedding
