#pragma once

#include "gardener/embedding/embedder.hpp"

namespace gardener::embedding {

/// Offline feature-hashing embedder. Deterministic for a given text, model
/// label and dimension count; needs no network or model weights.
class LocalEmbedder final : public IEmbedder {
public:
  LocalEmbedder(std::string model, std::size_t dimensions);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string identity() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::string model_;
  std::size_t dimensions_;
};

} // namespace gardener::embedding
