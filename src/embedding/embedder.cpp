#include "gardener/embedding/embedder.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/embedding/local_embedder.hpp"

namespace gardener::embedding {

common::Result<std::unique_ptr<IEmbedder>> create_embedder(const config::EmbeddingConfig &config) {
  const std::string provider = common::to_lower(common::trim(config.provider));
  if (provider == "local") {
    return common::Result<std::unique_ptr<IEmbedder>>::success(
        std::make_unique<LocalEmbedder>(config.model, config.dimensions));
  }
  return common::Result<std::unique_ptr<IEmbedder>>::failure(
      "unsupported embedding provider: " + config.provider, common::ErrorCode::InvalidArgument);
}

} // namespace gardener::embedding
