#include "gardener/embedding/local_embedder.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace gardener::embedding {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::uint64_t fnv1a(const std::string_view text, std::uint64_t seed = kFnvOffset) {
  std::uint64_t hash = seed;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

void add_feature(std::vector<float> &values, const std::string_view feature, const float weight) {
  const std::uint64_t hash = fnv1a(feature);
  const std::size_t index = static_cast<std::size_t>(hash % values.size());
  // The top bit picks the sign so collisions tend to cancel instead of pile up.
  const float sign = (hash >> 63U) != 0U ? -1.0F : 1.0F;
  values[index] += sign * weight;
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

bool is_word_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

} // namespace

LocalEmbedder::LocalEmbedder(std::string model, const std::size_t dimensions)
    : model_(std::move(model)), dimensions_(dimensions == 0 ? 1 : dimensions) {}

std::string_view LocalEmbedder::name() const { return "local"; }

std::string LocalEmbedder::identity() const {
  return "local:" + model_ + ":" + std::to_string(dimensions_);
}

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);

  // Identifier tokens carry most of the signal; character trigrams smooth
  // over naming variants (getUser / get_user).
  std::string token;
  auto flush_token = [&] {
    if (!token.empty()) {
      add_feature(values, "w:" + token, 1.0F);
      token.clear();
    }
  };
  for (const char ch : text) {
    if (is_word_char(ch)) {
      token.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    } else {
      flush_token();
    }
  }
  flush_token();

  for (std::size_t i = 0; i + 3 <= text.size(); ++i) {
    add_feature(values, text.substr(i, 3), 0.25F);
  }

  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

common::Result<std::vector<std::vector<float>>>
LocalEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto embedded = embed(text);
    if (!embedded.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(embedded.status());
    }
    out.push_back(std::move(embedded.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace gardener::embedding
