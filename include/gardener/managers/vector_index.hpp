#pragma once

#include "gardener/common/result.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace gardener::managers {

struct VectorMatch {
  std::string key;
  float distance = 0.0F;
  float score = 0.0F;
};

/// Flat cosine index over fixed-dimension vectors, persisted as one binary file.
class VectorIndex {
public:
  explicit VectorIndex(std::size_t dimensions, std::size_t max_elements = 200000);

  /// A missing file loads as an empty index.
  [[nodiscard]] common::Status load(const std::filesystem::path &path);
  /// Written to `<path>.tmp` then renamed into place.
  [[nodiscard]] common::Status save(const std::filesystem::path &path) const;

  [[nodiscard]] common::Status upsert(const std::string &key, const std::vector<float> &vector);
  bool remove(const std::string &key);
  [[nodiscard]] common::Result<std::vector<VectorMatch>> query(const std::vector<float> &vector,
                                                               std::size_t limit) const;

  [[nodiscard]] std::size_t size() const { return vectors_.size(); }
  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }
  [[nodiscard]] bool contains(const std::string &key) const { return vectors_.contains(key); }

private:
  std::size_t dimensions_;
  std::size_t max_elements_;
  std::unordered_map<std::string, std::vector<float>> vectors_;
};

[[nodiscard]] float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

} // namespace gardener::managers
