#include "gardener/managers/vector_index.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>

namespace gardener::managers {

namespace {

constexpr std::array<char, 4> kMagic = {'G', 'V', 'I', 'X'};
constexpr std::uint32_t kFormatVersion = 1;

template <typename T> void write_pod(std::ofstream &out, const T &value) {
  out.write(reinterpret_cast<const char *>(&value), sizeof(value));
}

template <typename T> bool read_pod(std::ifstream &in, T &value) {
  in.read(reinterpret_cast<char *>(&value), sizeof(value));
  return static_cast<bool>(in);
}

} // namespace

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0F;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }
  if (norm_a < 1e-9 || norm_b < 1e-9) {
    return 0.0F;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

VectorIndex::VectorIndex(const std::size_t dimensions, const std::size_t max_elements)
    : dimensions_(dimensions), max_elements_(max_elements) {}

common::Status VectorIndex::upsert(const std::string &key, const std::vector<float> &vector) {
  if (key.empty()) {
    return common::Status::error("vector key must not be empty",
                                 common::ErrorCode::InvalidArgument);
  }
  if (vector.size() != dimensions_) {
    return common::Status::error("vector has " + std::to_string(vector.size()) +
                                     " dimensions, index expects " + std::to_string(dimensions_),
                                 common::ErrorCode::InvalidArgument);
  }
  if (!contains(key) && vectors_.size() >= max_elements_) {
    return common::Status::error("vector index full", common::ErrorCode::Storage);
  }
  vectors_[key] = vector;
  return common::Status::success();
}

bool VectorIndex::remove(const std::string &key) { return vectors_.erase(key) > 0; }

common::Result<std::vector<VectorMatch>> VectorIndex::query(const std::vector<float> &vector,
                                                            const std::size_t limit) const {
  if (vector.size() != dimensions_) {
    return common::Result<std::vector<VectorMatch>>::failure(
        "query has " + std::to_string(vector.size()) + " dimensions, index expects " +
            std::to_string(dimensions_),
        common::ErrorCode::InvalidArgument);
  }

  std::vector<VectorMatch> matches;
  matches.reserve(vectors_.size());
  for (const auto &[key, stored] : vectors_) {
    const float similarity = cosine_similarity(vector, stored);
    matches.push_back(VectorMatch{
        .key = key,
        .distance = 1.0F - similarity,
        .score = std::clamp((similarity + 1.0F) / 2.0F, 0.0F, 1.0F),
    });
  }

  std::sort(matches.begin(), matches.end(), [](const VectorMatch &lhs, const VectorMatch &rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.key < rhs.key;
  });
  if (matches.size() > limit) {
    matches.resize(limit);
  }
  return common::Result<std::vector<VectorMatch>>::success(std::move(matches));
}

common::Status VectorIndex::save(const std::filesystem::path &path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::filesystem::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return common::Status::error("failed to open " + tmp.string() + " for write",
                                   common::ErrorCode::Storage);
    }
    out.write(kMagic.data(), static_cast<std::streamsize>(kMagic.size()));
    write_pod(out, kFormatVersion);
    write_pod(out, static_cast<std::uint64_t>(dimensions_));
    write_pod(out, static_cast<std::uint64_t>(vectors_.size()));

    // Sorted keys keep the file byte-stable for an unchanged index.
    std::vector<const std::string *> keys;
    keys.reserve(vectors_.size());
    for (const auto &entry : vectors_) {
      keys.push_back(&entry.first);
    }
    std::sort(keys.begin(), keys.end(),
              [](const std::string *lhs, const std::string *rhs) { return *lhs < *rhs; });

    for (const std::string *key : keys) {
      const auto &vector = vectors_.at(*key);
      write_pod(out, static_cast<std::uint64_t>(key->size()));
      out.write(key->data(), static_cast<std::streamsize>(key->size()));
      out.write(reinterpret_cast<const char *>(vector.data()),
                static_cast<std::streamsize>(vector.size() * sizeof(float)));
    }
    out.flush();
    if (!out) {
      std::filesystem::remove(tmp, ec);
      return common::Status::error("failed to write vector index " + tmp.string(),
                                   common::ErrorCode::Storage);
    }
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(tmp, ec);
    return common::Status::error("failed to replace vector index " + path.string() + ": " + reason,
                                 common::ErrorCode::Storage);
  }
  return common::Status::success();
}

common::Status VectorIndex::load(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    vectors_.clear();
    return common::Status::success();
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Status::error("failed to open vector index " + path.string(),
                                 common::ErrorCode::Storage);
  }

  std::array<char, 4> magic{};
  in.read(magic.data(), static_cast<std::streamsize>(magic.size()));
  std::uint32_t version = 0;
  std::uint64_t dims = 0;
  std::uint64_t count = 0;
  if (!in || std::memcmp(magic.data(), kMagic.data(), kMagic.size()) != 0 ||
      !read_pod(in, version) || !read_pod(in, dims) || !read_pod(in, count)) {
    return common::Status::error("vector index header is corrupt: " + path.string(),
                                 common::ErrorCode::Storage);
  }
  if (version != kFormatVersion) {
    return common::Status::error("unsupported vector index version " + std::to_string(version),
                                 common::ErrorCode::Storage);
  }
  if (dims != dimensions_) {
    return common::Status::error("vector index has " + std::to_string(dims) +
                                     " dimensions, expected " + std::to_string(dimensions_),
                                 common::ErrorCode::Storage);
  }

  if (count > max_elements_) {
    return common::Status::error("vector index holds " + std::to_string(count) +
                                     " entries, limit is " + std::to_string(max_elements_),
                                 common::ErrorCode::Storage);
  }

  std::unordered_map<std::string, std::vector<float>> loaded;
  loaded.reserve(static_cast<std::size_t>(count));
  for (std::uint64_t i = 0; i < count; ++i) {
    std::uint64_t key_size = 0;
    if (!read_pod(in, key_size) || key_size > (1U << 20)) {
      return common::Status::error("vector index entry is corrupt: " + path.string(),
                                   common::ErrorCode::Storage);
    }
    std::string key(static_cast<std::size_t>(key_size), '\0');
    in.read(key.data(), static_cast<std::streamsize>(key_size));
    std::vector<float> vector(dimensions_);
    in.read(reinterpret_cast<char *>(vector.data()),
            static_cast<std::streamsize>(vector.size() * sizeof(float)));
    if (!in) {
      return common::Status::error("vector index payload is truncated: " + path.string(),
                                   common::ErrorCode::Storage);
    }
    loaded[std::move(key)] = std::move(vector);
  }

  vectors_ = std::move(loaded);
  return common::Status::success();
}

} // namespace gardener::managers
