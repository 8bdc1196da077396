#pragma once

#include "gardener/common/lru_cache.hpp"
#include "gardener/common/result.hpp"
#include "gardener/embedding/disk_store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gardener::embedding {

using EmbeddingResult = common::Result<std::vector<float>>;
using ComputeFn = std::function<EmbeddingResult(const std::string &fingerprint)>;

struct CacheStats {
  std::size_t memory_entries = 0;
  std::size_t disk_entries = 0;
  std::size_t memory_capacity = 0;
  std::uint64_t memory_hits = 0;
  std::uint64_t disk_hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t computations = 0;
  std::uint64_t failed_computations = 0;
  // Callers that waited on another caller's in-flight computation.
  std::uint64_t coalesced_waits = 0;
};

/// Content-addressed embedding cache: bounded LRU in memory over a sqlite
/// tier. At most one computation runs per fingerprint; concurrent callers for
/// the same fingerprint share its outcome. Failed computations are never
/// stored.
class EmbeddingCache {
public:
  /// `disk` may be null for a memory-only cache.
  EmbeddingCache(std::unique_ptr<SqliteEmbeddingStore> disk, std::size_t memory_capacity);

  EmbeddingCache(const EmbeddingCache &) = delete;
  EmbeddingCache &operator=(const EmbeddingCache &) = delete;

  [[nodiscard]] EmbeddingResult get_or_compute(const std::string &fingerprint,
                                               const ComputeFn &compute);
  [[nodiscard]] CacheStats stats();
  /// Drops both tiers. Computations already in flight still deliver to their
  /// waiters and repopulate memory.
  [[nodiscard]] common::Status clear();

private:
  using SharedOutcome = std::shared_future<EmbeddingResult>;

  [[nodiscard]] EmbeddingResult resolve_uncached(const std::string &fingerprint,
                                                 const ComputeFn &compute);

  std::unique_ptr<SqliteEmbeddingStore> disk_;
  std::mutex mutex_;
  common::LruCache<std::string, std::vector<float>> memory_;
  std::unordered_map<std::string, SharedOutcome> in_flight_;

  std::atomic<std::uint64_t> memory_hits_{0};
  std::atomic<std::uint64_t> disk_hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> computations_{0};
  std::atomic<std::uint64_t> failed_computations_{0};
  std::atomic<std::uint64_t> coalesced_waits_{0};
};

} // namespace gardener::embedding
