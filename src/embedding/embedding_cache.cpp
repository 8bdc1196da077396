#include "gardener/embedding/embedding_cache.hpp"

#include "gardener/observability/global.hpp"

#include <chrono>
#include <exception>

namespace gardener::embedding {

namespace {

constexpr const char *kComponent = "embedding_cache";

void record_tier(const char *tier) {
  observability::record_metric(observability::CacheLookupMetric{.tier = tier});
}

} // namespace

EmbeddingCache::EmbeddingCache(std::unique_ptr<SqliteEmbeddingStore> disk,
                               const std::size_t memory_capacity)
    : disk_(std::move(disk)), memory_(memory_capacity) {}

EmbeddingResult EmbeddingCache::get_or_compute(const std::string &fingerprint,
                                               const ComputeFn &compute) {
  if (fingerprint.empty()) {
    return EmbeddingResult::failure("fingerprint must not be empty",
                                    common::ErrorCode::InvalidArgument);
  }

  std::shared_ptr<std::promise<EmbeddingResult>> leader;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto hit = memory_.get(fingerprint); hit.has_value()) {
      ++memory_hits_;
      lock.unlock();
      record_tier("memory");
      return EmbeddingResult::success(std::move(*hit));
    }

    if (const auto it = in_flight_.find(fingerprint); it != in_flight_.end()) {
      SharedOutcome outcome = it->second;
      lock.unlock();
      ++coalesced_waits_;
      return outcome.get();
    }

    leader = std::make_shared<std::promise<EmbeddingResult>>();
    in_flight_.emplace(fingerprint, leader->get_future().share());
  }

  EmbeddingResult outcome = EmbeddingResult::failure("unresolved", common::ErrorCode::Generic);
  try {
    outcome = resolve_uncached(fingerprint, compute);
  } catch (...) {
    // Waiters see the same exception; the slot is released so a later call
    // can retry.
    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_.erase(fingerprint);
    }
    leader->set_exception(std::current_exception());
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome.ok()) {
      memory_.put(fingerprint, outcome.value());
    }
    in_flight_.erase(fingerprint);
  }
  leader->set_value(outcome);
  return outcome;
}

EmbeddingResult EmbeddingCache::resolve_uncached(const std::string &fingerprint,
                                                 const ComputeFn &compute) {
  if (disk_ != nullptr) {
    auto stored = disk_->get(fingerprint);
    if (!stored.ok()) {
      observability::record_warning(kComponent, "disk lookup failed: " + stored.error());
    } else if (stored.value().has_value()) {
      ++disk_hits_;
      record_tier("disk");
      return EmbeddingResult::success(std::move(*stored.value()));
    }
  }

  ++misses_;
  record_tier("miss");
  if (!compute) {
    return EmbeddingResult::failure("no compute function supplied for cache miss",
                                    common::ErrorCode::InvalidArgument);
  }

  ++computations_;
  const auto started = std::chrono::steady_clock::now();
  EmbeddingResult computed = compute(fingerprint);
  const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (computed.ok() && computed.value().empty()) {
    computed = EmbeddingResult::failure("compute returned an empty embedding",
                                        common::ErrorCode::CacheCompute);
  }
  observability::record_metric(
      observability::EmbeddingComputeMetric{.latency = latency, .success = computed.ok()});

  if (!computed.ok()) {
    ++failed_computations_;
    const auto code = computed.code() == common::ErrorCode::Generic
                          ? common::ErrorCode::CacheCompute
                          : computed.code();
    return EmbeddingResult::failure(computed.error(), code);
  }

  if (disk_ != nullptr) {
    if (auto stored = disk_->put(fingerprint, computed.value()); !stored.ok()) {
      // The value is still served from memory; only persistence is lost.
      observability::record_warning(kComponent, "disk write failed: " + stored.error());
    }
  }
  return computed;
}

CacheStats EmbeddingCache::stats() {
  CacheStats stats;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats.memory_entries = memory_.size();
    stats.memory_capacity = memory_.capacity();
  }
  if (disk_ != nullptr) {
    if (auto count = disk_->count(); count.ok()) {
      stats.disk_entries = count.value();
    } else {
      observability::record_warning(kComponent, "disk count failed: " + count.error());
    }
  }
  stats.memory_hits = memory_hits_.load();
  stats.disk_hits = disk_hits_.load();
  stats.misses = misses_.load();
  stats.computations = computations_.load();
  stats.failed_computations = failed_computations_.load();
  stats.coalesced_waits = coalesced_waits_.load();
  return stats;
}

common::Status EmbeddingCache::clear() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    memory_.clear();
  }
  if (disk_ != nullptr) {
    return disk_->clear();
  }
  return common::Status::success();
}

} // namespace gardener::embedding
