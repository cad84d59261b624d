#pragma once
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

enum class FusionPolicy {
  // Merge every result with the newest other-kind result still inside its validity window.
  IndependentLatest,
  // Fuse only timestamps seen by both detectors within tolerance_ms.
  StrictPairing,
};

const char* to_string(FusionPolicy policy);
FusionPolicy parse_fusion_policy(const std::string& name);

struct CorrelationConfig {
  FusionPolicy policy{FusionPolicy::IndependentLatest};
  size_t ring_capacity{30};
  int64_t face_timeout_ms{200};  // validity window of a face result
  int64_t pose_timeout_ms{500};  // validity window of a pose result
  int64_t max_delay_ms{200};     // strict pairing: pending entries older than this are evicted
  int64_t tolerance_ms{0};       // strict pairing: max timestamp distance of a pair
};

// Thread-safe meeting point of the face and pose streams. One mutex guards
// the pending map, the per-kind latest slots and the fused ring; every
// operation under it is O(1) amortized (strict pairing eviction is bounded
// by max_delay_ms worth of entries).
class CorrelationBuffer {
public:
  explicit CorrelationBuffer(CorrelationConfig cfg = {},
                             std::shared_ptr<spdlog::logger> log = nullptr);

  void add(DetectionKind kind, const DetectionResult& result, int64_t timestamp_ms);

  std::optional<FusedPoseSample> latest() const;
  bool is_fresh(std::chrono::milliseconds max_age) const;

  // Ring contents, oldest first.
  std::vector<FusedPoseSample> snapshot() const;
  size_t size() const;
  size_t pending_size() const;
  uint64_t evicted_count() const;
  const CorrelationConfig& config() const { return cfg_; }
  void clear();

private:
  struct KindSlot {
    std::shared_ptr<const LandmarkAccessor> landmarks;
    int64_t timestamp_ms{0};
    int64_t valid_until{0};
    bool present{false};
  };

  struct PendingPair {
    std::array<std::shared_ptr<const LandmarkAccessor>, kDetectionKinds> parts;
    TimePoint first_seen{};
  };

  int64_t timeout_for(DetectionKind kind) const;
  void add_independent(DetectionKind kind, const DetectionResult& result, int64_t ts);
  void add_strict(DetectionKind kind, const DetectionResult& result, int64_t ts);
  void evict_stale_pending(TimePoint now);
  void publish(FusedPoseSample sample);

  static FusedPoseSample fuse(const LandmarkAccessor* face, const LandmarkAccessor* pose,
                              int64_t ts);

  CorrelationConfig cfg_;
  std::shared_ptr<spdlog::logger> log_;

  mutable std::mutex mu_;
  std::array<KindSlot, kDetectionKinds> latest_by_kind_{};
  std::map<int64_t, PendingPair> pending_;
  std::deque<FusedPoseSample> ring_;
  std::optional<int64_t> last_ts_;
  std::optional<TimePoint> last_publish_;
  uint64_t evicted_{0};
};
