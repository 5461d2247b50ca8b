/*
 * 설명: REST 경로별 레이트리밋 버킷. 같은 버킷을 쓰는 요청은 한 번에 하나씩만 진행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/rate_limiter_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "cord/observability.hpp"

namespace cord {

// 헤더 이름은 소문자로 정규화해서 저장한다.
using HeaderMap = std::map<std::string, std::string>;

struct RateLimitHeaders {
  std::optional<std::size_t> limit;
  std::optional<std::size_t> remaining;
  std::optional<std::chrono::milliseconds> reset_after;
  std::optional<std::chrono::milliseconds> retry_after;
  bool global{false};
  std::optional<std::string> scope;

  static RateLimitHeaders FromHeaders(const HeaderMap& headers);
};

struct BucketState {
  std::size_t limit{0};
  std::size_t remaining{0};
  bool busy{false};
  std::chrono::steady_clock::time_point reset_at{};
};

class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

 private:
  struct Bucket {
    std::mutex mutex;
    std::condition_variable cv;
    std::size_t limit;
    std::size_t remaining;
    Clock::time_point reset_at{};
    bool busy{false};

    explicit Bucket(std::size_t default_limit) : limit(default_limit), remaining(default_limit) {}
  };

 public:
  // 버킷 하나를 점유한다. 소멸 시 busy를 해제하고 대기자를 깨운다.
  class ScopedPermit {
   public:
    ScopedPermit() = default;
    ScopedPermit(const ScopedPermit&) = delete;
    ScopedPermit& operator=(const ScopedPermit&) = delete;
    ScopedPermit(ScopedPermit&& other) noexcept;
    ScopedPermit& operator=(ScopedPermit&& other) noexcept;
    ~ScopedPermit();

    void Update(const RateLimitHeaders& headers);
    bool Valid() const { return bucket_ != nullptr; }

   private:
    friend class RateLimiter;
    explicit ScopedPermit(std::shared_ptr<Bucket> bucket) : bucket_(std::move(bucket)) {}
    void Release();

    std::shared_ptr<Bucket> bucket_;
  };

  explicit RateLimiter(std::size_t default_limit = 50, std::shared_ptr<Observability> observability = nullptr);

  ScopedPermit Acquire(const std::string& key);
  void Update(const std::string& key, const RateLimitHeaders& headers);
  void OnRateLimited(const std::string& key, std::chrono::milliseconds retry_after, bool global);

  std::optional<BucketState> Inspect(const std::string& key) const;
  std::size_t BucketCount() const;

  static std::string MakeKey(const std::string& method, const std::string& route, const std::string& major);

 private:
  std::shared_ptr<Bucket> BucketFor(const std::string& key);
  static void ApplyHeaders(Bucket& bucket, const RateLimitHeaders& headers);
  void WakeAll();

  std::size_t default_limit_;
  std::shared_ptr<Observability> observability_;
  mutable std::shared_mutex buckets_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Bucket>> buckets_;
  std::atomic<Clock::rep> global_until_{0};
};

}  // namespace cord
