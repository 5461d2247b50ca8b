/*
 * 설명: 레이트리밋 버킷 대기/소비/갱신과 전역 쿨다운을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/rate_limiter_test.cpp
 */
#include "cord/rate_limiter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

namespace cord {
namespace {
std::optional<std::string> FindHeader(const HeaderMap& headers, const std::string& name) {
  for (const auto& [key, value] : headers) {
    if (key.size() != name.size()) {
      continue;
    }
    bool same = std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
    if (same) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<std::size_t> ParseCount(const std::optional<std::string>& text) {
  if (!text) {
    return std::nullopt;
  }
  try {
    return static_cast<std::size_t>(std::stoul(*text));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// 초 단위 소수("1.250")를 밀리초로 올림 변환한다.
std::optional<std::chrono::milliseconds> ParseSeconds(const std::optional<std::string>& text) {
  if (!text) {
    return std::nullopt;
  }
  try {
    double seconds = std::stod(*text);
    if (seconds < 0) {
      return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}
}  // namespace

RateLimitHeaders RateLimitHeaders::FromHeaders(const HeaderMap& headers) {
  RateLimitHeaders out;
  out.limit = ParseCount(FindHeader(headers, "x-ratelimit-limit"));
  out.remaining = ParseCount(FindHeader(headers, "x-ratelimit-remaining"));
  out.reset_after = ParseSeconds(FindHeader(headers, "x-ratelimit-reset-after"));
  out.retry_after = ParseSeconds(FindHeader(headers, "retry-after"));
  auto global = FindHeader(headers, "x-ratelimit-global");
  out.global = global && (*global == "true" || *global == "True");
  out.scope = FindHeader(headers, "x-ratelimit-scope");
  if (out.scope && *out.scope == "global") {
    out.global = true;
  }
  return out;
}

RateLimiter::ScopedPermit::ScopedPermit(ScopedPermit&& other) noexcept : bucket_(std::move(other.bucket_)) {}

RateLimiter::ScopedPermit& RateLimiter::ScopedPermit::operator=(ScopedPermit&& other) noexcept {
  if (this != &other) {
    Release();
    bucket_ = std::move(other.bucket_);
  }
  return *this;
}

RateLimiter::ScopedPermit::~ScopedPermit() { Release(); }

void RateLimiter::ScopedPermit::Update(const RateLimitHeaders& headers) {
  if (!bucket_) {
    return;
  }
  std::lock_guard<std::mutex> lock(bucket_->mutex);
  ApplyHeaders(*bucket_, headers);
}

void RateLimiter::ScopedPermit::Release() {
  if (!bucket_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(bucket_->mutex);
    bucket_->busy = false;
  }
  bucket_->cv.notify_all();
  bucket_.reset();
}

RateLimiter::RateLimiter(std::size_t default_limit, std::shared_ptr<Observability> observability)
    : default_limit_(default_limit == 0 ? 1 : default_limit), observability_(std::move(observability)) {}

RateLimiter::ScopedPermit RateLimiter::Acquire(const std::string& key) {
  auto bucket = BucketFor(key);
  std::unique_lock<std::mutex> lock(bucket->mutex);
  while (true) {
    if (bucket->busy) {
      bucket->cv.wait(lock);
      continue;
    }
    auto now = Clock::now();
    auto global_until = Clock::time_point(Clock::duration(global_until_.load()));
    if (global_until > now) {
      bucket->cv.wait_until(lock, global_until);
      continue;
    }
    if (bucket->remaining == 0) {
      if (bucket->reset_at > now) {
        bucket->cv.wait_until(lock, bucket->reset_at);
        continue;
      }
      bucket->remaining = bucket->limit;
    }
    break;
  }
  bucket->busy = true;
  --bucket->remaining;
  return ScopedPermit(std::move(bucket));
}

void RateLimiter::Update(const std::string& key, const RateLimitHeaders& headers) {
  auto bucket = BucketFor(key);
  {
    std::lock_guard<std::mutex> lock(bucket->mutex);
    ApplyHeaders(*bucket, headers);
  }
  bucket->cv.notify_all();
}

void RateLimiter::OnRateLimited(const std::string& key, std::chrono::milliseconds retry_after, bool global) {
  if (observability_) {
    observability_->IncrementRateLimitHit();
    observability_->Log(LogLevel::kWarn, "rest.rate_limited",
                        {{"bucket", key}, {"retryAfterMs", retry_after.count()}, {"global", global}});
  }
  auto until = Clock::now() + retry_after;
  if (global) {
    auto encoded = until.time_since_epoch().count();
    auto current = global_until_.load();
    while (current < encoded && !global_until_.compare_exchange_weak(current, encoded)) {
    }
    WakeAll();
    return;
  }
  auto bucket = BucketFor(key);
  {
    std::lock_guard<std::mutex> lock(bucket->mutex);
    bucket->remaining = 0;
    bucket->reset_at = std::max(bucket->reset_at, until);
  }
  bucket->cv.notify_all();
}

std::optional<BucketState> RateLimiter::Inspect(const std::string& key) const {
  std::shared_ptr<Bucket> bucket;
  {
    std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
      return std::nullopt;
    }
    bucket = it->second;
  }
  std::lock_guard<std::mutex> lock(bucket->mutex);
  return BucketState{bucket->limit, bucket->remaining, bucket->busy, bucket->reset_at};
}

std::size_t RateLimiter::BucketCount() const {
  std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
  return buckets_.size();
}

std::string RateLimiter::MakeKey(const std::string& method, const std::string& route, const std::string& major) {
  return method + " " + route + ":" + major;
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::BucketFor(const std::string& key) {
  {
    std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
    auto it = buckets_.find(key);
    if (it != buckets_.end()) {
      return it->second;
    }
  }
  std::unique_lock<std::shared_mutex> lock(buckets_mutex_);
  auto [it, inserted] = buckets_.try_emplace(key, nullptr);
  if (inserted) {
    it->second = std::make_shared<Bucket>(default_limit_);
  }
  return it->second;
}

void RateLimiter::ApplyHeaders(Bucket& bucket, const RateLimitHeaders& headers) {
  if (headers.limit && *headers.limit > 0) {
    bucket.limit = *headers.limit;
  }
  if (headers.remaining) {
    bucket.remaining = *headers.remaining;
  }
  if (headers.reset_after) {
    bucket.reset_at = Clock::now() + *headers.reset_after;
  }
}

void RateLimiter::WakeAll() {
  std::vector<std::shared_ptr<Bucket>> snapshot;
  {
    std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
    snapshot.reserve(buckets_.size());
    for (const auto& [key, bucket] : buckets_) {
      snapshot.push_back(bucket);
    }
  }
  for (auto& bucket : snapshot) {
    {
      std::lock_guard<std::mutex> lock(bucket->mutex);
    }
    bucket->cv.notify_all();
  }
}

}  // namespace cord
