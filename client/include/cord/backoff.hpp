/*
 * 설명: 재연결 대기 시간을 지수적으로 늘리고 지터를 섞는 백오프 계산기.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/gateway_session_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace cord {

class ExponentialBackoff {
 public:
  ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max,
                     std::uint32_t seed = std::random_device{}());

  // base * 2^attempt 이하의 값을 고르되 절반 이상은 보장하고 max로 자른다.
  std::chrono::milliseconds Next();
  void Reset() { attempt_ = 0; }
  std::uint32_t Attempt() const { return attempt_; }

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds max_;
  std::uint32_t attempt_{0};
  std::mt19937 rng_;
};

}  // namespace cord
