/*
 * 설명: 지수 백오프와 지터 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/gateway_session_test.cpp
 */
#include "cord/backoff.hpp"

#include <algorithm>

namespace cord {

ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds max,
                                       std::uint32_t seed)
    : base_(base), max_(std::max(base, max)), rng_(seed) {}

std::chrono::milliseconds ExponentialBackoff::Next() {
  const auto exponent = std::min<std::uint32_t>(attempt_, 20);
  auto ceiling = base_.count() * (std::int64_t{1} << exponent);
  ceiling = std::min<std::int64_t>(ceiling, max_.count());
  if (attempt_ < 32) {
    ++attempt_;
  }
  if (ceiling <= 1) {
    return std::chrono::milliseconds(ceiling);
  }
  std::uniform_int_distribution<std::int64_t> dist(ceiling / 2, ceiling);
  return std::chrono::milliseconds(dist(rng_));
}

}  // namespace cord
