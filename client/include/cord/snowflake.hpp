/*
 * 설명: 64비트 스노우플레이크 식별자와 생성 시각 변환을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/snowflake_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace cord {

inline constexpr std::uint64_t kDiscordEpochMs = 1420070400000ULL;

struct Snowflake {
  std::uint64_t value{0};

  constexpr Snowflake() = default;
  constexpr Snowflake(std::uint64_t v) : value(v) {}

  constexpr std::uint64_t TimestampMs() const { return (value >> 22) + kDiscordEpochMs; }
  constexpr std::uint32_t WorkerId() const { return static_cast<std::uint32_t>((value & 0x3E0000) >> 17); }
  constexpr std::uint32_t ProcessId() const { return static_cast<std::uint32_t>((value & 0x1F000) >> 12); }
  constexpr std::uint32_t Increment() const { return static_cast<std::uint32_t>(value & 0xFFF); }
  constexpr bool IsZero() const { return value == 0; }

  std::chrono::system_clock::time_point CreatedAt() const;
  std::string ToString() const { return std::to_string(value); }

  friend constexpr bool operator==(Snowflake a, Snowflake b) { return a.value == b.value; }
  friend constexpr bool operator!=(Snowflake a, Snowflake b) { return a.value != b.value; }
  friend constexpr bool operator<(Snowflake a, Snowflake b) { return a.value < b.value; }
  friend constexpr bool operator>(Snowflake a, Snowflake b) { return a.value > b.value; }
  friend constexpr bool operator<=(Snowflake a, Snowflake b) { return a.value <= b.value; }
  friend constexpr bool operator>=(Snowflake a, Snowflake b) { return a.value >= b.value; }
};

std::chrono::system_clock::time_point SnowflakeTime(Snowflake id);

// high가 true이면 해당 밀리초에 속하는 가장 큰 id를 만든다.
Snowflake SnowflakeFromTime(std::chrono::system_clock::time_point tp, bool high = false);

Snowflake ParseSnowflake(const nlohmann::json& value);
std::optional<Snowflake> ParseOptionalSnowflake(const nlohmann::json& object, const char* key);

void to_json(nlohmann::json& j, const Snowflake& id);
void from_json(const nlohmann::json& j, Snowflake& id);

}  // namespace cord

template <>
struct std::hash<cord::Snowflake> {
  std::size_t operator()(const cord::Snowflake& id) const noexcept { return std::hash<std::uint64_t>{}(id.value); }
};
