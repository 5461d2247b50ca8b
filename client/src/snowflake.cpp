/*
 * 설명: 스노우플레이크 파싱과 시각 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/snowflake_test.cpp
 */
#include "cord/snowflake.hpp"

#include <stdexcept>

namespace cord {

std::chrono::system_clock::time_point Snowflake::CreatedAt() const { return SnowflakeTime(*this); }

std::chrono::system_clock::time_point SnowflakeTime(Snowflake id) {
  return std::chrono::system_clock::time_point{std::chrono::milliseconds(id.TimestampMs())};
}

Snowflake SnowflakeFromTime(std::chrono::system_clock::time_point tp, bool high) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  auto since_epoch = static_cast<std::int64_t>(ms) - static_cast<std::int64_t>(kDiscordEpochMs);
  if (since_epoch < 0) {
    since_epoch = 0;
  }
  std::uint64_t value = static_cast<std::uint64_t>(since_epoch) << 22;
  if (high) {
    value += (1ULL << 22) - 1;
  }
  return Snowflake{value};
}

Snowflake ParseSnowflake(const nlohmann::json& value) {
  if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
      throw std::invalid_argument("스노우플레이크 형식이 올바르지 않습니다: " + text);
    }
    try {
      return Snowflake{std::stoull(text)};
    } catch (const std::out_of_range&) {
      throw std::invalid_argument("스노우플레이크 범위를 벗어났습니다: " + text);
    }
  }
  if (value.is_number_unsigned()) {
    return Snowflake{value.get<std::uint64_t>()};
  }
  if (value.is_number_integer()) {
    auto signed_value = value.get<std::int64_t>();
    if (signed_value < 0) {
      throw std::invalid_argument("스노우플레이크는 음수일 수 없습니다: " + value.dump());
    }
    return Snowflake{static_cast<std::uint64_t>(signed_value)};
  }
  throw std::invalid_argument("스노우플레이크는 문자열 또는 정수여야 합니다");
}

std::optional<Snowflake> ParseOptionalSnowflake(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  return ParseSnowflake(*it);
}

void to_json(nlohmann::json& j, const Snowflake& id) { j = id.ToString(); }

void from_json(const nlohmann::json& j, Snowflake& id) { id = ParseSnowflake(j); }

}  // namespace cord
