/*
 * 설명: 채널 유형 열거형과 알 수 없는 값을 보존하는 태그 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/entity_store_test.cpp
 */
#pragma once

#include <string_view>

namespace cord {

enum class ChannelKind {
  kText,
  kPrivate,
  kVoice,
  kGroup,
  kCategory,
  kNews,
  kStore,
  kNewsThread,
  kPublicThread,
  kPrivateThread,
  kStageVoice,
  kDirectory,
  kForum,
  kUnknown,
};

struct ChannelType {
  ChannelKind kind{ChannelKind::kText};
  int raw{0};

  static ChannelType FromValue(int value);

  bool IsThread() const {
    return kind == ChannelKind::kNewsThread || kind == ChannelKind::kPublicThread ||
           kind == ChannelKind::kPrivateThread;
  }
  bool IsUnknown() const { return kind == ChannelKind::kUnknown; }

  friend bool operator==(const ChannelType& a, const ChannelType& b) { return a.raw == b.raw; }
  friend bool operator!=(const ChannelType& a, const ChannelType& b) { return a.raw != b.raw; }
  friend bool operator<(const ChannelType& a, const ChannelType& b) { return a.raw < b.raw; }
};

std::string_view ToString(ChannelKind kind);

}  // namespace cord
