/*
 * 설명: 채널 유형 원시값과 열거형 사이의 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/entity_store_test.cpp
 */
#include "cord/channel_type.hpp"

namespace cord {

ChannelType ChannelType::FromValue(int value) {
  ChannelKind kind = ChannelKind::kUnknown;
  switch (value) {
    case 0:
      kind = ChannelKind::kText;
      break;
    case 1:
      kind = ChannelKind::kPrivate;
      break;
    case 2:
      kind = ChannelKind::kVoice;
      break;
    case 3:
      kind = ChannelKind::kGroup;
      break;
    case 4:
      kind = ChannelKind::kCategory;
      break;
    case 5:
      kind = ChannelKind::kNews;
      break;
    case 6:
      kind = ChannelKind::kStore;
      break;
    case 10:
      kind = ChannelKind::kNewsThread;
      break;
    case 11:
      kind = ChannelKind::kPublicThread;
      break;
    case 12:
      kind = ChannelKind::kPrivateThread;
      break;
    case 13:
      kind = ChannelKind::kStageVoice;
      break;
    case 14:
      kind = ChannelKind::kDirectory;
      break;
    case 15:
      kind = ChannelKind::kForum;
      break;
    default:
      break;
  }
  return ChannelType{kind, value};
}

std::string_view ToString(ChannelKind kind) {
  switch (kind) {
    case ChannelKind::kText:
      return "text";
    case ChannelKind::kPrivate:
      return "private";
    case ChannelKind::kVoice:
      return "voice";
    case ChannelKind::kGroup:
      return "group";
    case ChannelKind::kCategory:
      return "category";
    case ChannelKind::kNews:
      return "news";
    case ChannelKind::kStore:
      return "store";
    case ChannelKind::kNewsThread:
      return "news_thread";
    case ChannelKind::kPublicThread:
      return "public_thread";
    case ChannelKind::kPrivateThread:
      return "private_thread";
    case ChannelKind::kStageVoice:
      return "stage_voice";
    case ChannelKind::kDirectory:
      return "directory";
    case ChannelKind::kForum:
      return "forum";
    case ChannelKind::kUnknown:
      break;
  }
  return "unknown";
}

}  // namespace cord
