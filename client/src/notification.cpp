/*
 * 설명: 콜백 기반 알림 수신자를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/dispatcher_test.cpp
 */
#include "cord/notification.hpp"

#include <utility>

namespace cord {

CallbackNotificationSink::CallbackNotificationSink(Callback callback) : callback_(std::move(callback)) {}

void CallbackNotificationSink::OnEntityChanged(const ChangeNotification& notification) {
  if (callback_) {
    callback_(notification);
  }
}

}  // namespace cord
