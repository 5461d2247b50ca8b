/*
 * 설명: 엔티티 변경 알림(before/after 스냅샷)과 알림 수신자 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <functional>
#include <optional>

#include <nlohmann/json.hpp>

#include "cord/entities.hpp"
#include "cord/entity_store.hpp"

namespace cord {

struct ChangeNotification {
  EntityKind kind{EntityKind::kGuild};
  Snowflake id;
  std::optional<nlohmann::json> before;
  std::optional<nlohmann::json> after;

  bool IsCreate() const { return !before && after.has_value(); }
  bool IsDelete() const { return before.has_value() && !after; }
};

template <typename T>
ChangeNotification MakeNotification(EntityKind kind, Snowflake id, const Diff<T>& diff) {
  ChangeNotification out;
  out.kind = kind;
  out.id = id;
  if (auto old = diff.OldSnapshot()) {
    out.before = ToJson(*old);
  }
  if (diff.after) {
    out.after = ToJson(*diff.after);
  }
  return out;
}

class NotificationSink {
 public:
  virtual ~NotificationSink() = default;
  virtual void OnEntityChanged(const ChangeNotification& notification) = 0;
};

class CallbackNotificationSink : public NotificationSink {
 public:
  using Callback = std::function<void(const ChangeNotification&)>;

  explicit CallbackNotificationSink(Callback callback);
  void OnEntityChanged(const ChangeNotification& notification) override;

 private:
  Callback callback_;
};

}  // namespace cord
