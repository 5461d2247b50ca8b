/*
 * 설명: 게이트웨이 디스패치 이벤트를 이름별 핸들러로 보내 캐시를 갱신하고 변경 알림을 낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "cord/entity_store.hpp"
#include "cord/notification.hpp"
#include "cord/observability.hpp"
#include "cord/pending_requests.hpp"

namespace cord {

enum class DispatchResult { kApplied, kDropped, kIgnored };

class Dispatcher {
 public:
  using DropHook = std::function<void(const std::string& event_name, std::uint64_t sequence, std::uint64_t last)>;

  Dispatcher(std::shared_ptr<EntityStore> store, std::shared_ptr<PendingRequests> pending,
             std::shared_ptr<Observability> observability);

  // 시퀀스가 마지막으로 본 값보다 작으면 적용하지 않는다.
  DispatchResult Dispatch(const std::string& event_name, std::optional<std::uint64_t> sequence,
                          const nlohmann::json& data);

  void ResetSequence();
  std::optional<std::uint64_t> LastSequence() const;

  void SetDropHook(DropHook hook);
  void SetNotificationSink(std::shared_ptr<NotificationSink> sink);

 private:
  using Handler = void (Dispatcher::*)(const nlohmann::json&);

  void OnReady(const nlohmann::json& data);
  void OnResumed(const nlohmann::json& data);
  void OnGuildCreate(const nlohmann::json& data);
  void OnGuildUpdate(const nlohmann::json& data);
  void OnGuildDelete(const nlohmann::json& data);
  void OnChannelUpsert(const nlohmann::json& data);
  void OnChannelDelete(const nlohmann::json& data);
  void OnThreadUpsert(const nlohmann::json& data);
  void OnThreadDelete(const nlohmann::json& data);
  void OnThreadListSync(const nlohmann::json& data);
  void OnThreadMemberUpdate(const nlohmann::json& data);
  void OnThreadMembersUpdate(const nlohmann::json& data);
  void OnThreadMemberListUpdate(const nlohmann::json& data);
  void OnGuildMemberAdd(const nlohmann::json& data);
  void OnGuildMemberUpdate(const nlohmann::json& data);
  void OnGuildMemberRemove(const nlohmann::json& data);
  void OnGuildRoleUpsert(const nlohmann::json& data);
  void OnGuildRoleDelete(const nlohmann::json& data);
  void OnUserUpdate(const nlohmann::json& data);

  void ApplyGuild(const nlohmann::json& data);
  void ApplyThread(Snowflake guild_id, const nlohmann::json& data);
  void ApplyMember(Snowflake guild_id, const nlohmann::json& data);
  void AdjustMemberCount(Snowflake guild_id, int delta);

  template <typename T>
  void Notify(EntityKind kind, Snowflake id, const Diff<T>& diff);
  template <typename T>
  void NotifyRemoved(EntityKind kind, Snowflake id, const std::shared_ptr<const T>& removed);

  std::shared_ptr<EntityStore> store_;
  std::shared_ptr<PendingRequests> pending_;
  std::shared_ptr<Observability> observability_;
  std::unordered_map<std::string, Handler> handlers_;

  mutable std::mutex mutex_;
  std::shared_ptr<NotificationSink> sink_;
  DropHook drop_hook_;
  std::optional<std::uint64_t> last_sequence_;
};

}  // namespace cord
