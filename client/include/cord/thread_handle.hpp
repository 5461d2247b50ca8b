/*
 * 설명: 캐시된 스레드에 대한 조회/편집/멤버 관리 핸들. 멤버 목록은 게이트웨이 지연 요청으로 가져온다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/thread_handle_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cord/config.hpp"
#include "cord/entities.hpp"
#include "cord/entity_store.hpp"
#include "cord/messageable.hpp"
#include "cord/pending_requests.hpp"
#include "cord/rest_client.hpp"

namespace cord {

struct ThreadEdit {
  std::optional<std::string> name;
  std::optional<bool> archived;
  std::optional<bool> locked;
  std::optional<bool> invitable;
  std::optional<int> auto_archive_duration;
  std::optional<int> slowmode_delay;
  std::optional<std::string> reason;

  nlohmann::json ToPayload() const;
  bool Unarchives() const { return archived.has_value() && !*archived; }
};

struct PurgeOptions {
  HistoryQuery query;
  // 비어 있으면 모든 메시지를 지운다.
  std::function<bool(const Message&)> check;
};

class ThreadHandle : public Messageable {
 public:
  using LazyRequest = std::function<void(Snowflake guild_id, std::vector<Snowflake> thread_ids)>;

  ThreadHandle(Snowflake id, std::shared_ptr<EntityStore> store, std::shared_ptr<RestClient> rest,
               std::shared_ptr<PendingRequests> pending, LazyRequest lazy_request,
               std::chrono::milliseconds member_fetch_timeout);

  Snowflake Id() const { return id_; }
  Snowflake MessageChannelId() const override { return id_; }

  // 캐시에 없으면 ClientError.
  std::shared_ptr<const Thread> Snapshot() const;

  // 게이트웨이 이벤트 루프 스레드에서 호출하면 안 된다.
  std::vector<ThreadMember> FetchMembers();
  void AddMember(const ThreadMember& member);
  void RemoveMember(Snowflake user_id);

  void Join();
  void Leave();
  void AddUser(Snowflake user_id);
  void RemoveUser(Snowflake user_id);
  std::shared_ptr<const Thread> Edit(const ThreadEdit& edit);
  void Delete();
  void DeleteMessages(const std::vector<Snowflake>& message_ids);
  std::vector<Message> Purge(const PurgeOptions& options);

  std::shared_ptr<const Channel> Parent() const;
  std::shared_ptr<const Member> Owner() const;
  std::vector<ThreadMember> Members() const;
  std::optional<ThreadMember> Me() const;
  bool IsPrivate() const { return Snapshot()->IsPrivate(); }
  bool IsNews() const { return Snapshot()->IsNews(); }
  bool IsNsfw() const;
  std::chrono::system_clock::time_point CreatedAt() const { return Snapshot()->CreatedAt(); }
  std::string Mention() const { return "<#" + id_.ToString() + ">"; }
  std::optional<Snowflake> CategoryId() const;

 private:
  void MergeMemberList(const nlohmann::json& payload);

  Snowflake id_;
  std::shared_ptr<EntityStore> store_;
  std::shared_ptr<PendingRequests> pending_;
  LazyRequest lazy_request_;
  std::chrono::milliseconds member_fetch_timeout_;
};

}  // namespace cord
