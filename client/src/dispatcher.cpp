/*
 * 설명: 이벤트별 캐시 갱신 규칙(길드/채널/스레드/멤버/역할/사용자)과 시퀀스 역행 감지를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/dispatcher_test.cpp
 */
#include "cord/dispatcher.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <vector>

namespace cord {
namespace {
Snowflake MemberUserId(const nlohmann::json& data) {
  auto user_it = data.find("user");
  if (user_it != data.end() && user_it->is_object()) {
    return ParseSnowflake(user_it->at("id"));
  }
  return ParseSnowflake(data.at("user_id"));
}

const nlohmann::json& ArrayOrEmpty(const nlohmann::json& data, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::array();
  auto it = data.find(key);
  if (it == data.end() || !it->is_array()) {
    return kEmpty;
  }
  return *it;
}
}  // namespace

Dispatcher::Dispatcher(std::shared_ptr<EntityStore> store, std::shared_ptr<PendingRequests> pending,
                       std::shared_ptr<Observability> observability)
    : store_(std::move(store)), pending_(std::move(pending)), observability_(std::move(observability)) {
  handlers_ = {
      {"READY", &Dispatcher::OnReady},
      {"RESUMED", &Dispatcher::OnResumed},
      {"GUILD_CREATE", &Dispatcher::OnGuildCreate},
      {"GUILD_UPDATE", &Dispatcher::OnGuildUpdate},
      {"GUILD_DELETE", &Dispatcher::OnGuildDelete},
      {"CHANNEL_CREATE", &Dispatcher::OnChannelUpsert},
      {"CHANNEL_UPDATE", &Dispatcher::OnChannelUpsert},
      {"CHANNEL_DELETE", &Dispatcher::OnChannelDelete},
      {"THREAD_CREATE", &Dispatcher::OnThreadUpsert},
      {"THREAD_UPDATE", &Dispatcher::OnThreadUpsert},
      {"THREAD_DELETE", &Dispatcher::OnThreadDelete},
      {"THREAD_LIST_SYNC", &Dispatcher::OnThreadListSync},
      {"THREAD_MEMBER_UPDATE", &Dispatcher::OnThreadMemberUpdate},
      {"THREAD_MEMBERS_UPDATE", &Dispatcher::OnThreadMembersUpdate},
      {"THREAD_MEMBER_LIST_UPDATE", &Dispatcher::OnThreadMemberListUpdate},
      {"GUILD_MEMBER_ADD", &Dispatcher::OnGuildMemberAdd},
      {"GUILD_MEMBER_UPDATE", &Dispatcher::OnGuildMemberUpdate},
      {"GUILD_MEMBER_REMOVE", &Dispatcher::OnGuildMemberRemove},
      {"GUILD_ROLE_CREATE", &Dispatcher::OnGuildRoleUpsert},
      {"GUILD_ROLE_UPDATE", &Dispatcher::OnGuildRoleUpsert},
      {"GUILD_ROLE_DELETE", &Dispatcher::OnGuildRoleDelete},
      {"USER_UPDATE", &Dispatcher::OnUserUpdate},
  };
}

DispatchResult Dispatcher::Dispatch(const std::string& event_name, std::optional<std::uint64_t> sequence,
                                    const nlohmann::json& data) {
  if (sequence) {
    DropHook hook;
    std::uint64_t last = 0;
    bool dropped = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (last_sequence_ && *sequence < *last_sequence_) {
        hook = drop_hook_;
        last = *last_sequence_;
        dropped = true;
      } else {
        last_sequence_ = sequence;
      }
    }
    if (dropped) {
      observability_->IncrementDropped();
      LogContext ctx;
      ctx.level = LogLevel::kWarn;
      ctx.name = "dispatch.out_of_order";
      ctx.sequence = *sequence;
      ctx.detail = {{"event", event_name}, {"lastSequence", last}};
      observability_->Log(ctx);
      if (hook) {
        hook(event_name, *sequence, last);
      }
      return DispatchResult::kDropped;
    }
  }

  auto result = DispatchResult::kIgnored;
  auto it = handlers_.find(event_name);
  if (it != handlers_.end()) {
    try {
      (this->*(it->second))(data);
      observability_->IncrementDispatched();
      result = DispatchResult::kApplied;
    } catch (const nlohmann::json::exception& e) {
      observability_->Log(LogLevel::kError, "dispatch.malformed", {{"event", event_name}, {"error", e.what()}});
    } catch (const std::invalid_argument& e) {
      observability_->Log(LogLevel::kError, "dispatch.malformed", {{"event", event_name}, {"error", e.what()}});
    }
  } else {
    observability_->Log(LogLevel::kDebug, "dispatch.unknown_event", {{"event", event_name}});
  }

  if (pending_) {
    pending_->Resolve(event_name, data);
  }
  return result;
}

void Dispatcher::ResetSequence() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_sequence_.reset();
}

std::optional<std::uint64_t> Dispatcher::LastSequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_sequence_;
}

void Dispatcher::SetDropHook(DropHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  drop_hook_ = std::move(hook);
}

void Dispatcher::SetNotificationSink(std::shared_ptr<NotificationSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

template <typename T>
void Dispatcher::Notify(EntityKind kind, Snowflake id, const Diff<T>& diff) {
  if (diff.Empty()) {
    return;
  }
  std::shared_ptr<NotificationSink> sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink = sink_;
  }
  if (sink) {
    sink->OnEntityChanged(MakeNotification(kind, id, diff));
  }
}

template <typename T>
void Dispatcher::NotifyRemoved(EntityKind kind, Snowflake id, const std::shared_ptr<const T>& removed) {
  if (!removed) {
    return;
  }
  std::shared_ptr<NotificationSink> sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink = sink_;
  }
  if (sink) {
    ChangeNotification notification;
    notification.kind = kind;
    notification.id = id;
    notification.before = ToJson(*removed);
    sink->OnEntityChanged(notification);
  }
}

void Dispatcher::OnReady(const nlohmann::json& data) {
  // READY는 전체 재동기화 경계다.
  store_->Clear();
  const auto& user = data.at("user");
  auto self_id = ParseSnowflake(user.at("id"));
  store_->SetSelfId(self_id);
  Notify(EntityKind::kUser, self_id, store_->UpsertUser(self_id, user));

  for (const auto& guild : ArrayOrEmpty(data, "guilds")) {
    ApplyGuild(guild);
  }
  LogContext ctx;
  ctx.name = "dispatch.ready";
  if (data.contains("session_id") && data["session_id"].is_string()) {
    ctx.session_id = data["session_id"].get<std::string>();
  }
  ctx.detail = {{"user", self_id.ToString()}, {"guilds", store_->Guilds().Size()}};
  observability_->Log(ctx);
}

void Dispatcher::OnResumed(const nlohmann::json&) {
  observability_->Log(LogLevel::kInfo, "dispatch.resumed", {{"lastSequence", LastSequence().value_or(0)}});
}

void Dispatcher::OnGuildCreate(const nlohmann::json& data) { ApplyGuild(data); }

void Dispatcher::OnGuildUpdate(const nlohmann::json& data) {
  auto id = ParseSnowflake(data.at("id"));
  Notify(EntityKind::kGuild, id, store_->UpsertGuild(id, data));
}

void Dispatcher::OnGuildDelete(const nlohmann::json& data) {
  auto id = ParseSnowflake(data.at("id"));
  // 장애로 인한 일시적 이용 불가는 삭제가 아니다.
  if (data.value("unavailable", false)) {
    Notify(EntityKind::kGuild, id, store_->UpsertGuild(id, {{"unavailable", true}}));
    return;
  }
  NotifyRemoved(EntityKind::kGuild, id, store_->RemoveGuild(id));
}

void Dispatcher::OnChannelUpsert(const nlohmann::json& data) {
  auto id = ParseSnowflake(data.at("id"));
  Notify(EntityKind::kChannel, id, store_->UpsertChannel(id, data));
}

void Dispatcher::OnChannelDelete(const nlohmann::json& data) {
  auto id = ParseSnowflake(data.at("id"));
  auto orphans = store_->Threads().Filter([id](const Thread& thread) { return thread.parent_id == id; });
  NotifyRemoved(EntityKind::kChannel, id, store_->RemoveChannel(id));
  for (const auto& thread : orphans) {
    NotifyRemoved(EntityKind::kThread, thread->id, thread);
  }
}

void Dispatcher::OnThreadUpsert(const nlohmann::json& data) {
  auto guild_id = ParseOptionalSnowflake(data, "guild_id");
  ApplyThread(guild_id.value_or(Snowflake{}), data);
}

void Dispatcher::OnThreadDelete(const nlohmann::json& data) {
  auto id = ParseSnowflake(data.at("id"));
  NotifyRemoved(EntityKind::kThread, id, store_->RemoveThread(id));
}

void Dispatcher::OnThreadListSync(const nlohmann::json& data) {
  auto guild_id = ParseSnowflake(data.at("guild_id"));
  std::set<Snowflake> synced;
  for (const auto& thread : ArrayOrEmpty(data, "threads")) {
    synced.insert(ParseSnowflake(thread.at("id")));
  }

  // channel_ids가 있으면 해당 부모 채널의 스레드만, 없으면 길드 전체가 동기화 범위다.
  std::optional<std::set<Snowflake>> scope;
  auto channels_it = data.find("channel_ids");
  if (channels_it != data.end() && channels_it->is_array()) {
    scope.emplace();
    for (const auto& channel_id : *channels_it) {
      scope->insert(ParseSnowflake(channel_id));
    }
  }
  auto stale = store_->Threads().Filter([&](const Thread& thread) {
    if (thread.guild_id != guild_id || synced.count(thread.id) > 0) {
      return false;
    }
    return !scope || scope->count(thread.parent_id) > 0;
  });
  for (const auto& thread : stale) {
    NotifyRemoved(EntityKind::kThread, thread->id, store_->RemoveThread(thread->id));
  }

  for (const auto& thread : ArrayOrEmpty(data, "threads")) {
    ApplyThread(guild_id, thread);
  }
  // 목록 동기화의 멤버 항목은 모두 로컬 사용자의 멤버십이다.
  for (const auto& member : ArrayOrEmpty(data, "members")) {
    auto thread_id = ParseSnowflake(member.at("id"));
    store_->SetSelfThreadMember(thread_id, ThreadMemberFromJson(member, thread_id, store_->SelfId()));
  }
}

void Dispatcher::OnThreadMemberUpdate(const nlohmann::json& data) {
  auto thread_id = ParseSnowflake(data.at("id"));
  auto member = ThreadMemberFromJson(data, thread_id, store_->SelfId());
  if (member.user_id == store_->SelfId()) {
    store_->SetSelfThreadMember(thread_id, member);
  } else {
    store_->AddThreadMember(thread_id, member);
  }
}

void Dispatcher::OnThreadMembersUpdate(const nlohmann::json& data) {
  auto thread_id = ParseSnowflake(data.at("id"));
  auto guild_id = ParseOptionalSnowflake(data, "guild_id");
  if (data.contains("member_count")) {
    Notify(EntityKind::kThread, thread_id,
           store_->Threads().Update(
               thread_id, [&data](Thread& thread) { thread.member_count = data["member_count"].get<int>(); }, false));
  }
  for (const auto& added : ArrayOrEmpty(data, "added_members")) {
    auto member = ThreadMemberFromJson(added, thread_id, store_->SelfId());
    if (member.user_id == store_->SelfId()) {
      store_->SetSelfThreadMember(thread_id, member);
    } else {
      store_->AddThreadMember(thread_id, member);
    }
    auto guild_member = added.find("member");
    if (guild_id && guild_member != added.end() && guild_member->is_object()) {
      ApplyMember(*guild_id, *guild_member);
    }
  }
  for (const auto& removed : ArrayOrEmpty(data, "removed_member_ids")) {
    store_->RemoveThreadMember(thread_id, ParseSnowflake(removed));
  }
}

void Dispatcher::OnThreadMemberListUpdate(const nlohmann::json& data) {
  auto thread_id = ParseSnowflake(data.at("thread_id"));
  auto guild_id = ParseOptionalSnowflake(data, "guild_id");
  for (const auto& entry : ArrayOrEmpty(data, "members")) {
    const auto& guild_member = entry.contains("member") ? entry.at("member") : entry;
    auto user_id = entry.contains("user_id") ? ParseSnowflake(entry.at("user_id")) : MemberUserId(guild_member);
    auto member = ThreadMemberFromJson(entry, thread_id, user_id);
    member.user_id = user_id;
    member.thread_id = thread_id;
    if (user_id == store_->SelfId()) {
      store_->SetSelfThreadMember(thread_id, member);
    } else {
      store_->AddThreadMember(thread_id, member);
    }
    if (guild_id && guild_member.is_object() && guild_member.contains("user")) {
      ApplyMember(*guild_id, guild_member);
    }
  }
}

void Dispatcher::OnGuildMemberAdd(const nlohmann::json& data) {
  auto guild_id = ParseSnowflake(data.at("guild_id"));
  ApplyMember(guild_id, data);
  AdjustMemberCount(guild_id, 1);
}

void Dispatcher::OnGuildMemberUpdate(const nlohmann::json& data) {
  ApplyMember(ParseSnowflake(data.at("guild_id")), data);
}

void Dispatcher::OnGuildMemberRemove(const nlohmann::json& data) {
  auto guild_id = ParseSnowflake(data.at("guild_id"));
  auto user_id = MemberUserId(data);
  NotifyRemoved(EntityKind::kMember, user_id, store_->RemoveMember(guild_id, user_id));
  AdjustMemberCount(guild_id, -1);
}

void Dispatcher::OnGuildRoleUpsert(const nlohmann::json& data) {
  auto guild_id = ParseSnowflake(data.at("guild_id"));
  const auto& role = data.at("role");
  auto id = ParseSnowflake(role.at("id"));
  Notify(EntityKind::kRole, id, store_->UpsertRole(guild_id, id, role));
}

void Dispatcher::OnGuildRoleDelete(const nlohmann::json& data) {
  auto guild_id = ParseSnowflake(data.at("guild_id"));
  auto id = ParseSnowflake(data.at("role_id"));
  NotifyRemoved(EntityKind::kRole, id, store_->RemoveRole(guild_id, id));
}

void Dispatcher::OnUserUpdate(const nlohmann::json& data) {
  auto id = ParseSnowflake(data.at("id"));
  Notify(EntityKind::kUser, id, store_->UpsertUser(id, data));
}

void Dispatcher::ApplyGuild(const nlohmann::json& data) {
  auto guild_id = ParseSnowflake(data.at("id"));
  Notify(EntityKind::kGuild, guild_id, store_->UpsertGuild(guild_id, data));

  for (const auto& role : ArrayOrEmpty(data, "roles")) {
    auto id = ParseSnowflake(role.at("id"));
    Notify(EntityKind::kRole, id, store_->UpsertRole(guild_id, id, role));
  }
  for (auto channel : ArrayOrEmpty(data, "channels")) {
    channel["guild_id"] = guild_id.ToString();
    auto id = ParseSnowflake(channel.at("id"));
    Notify(EntityKind::kChannel, id, store_->UpsertChannel(id, channel));
  }
  for (const auto& thread : ArrayOrEmpty(data, "threads")) {
    ApplyThread(guild_id, thread);
  }
  for (const auto& member : ArrayOrEmpty(data, "members")) {
    ApplyMember(guild_id, member);
  }
}

void Dispatcher::ApplyThread(Snowflake guild_id, const nlohmann::json& data) {
  auto id = ParseSnowflake(data.at("id"));
  nlohmann::json payload = data;
  if (!guild_id.IsZero()) {
    payload["guild_id"] = guild_id.ToString();
  }
  auto parent_id = ParseOptionalSnowflake(payload, "parent_id");
  if (parent_id && !store_->Channels().Get(*parent_id)) {
    observability_->Log(LogLevel::kDebug, "dispatch.thread_parent_missing",
                        {{"thread", id.ToString()}, {"parent", parent_id->ToString()}});
  }
  Notify(EntityKind::kThread, id, store_->UpsertThread(id, payload));
}

void Dispatcher::ApplyMember(Snowflake guild_id, const nlohmann::json& data) {
  auto user_id = MemberUserId(data);
  auto user_it = data.find("user");
  if (user_it != data.end() && user_it->is_object()) {
    Notify(EntityKind::kUser, user_id, store_->UpsertUser(user_id, *user_it));
  }
  Notify(EntityKind::kMember, user_id, store_->UpsertMember(guild_id, user_id, data));
}

void Dispatcher::AdjustMemberCount(Snowflake guild_id, int delta) {
  Notify(EntityKind::kGuild, guild_id,
         store_->Guilds().Update(
             guild_id, [delta](Guild& guild) { guild.member_count = std::max(0, guild.member_count + delta); },
             false));
}

}  // namespace cord
