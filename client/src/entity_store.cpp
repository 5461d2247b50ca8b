/*
 * 설명: 엔티티 캐시의 종류별 upsert/삭제와 길드 관계(id 집합) 유지, 스레드 멤버 변경을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/entity_store_test.cpp, client/tests/unit/thread_handle_test.cpp
 */
#include "cord/entity_store.hpp"

#include <stdexcept>

namespace cord {
namespace {
template <typename T>
std::optional<nlohmann::json> SnapshotOf(const std::shared_ptr<const T>& ptr) {
  if (!ptr) {
    return std::nullopt;
  }
  return ToJson(*ptr);
}

Snowflake RequireGuildId(const nlohmann::json& partial, std::optional<Snowflake> guild_id) {
  if (guild_id) {
    return *guild_id;
  }
  auto parsed = ParseOptionalSnowflake(partial, "guild_id");
  if (!parsed) {
    throw std::invalid_argument("멤버 키에는 guild_id가 필요합니다");
  }
  return *parsed;
}
}  // namespace

JsonDiff EntityStore::Upsert(EntityKind kind, Snowflake id, const nlohmann::json& partial) {
  switch (kind) {
    case EntityKind::kGuild:
      return ToJsonDiff(UpsertGuild(id, partial));
    case EntityKind::kChannel:
      return ToJsonDiff(UpsertChannel(id, partial));
    case EntityKind::kThread:
      return ToJsonDiff(UpsertThread(id, partial));
    case EntityKind::kMember:
      return ToJsonDiff(UpsertMember(RequireGuildId(partial, std::nullopt), id, partial));
    case EntityKind::kRole:
      return ToJsonDiff(UpsertRole(RequireGuildId(partial, std::nullopt), id, partial));
    case EntityKind::kUser:
      return ToJsonDiff(UpsertUser(id, partial));
  }
  throw std::invalid_argument("알 수 없는 엔티티 종류");
}

std::optional<nlohmann::json> EntityStore::Get(EntityKind kind, Snowflake id,
                                               std::optional<Snowflake> guild_id) const {
  switch (kind) {
    case EntityKind::kGuild:
      return SnapshotOf(guilds_.Get(id));
    case EntityKind::kChannel:
      return SnapshotOf(channels_.Get(id));
    case EntityKind::kThread:
      return SnapshotOf(threads_.Get(id));
    case EntityKind::kMember:
      return SnapshotOf(members_.Get(MemberKey{RequireGuildId(nlohmann::json::object(), guild_id), id}));
    case EntityKind::kRole:
      return SnapshotOf(roles_.Get(id));
    case EntityKind::kUser:
      return SnapshotOf(users_.Get(id));
  }
  return std::nullopt;
}

std::optional<nlohmann::json> EntityStore::Remove(EntityKind kind, Snowflake id, std::optional<Snowflake> guild_id) {
  switch (kind) {
    case EntityKind::kGuild:
      return SnapshotOf(RemoveGuild(id));
    case EntityKind::kChannel:
      return SnapshotOf(RemoveChannel(id));
    case EntityKind::kThread:
      return SnapshotOf(RemoveThread(id));
    case EntityKind::kMember:
      return SnapshotOf(RemoveMember(RequireGuildId(nlohmann::json::object(), guild_id), id));
    case EntityKind::kRole: {
      auto role = roles_.Get(id);
      if (!role) {
        return std::nullopt;
      }
      return SnapshotOf(RemoveRole(role->guild_id, id));
    }
    case EntityKind::kUser:
      return SnapshotOf(users_.Remove(id));
  }
  return std::nullopt;
}

Diff<Guild> EntityStore::UpsertGuild(Snowflake id, const nlohmann::json& partial) {
  return guilds_.Upsert(id, partial);
}

Diff<Channel> EntityStore::UpsertChannel(Snowflake id, const nlohmann::json& partial) {
  auto diff = channels_.Upsert(id, partial);
  if (diff.after && diff.after->guild_id) {
    LinkToGuild(EntityKind::kChannel, *diff.after->guild_id, id);
  }
  return diff;
}

Diff<Thread> EntityStore::UpsertThread(Snowflake id, const nlohmann::json& partial) {
  // 스레드에 포함된 member 항목은 user_id가 빠져 있을 수 있다.
  auto self_it = partial.find("member");
  if (self_it != partial.end() && self_it->is_object() && !self_it->contains("user_id")) {
    nlohmann::json payload = partial;
    payload["member"]["user_id"] = SelfId().ToString();
    return UpsertThread(id, payload);
  }
  auto diff = threads_.Upsert(id, partial);
  if (diff.after && !diff.after->guild_id.IsZero()) {
    LinkToGuild(EntityKind::kThread, diff.after->guild_id, id);
  }
  return diff;
}

Diff<Role> EntityStore::UpsertRole(Snowflake guild_id, Snowflake id, const nlohmann::json& partial) {
  auto diff = roles_.Update(id, [&](Role& role) {
    role.guild_id = guild_id;
    MergeJson(role, partial);
  });
  LinkToGuild(EntityKind::kRole, guild_id, id);
  return diff;
}

Diff<Member> EntityStore::UpsertMember(Snowflake guild_id, Snowflake user_id, const nlohmann::json& partial) {
  auto user_it = partial.find("user");
  if (user_it != partial.end() && user_it->is_object()) {
    users_.Upsert(user_id, *user_it);
  }
  auto diff = members_.Upsert(MemberKey{guild_id, user_id}, partial);
  LinkToGuild(EntityKind::kMember, guild_id, user_id);
  return diff;
}

Diff<User> EntityStore::UpsertUser(Snowflake id, const nlohmann::json& partial) { return users_.Upsert(id, partial); }

std::shared_ptr<const Guild> EntityStore::RemoveGuild(Snowflake id) {
  auto removed = guilds_.Remove(id);
  if (!removed) {
    return nullptr;
  }
  for (const auto& channel_id : removed->channel_ids) {
    channels_.Remove(channel_id);
  }
  for (const auto& thread_id : removed->thread_ids) {
    threads_.Remove(thread_id);
  }
  for (const auto& role_id : removed->role_ids) {
    roles_.Remove(role_id);
  }
  for (const auto& user_id : removed->member_ids) {
    members_.Remove(MemberKey{id, user_id});
  }
  return removed;
}

std::shared_ptr<const Channel> EntityStore::RemoveChannel(Snowflake id) {
  auto removed = channels_.Remove(id);
  if (!removed) {
    return nullptr;
  }
  if (removed->guild_id) {
    UnlinkFromGuild(EntityKind::kChannel, *removed->guild_id, id);
  }
  // 부모 채널이 사라지면 그 아래 스레드도 유효하지 않다.
  auto orphans = threads_.Filter([id](const Thread& thread) { return thread.parent_id == id; });
  for (const auto& thread : orphans) {
    RemoveThread(thread->id);
  }
  return removed;
}

std::shared_ptr<const Thread> EntityStore::RemoveThread(Snowflake id) {
  auto removed = threads_.Remove(id);
  if (removed && !removed->guild_id.IsZero()) {
    UnlinkFromGuild(EntityKind::kThread, removed->guild_id, id);
  }
  return removed;
}

std::shared_ptr<const Role> EntityStore::RemoveRole(Snowflake guild_id, Snowflake id) {
  auto removed = roles_.Remove(id);
  if (removed) {
    UnlinkFromGuild(EntityKind::kRole, guild_id, id);
  }
  return removed;
}

std::shared_ptr<const Member> EntityStore::RemoveMember(Snowflake guild_id, Snowflake user_id) {
  auto removed = members_.Remove(MemberKey{guild_id, user_id});
  if (removed) {
    UnlinkFromGuild(EntityKind::kMember, guild_id, user_id);
  }
  return removed;
}

Diff<Thread> EntityStore::AddThreadMember(Snowflake thread_id, const ThreadMember& member) {
  if (member.user_id == SelfId()) {
    return Diff<Thread>{threads_.Get(thread_id), threads_.Get(thread_id), false, false};
  }
  return threads_.Update(
      thread_id, [&member](Thread& thread) { thread.members[member.user_id] = member; }, false);
}

Diff<Thread> EntityStore::RemoveThreadMember(Snowflake thread_id, Snowflake user_id) {
  return threads_.Update(
      thread_id,
      [this, user_id](Thread& thread) {
        thread.members.erase(user_id);
        if (user_id == SelfId()) {
          thread.self_member.reset();
        }
      },
      false);
}

Diff<Thread> EntityStore::SetSelfThreadMember(Snowflake thread_id, std::optional<ThreadMember> member) {
  return threads_.Update(
      thread_id, [&member](Thread& thread) { thread.self_member = member; }, false);
}

std::vector<ThreadMember> EntityStore::ThreadMembers(Snowflake thread_id) const {
  std::vector<ThreadMember> out;
  auto thread = threads_.Get(thread_id);
  if (!thread) {
    return out;
  }
  out.reserve(thread->members.size() + 1);
  for (const auto& [user_id, member] : thread->members) {
    out.push_back(member);
  }
  if (thread->self_member) {
    out.push_back(*thread->self_member);
  }
  return out;
}

void EntityStore::Clear() {
  guilds_.Clear();
  channels_.Clear();
  threads_.Clear();
  members_.Clear();
  roles_.Clear();
  users_.Clear();
}

void EntityStore::LinkToGuild(EntityKind kind, Snowflake guild_id, Snowflake id) {
  guilds_.Update(
      guild_id,
      [kind, id](Guild& guild) {
        switch (kind) {
          case EntityKind::kChannel:
            guild.channel_ids.insert(id);
            break;
          case EntityKind::kThread:
            guild.thread_ids.insert(id);
            break;
          case EntityKind::kRole:
            guild.role_ids.insert(id);
            break;
          case EntityKind::kMember:
            guild.member_ids.insert(id);
            break;
          default:
            break;
        }
      },
      false);
}

void EntityStore::UnlinkFromGuild(EntityKind kind, Snowflake guild_id, Snowflake id) {
  guilds_.Update(
      guild_id,
      [kind, id](Guild& guild) {
        switch (kind) {
          case EntityKind::kChannel:
            guild.channel_ids.erase(id);
            break;
          case EntityKind::kThread:
            guild.thread_ids.erase(id);
            break;
          case EntityKind::kRole:
            guild.role_ids.erase(id);
            break;
          case EntityKind::kMember:
            guild.member_ids.erase(id);
            break;
          default:
            break;
        }
      },
      false);
}

}  // namespace cord
