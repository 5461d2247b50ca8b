/*
 * 설명: 엔티티 부분 병합, 관측 가능 필드 비교, 스냅샷 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/entity_store_test.cpp
 */
#include "cord/entities.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace cord {
namespace {
template <typename T>
void AssignIfPresent(const nlohmann::json& partial, const char* key, T& target) {
  auto it = partial.find(key);
  if (it != partial.end() && !it->is_null()) {
    target = it->get<T>();
  }
}

void AssignOptionalString(const nlohmann::json& partial, const char* key, std::optional<std::string>& target) {
  auto it = partial.find(key);
  if (it == partial.end()) {
    return;
  }
  if (it->is_null()) {
    target.reset();
  } else {
    target = it->get<std::string>();
  }
}

void AssignOptionalSnowflake(const nlohmann::json& partial, const char* key, std::optional<Snowflake>& target) {
  auto it = partial.find(key);
  if (it == partial.end()) {
    return;
  }
  if (it->is_null()) {
    target.reset();
  } else {
    target = ParseSnowflake(*it);
  }
}

void AssignSnowflake(const nlohmann::json& partial, const char* key, Snowflake& target) {
  auto it = partial.find(key);
  if (it != partial.end() && !it->is_null()) {
    target = ParseSnowflake(*it);
  }
}

std::vector<Snowflake> ParseSnowflakeList(const nlohmann::json& list) {
  std::vector<Snowflake> ids;
  if (!list.is_array()) {
    return ids;
  }
  ids.reserve(list.size());
  for (const auto& item : list) {
    ids.push_back(ParseSnowflake(item));
  }
  return ids;
}

nlohmann::json OptionalToJson(const std::optional<Snowflake>& id) {
  return id ? nlohmann::json(id->ToString()) : nlohmann::json(nullptr);
}

nlohmann::json OptionalToJson(const std::optional<std::string>& text) {
  return text ? nlohmann::json(*text) : nlohmann::json(nullptr);
}

nlohmann::json IdsToJson(const std::vector<Snowflake>& ids) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& id : ids) {
    arr.push_back(id.ToString());
  }
  return arr;
}

nlohmann::json IdsToJson(const std::set<Snowflake>& ids) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& id : ids) {
    arr.push_back(id.ToString());
  }
  return arr;
}

std::time_t TimegmPortable(std::tm* tm) {
#if defined(_WIN32)
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}
}  // namespace

std::string_view ToString(EntityKind kind) {
  switch (kind) {
    case EntityKind::kGuild:
      return "guild";
    case EntityKind::kChannel:
      return "channel";
    case EntityKind::kThread:
      return "thread";
    case EntityKind::kMember:
      return "member";
    case EntityKind::kRole:
      return "role";
    case EntityKind::kUser:
      return "user";
  }
  return "unknown";
}

std::optional<std::chrono::system_clock::time_point> ParseIsoTimestamp(std::string_view text) {
  if (text.size() < 19) {
    return std::nullopt;
  }
  std::tm tm{};
  std::istringstream iss(std::string(text.substr(0, 19)));
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }
  auto tp = std::chrono::system_clock::from_time_t(TimegmPortable(&tm));

  std::size_t pos = 19;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    long micros = 0;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    while (digits < 6) {
      micros *= 10;
      ++digits;
    }
    tp += std::chrono::microseconds(micros);
  }
  if (text.size() >= pos + 6 && (text[pos] == '+' || text[pos] == '-')) {
    int sign = text[pos] == '+' ? 1 : -1;
    int hours = (text[pos + 1] - '0') * 10 + (text[pos + 2] - '0');
    int minutes = (text[pos + 4] - '0') * 10 + (text[pos + 5] - '0');
    tp -= sign * (std::chrono::hours(hours) + std::chrono::minutes(minutes));
  }
  return tp;
}

std::chrono::system_clock::time_point Thread::CreatedAt() const {
  if (creation_timestamp) {
    if (auto parsed = ParseIsoTimestamp(*creation_timestamp)) {
      return *parsed;
    }
  }
  return SnowflakeTime(id);
}

void MergeJson(User& user, const nlohmann::json& partial) {
  AssignIfPresent(partial, "username", user.username);
  AssignIfPresent(partial, "discriminator", user.discriminator);
  AssignIfPresent(partial, "bot", user.bot);
}

void MergeJson(Role& role, const nlohmann::json& partial) {
  AssignSnowflake(partial, "guild_id", role.guild_id);
  AssignIfPresent(partial, "name", role.name);
  AssignIfPresent(partial, "color", role.color);
  AssignIfPresent(partial, "position", role.position);
  AssignIfPresent(partial, "permissions", role.permissions);
  AssignIfPresent(partial, "hoist", role.hoist);
  AssignIfPresent(partial, "mentionable", role.mentionable);
}

void MergeJson(Member& member, const nlohmann::json& partial) {
  AssignOptionalString(partial, "nick", member.nick);
  AssignOptionalString(partial, "joined_at", member.joined_at);
  auto roles_it = partial.find("roles");
  if (roles_it != partial.end() && roles_it->is_array()) {
    member.roles = ParseSnowflakeList(*roles_it);
  }
}

void MergeJson(Channel& channel, const nlohmann::json& partial) {
  AssignOptionalSnowflake(partial, "guild_id", channel.guild_id);
  auto type_it = partial.find("type");
  if (type_it != partial.end() && type_it->is_number_integer()) {
    channel.type = ChannelType::FromValue(type_it->get<int>());
  }
  AssignIfPresent(partial, "name", channel.name);
  AssignIfPresent(partial, "position", channel.position);
  AssignOptionalSnowflake(partial, "parent_id", channel.parent_id);
  AssignOptionalString(partial, "topic", channel.topic);
  AssignIfPresent(partial, "nsfw", channel.nsfw);
  AssignIfPresent(partial, "rate_limit_per_user", channel.rate_limit_per_user);
  AssignOptionalSnowflake(partial, "last_message_id", channel.last_message_id);
}

void MergeJson(Thread& thread, const nlohmann::json& partial) {
  AssignSnowflake(partial, "guild_id", thread.guild_id);
  AssignSnowflake(partial, "parent_id", thread.parent_id);
  AssignSnowflake(partial, "owner_id", thread.owner_id);
  AssignIfPresent(partial, "name", thread.name);
  auto type_it = partial.find("type");
  if (type_it != partial.end() && type_it->is_number_integer()) {
    thread.type = ChannelType::FromValue(type_it->get<int>());
  }
  AssignOptionalSnowflake(partial, "last_message_id", thread.last_message_id);
  AssignIfPresent(partial, "rate_limit_per_user", thread.slowmode_delay);
  AssignIfPresent(partial, "message_count", thread.message_count);
  AssignIfPresent(partial, "member_count", thread.member_count);
  auto preview_it = partial.find("member_ids_preview");
  if (preview_it != partial.end() && preview_it->is_array()) {
    thread.member_ids_preview = ParseSnowflakeList(*preview_it);
  }

  auto meta_it = partial.find("thread_metadata");
  if (meta_it != partial.end() && meta_it->is_object()) {
    const auto& meta = *meta_it;
    AssignIfPresent(meta, "archived", thread.archived);
    AssignIfPresent(meta, "auto_archive_duration", thread.auto_archive_duration);
    AssignOptionalString(meta, "archive_timestamp", thread.archive_timestamp);
    AssignOptionalString(meta, "create_timestamp", thread.creation_timestamp);
    AssignIfPresent(meta, "locked", thread.locked);
    AssignIfPresent(meta, "invitable", thread.invitable);
  }

  // 스레드 페이로드의 member 필드는 항상 로컬 사용자 자신의 멤버십이다.
  auto self_it = partial.find("member");
  if (self_it != partial.end() && self_it->is_object()) {
    Snowflake self_user = thread.self_member ? thread.self_member->user_id : Snowflake{};
    thread.self_member = ThreadMemberFromJson(*self_it, thread.id, self_user);
  }
}

void MergeJson(Guild& guild, const nlohmann::json& partial) {
  AssignIfPresent(partial, "name", guild.name);
  AssignSnowflake(partial, "owner_id", guild.owner_id);
  AssignIfPresent(partial, "member_count", guild.member_count);
  AssignIfPresent(partial, "large", guild.large);
  AssignIfPresent(partial, "unavailable", guild.unavailable);
}

bool ObservablyEqual(const User& a, const User& b) { return a == b; }

bool ObservablyEqual(const Role& a, const Role& b) { return a == b; }

bool ObservablyEqual(const Member& a, const Member& b) { return a == b; }

bool ObservablyEqual(const Channel& a, const Channel& b) { return a == b; }

bool ObservablyEqual(const Thread& a, const Thread& b) {
  return a.id == b.id && a.guild_id == b.guild_id && a.parent_id == b.parent_id && a.owner_id == b.owner_id &&
         a.name == b.name && a.type == b.type && a.last_message_id == b.last_message_id &&
         a.slowmode_delay == b.slowmode_delay && a.archived == b.archived && a.locked == b.locked &&
         a.invitable == b.invitable && a.auto_archive_duration == b.auto_archive_duration &&
         a.archive_timestamp == b.archive_timestamp && a.creation_timestamp == b.creation_timestamp;
}

bool ObservablyEqual(const Guild& a, const Guild& b) {
  return a.id == b.id && a.name == b.name && a.owner_id == b.owner_id && a.member_count == b.member_count &&
         a.large == b.large && a.unavailable == b.unavailable;
}

nlohmann::json ToJson(const User& user) {
  return {{"id", user.id.ToString()},
          {"username", user.username},
          {"discriminator", user.discriminator},
          {"bot", user.bot}};
}

nlohmann::json ToJson(const Role& role) {
  return {{"id", role.id.ToString()},
          {"guild_id", role.guild_id.ToString()},
          {"name", role.name},
          {"color", role.color},
          {"position", role.position},
          {"permissions", role.permissions},
          {"hoist", role.hoist},
          {"mentionable", role.mentionable}};
}

nlohmann::json ToJson(const Member& member) {
  return {{"guild_id", member.guild_id.ToString()},
          {"user_id", member.user_id.ToString()},
          {"nick", OptionalToJson(member.nick)},
          {"roles", IdsToJson(member.roles)},
          {"joined_at", OptionalToJson(member.joined_at)}};
}

nlohmann::json ToJson(const Channel& channel) {
  return {{"id", channel.id.ToString()},
          {"guild_id", OptionalToJson(channel.guild_id)},
          {"type", channel.type.raw},
          {"name", channel.name},
          {"position", channel.position},
          {"parent_id", OptionalToJson(channel.parent_id)},
          {"topic", OptionalToJson(channel.topic)},
          {"nsfw", channel.nsfw},
          {"rate_limit_per_user", channel.rate_limit_per_user},
          {"last_message_id", OptionalToJson(channel.last_message_id)}};
}

nlohmann::json ToJson(const ThreadMember& member) {
  return {{"user_id", member.user_id.ToString()},
          {"thread_id", member.thread_id.ToString()},
          {"joined_at", OptionalToJson(member.joined_at)},
          {"flags", member.flags}};
}

nlohmann::json ToJson(const Thread& thread) {
  nlohmann::json members = nlohmann::json::array();
  for (const auto& [user_id, member] : thread.members) {
    members.push_back(ToJson(member));
  }
  return {{"id", thread.id.ToString()},
          {"guild_id", thread.guild_id.ToString()},
          {"parent_id", thread.parent_id.ToString()},
          {"owner_id", thread.owner_id.ToString()},
          {"name", thread.name},
          {"type", thread.type.raw},
          {"last_message_id", OptionalToJson(thread.last_message_id)},
          {"rate_limit_per_user", thread.slowmode_delay},
          {"message_count", thread.message_count},
          {"member_count", thread.member_count},
          {"member_ids_preview", IdsToJson(thread.member_ids_preview)},
          {"thread_metadata",
           {{"archived", thread.archived},
            {"locked", thread.locked},
            {"invitable", thread.invitable},
            {"auto_archive_duration", thread.auto_archive_duration},
            {"archive_timestamp", OptionalToJson(thread.archive_timestamp)},
            {"create_timestamp", OptionalToJson(thread.creation_timestamp)}}},
          {"members", members},
          {"member", thread.self_member ? ToJson(*thread.self_member) : nlohmann::json(nullptr)}};
}

nlohmann::json ToJson(const Guild& guild) {
  return {{"id", guild.id.ToString()},
          {"name", guild.name},
          {"owner_id", guild.owner_id.ToString()},
          {"member_count", guild.member_count},
          {"large", guild.large},
          {"unavailable", guild.unavailable},
          {"channel_ids", IdsToJson(guild.channel_ids)},
          {"thread_ids", IdsToJson(guild.thread_ids)},
          {"role_ids", IdsToJson(guild.role_ids)},
          {"member_count_cached", guild.member_ids.size()}};
}

nlohmann::json ToJson(const Message& message) {
  return {{"id", message.id.ToString()},
          {"channel_id", message.channel_id.ToString()},
          {"author_id", message.author_id.ToString()},
          {"content", message.content},
          {"pinned", message.pinned}};
}

ThreadMember ThreadMemberFromJson(const nlohmann::json& data, Snowflake fallback_thread_id,
                                  Snowflake fallback_user_id) {
  ThreadMember member;
  auto user_id = ParseOptionalSnowflake(data, "user_id");
  member.user_id = user_id ? *user_id : fallback_user_id;
  auto thread_id = ParseOptionalSnowflake(data, "id");
  member.thread_id = thread_id ? *thread_id : fallback_thread_id;
  AssignOptionalString(data, "join_timestamp", member.joined_at);
  AssignIfPresent(data, "flags", member.flags);
  return member;
}

Message MessageFromJson(const nlohmann::json& data) {
  Message message;
  message.id = ParseSnowflake(data.at("id"));
  AssignSnowflake(data, "channel_id", message.channel_id);
  auto author_it = data.find("author");
  if (author_it != data.end() && author_it->is_object()) {
    AssignSnowflake(*author_it, "id", message.author_id);
  }
  AssignIfPresent(data, "content", message.content);
  AssignIfPresent(data, "pinned", message.pinned);
  return message;
}

}  // namespace cord
