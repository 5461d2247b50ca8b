/*
 * 설명: 캐시 엔티티(길드/채널/스레드/멤버/역할/사용자)와 부분 페이로드 병합 규칙을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/entity_store_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "cord/channel_type.hpp"
#include "cord/snowflake.hpp"

namespace cord {

enum class EntityKind { kGuild, kChannel, kThread, kMember, kRole, kUser };

std::string_view ToString(EntityKind kind);

struct MemberKey {
  Snowflake guild_id;
  Snowflake user_id;

  bool operator==(const MemberKey&) const = default;
};

struct User {
  using Key = Snowflake;

  Snowflake id;
  std::string username;
  std::string discriminator;
  bool bot{false};

  Key GetKey() const { return id; }
  void AssignKey(Key key) { id = key; }
  bool operator==(const User&) const = default;
};

struct Role {
  using Key = Snowflake;

  Snowflake id;
  Snowflake guild_id;
  std::string name;
  int color{0};
  int position{0};
  std::string permissions{"0"};
  bool hoist{false};
  bool mentionable{false};

  Key GetKey() const { return id; }
  void AssignKey(Key key) { id = key; }
  bool operator==(const Role&) const = default;
};

struct Member {
  using Key = MemberKey;

  Snowflake guild_id;
  Snowflake user_id;
  std::optional<std::string> nick;
  std::vector<Snowflake> roles;
  std::optional<std::string> joined_at;

  Key GetKey() const { return MemberKey{guild_id, user_id}; }
  void AssignKey(const Key& key) {
    guild_id = key.guild_id;
    user_id = key.user_id;
  }
  bool operator==(const Member&) const = default;
};

struct Channel {
  using Key = Snowflake;

  Snowflake id;
  std::optional<Snowflake> guild_id;
  ChannelType type;
  std::string name;
  int position{0};
  std::optional<Snowflake> parent_id;
  std::optional<std::string> topic;
  bool nsfw{false};
  int rate_limit_per_user{0};
  std::optional<Snowflake> last_message_id;

  Key GetKey() const { return id; }
  void AssignKey(Key key) { id = key; }
  bool operator==(const Channel&) const = default;
};

struct ThreadMember {
  Snowflake user_id;
  Snowflake thread_id;
  std::optional<std::string> joined_at;
  int flags{0};

  bool operator==(const ThreadMember&) const = default;
};

struct Thread {
  using Key = Snowflake;

  Snowflake id;
  Snowflake guild_id;
  Snowflake parent_id;
  Snowflake owner_id;
  std::string name;
  ChannelType type{ChannelType::FromValue(11)};
  std::optional<Snowflake> last_message_id;
  int slowmode_delay{0};
  // 서버가 50에서 자르는 근사치이므로 변경 감지 대상이 아니다.
  int message_count{0};
  int member_count{0};
  std::vector<Snowflake> member_ids_preview;
  bool archived{false};
  bool locked{false};
  bool invitable{true};
  int auto_archive_duration{1440};
  std::optional<std::string> archive_timestamp;
  std::optional<std::string> creation_timestamp;
  std::map<Snowflake, ThreadMember> members;
  std::optional<ThreadMember> self_member;

  Key GetKey() const { return id; }
  void AssignKey(Key key) { id = key; }
  std::chrono::system_clock::time_point CreatedAt() const;
  std::string Mention() const { return "<#" + id.ToString() + ">"; }
  bool IsPrivate() const { return type.kind == ChannelKind::kPrivateThread; }
  bool IsNews() const { return type.kind == ChannelKind::kNewsThread; }
  bool operator==(const Thread&) const = default;
};

struct Guild {
  using Key = Snowflake;

  Snowflake id;
  std::string name;
  Snowflake owner_id;
  int member_count{0};
  bool large{false};
  bool unavailable{false};
  std::set<Snowflake> channel_ids;
  std::set<Snowflake> thread_ids;
  std::set<Snowflake> role_ids;
  std::set<Snowflake> member_ids;

  Key GetKey() const { return id; }
  void AssignKey(Key key) { id = key; }
  bool operator==(const Guild&) const = default;
};

struct Message {
  Snowflake id;
  Snowflake channel_id;
  Snowflake author_id;
  std::string content;
  bool pinned{false};
};

// 페이로드에 존재하는 필드만 덮어쓴다.
void MergeJson(User& user, const nlohmann::json& partial);
void MergeJson(Role& role, const nlohmann::json& partial);
void MergeJson(Member& member, const nlohmann::json& partial);
void MergeJson(Channel& channel, const nlohmann::json& partial);
void MergeJson(Thread& thread, const nlohmann::json& partial);
void MergeJson(Guild& guild, const nlohmann::json& partial);

bool ObservablyEqual(const User& a, const User& b);
bool ObservablyEqual(const Role& a, const Role& b);
bool ObservablyEqual(const Member& a, const Member& b);
bool ObservablyEqual(const Channel& a, const Channel& b);
bool ObservablyEqual(const Thread& a, const Thread& b);
bool ObservablyEqual(const Guild& a, const Guild& b);

nlohmann::json ToJson(const User& user);
nlohmann::json ToJson(const Role& role);
nlohmann::json ToJson(const Member& member);
nlohmann::json ToJson(const Channel& channel);
nlohmann::json ToJson(const ThreadMember& member);
nlohmann::json ToJson(const Thread& thread);
nlohmann::json ToJson(const Guild& guild);
nlohmann::json ToJson(const Message& message);

ThreadMember ThreadMemberFromJson(const nlohmann::json& data, Snowflake fallback_thread_id, Snowflake fallback_user_id);
Message MessageFromJson(const nlohmann::json& data);

std::optional<std::chrono::system_clock::time_point> ParseIsoTimestamp(std::string_view text);

}  // namespace cord

template <>
struct std::hash<cord::MemberKey> {
  std::size_t operator()(const cord::MemberKey& key) const noexcept {
    auto h1 = std::hash<std::uint64_t>{}(key.guild_id.value);
    auto h2 = std::hash<std::uint64_t>{}(key.user_id.value);
    return h1 ^ (h2 + 0x9E3779B97F4A7C15ULL + (h1 << 6) + (h1 >> 2));
  }
};
