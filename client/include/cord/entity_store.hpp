/*
 * 설명: 식별자 기반 엔티티 캐시. 엔티티 단위 원자적 스냅샷 교체와 부분 병합 diff를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/entity_store_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "cord/entities.hpp"

namespace cord {

template <typename T>
struct Diff {
  std::shared_ptr<const T> before;
  std::shared_ptr<const T> after;
  bool created{false};
  bool changed{false};

  bool Empty() const { return !changed; }
  // 새로 생성되었거나 관측 가능한 변경이 없으면 nullptr.
  std::shared_ptr<const T> OldSnapshot() const { return (created || !changed) ? nullptr : before; }
};

struct JsonDiff {
  std::optional<nlohmann::json> before;
  std::optional<nlohmann::json> after;
  bool created{false};
  bool changed{false};

  bool Empty() const { return !changed; }
};

template <typename T>
JsonDiff ToJsonDiff(const Diff<T>& diff) {
  JsonDiff out;
  out.created = diff.created;
  out.changed = diff.changed;
  if (diff.changed && !diff.created && diff.before) {
    out.before = ToJson(*diff.before);
  }
  if (diff.after) {
    out.after = ToJson(*diff.after);
  }
  return out;
}

// 같은 키에 대한 쓰기는 스트라이프 락으로 직렬화하고, 맵 자체는 포인터 교체 동안만 잠근다.
// 읽기는 교체 전 또는 교체 후의 불변 스냅샷 중 하나만 본다.
template <typename T>
class EntityTable {
 public:
  using Key = typename T::Key;
  using Ptr = std::shared_ptr<const T>;

  Diff<T> Upsert(const Key& key, const nlohmann::json& partial) {
    return Update(key, [&partial](T& entity) { MergeJson(entity, partial); });
  }

  // mutate 안에서 같은 테이블을 다시 호출하면 안 된다.
  template <typename Mutator>
  Diff<T> Update(const Key& key, Mutator&& mutate, bool create_if_missing = true) {
    std::lock_guard<std::mutex> writer(StripeFor(key));
    Ptr current = Get(key);
    Diff<T> diff;
    diff.before = current;
    if (!current && !create_if_missing) {
      return diff;
    }

    auto next = current ? std::make_shared<T>(*current) : std::make_shared<T>();
    if (!current) {
      next->AssignKey(key);
    }
    mutate(*next);

    if (current && *current == *next) {
      diff.after = current;
      return diff;
    }

    diff.created = !current;
    diff.changed = !current || !ObservablyEqual(*current, *next);
    Ptr published = std::move(next);
    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      items_[key] = published;
    }
    diff.after = published;
    return diff;
  }

  Ptr Get(const Key& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
      return nullptr;
    }
    return it->second;
  }

  Ptr Remove(const Key& key) {
    std::lock_guard<std::mutex> writer(StripeFor(key));
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
      return nullptr;
    }
    Ptr removed = std::move(it->second);
    items_.erase(it);
    return removed;
  }

  std::vector<Ptr> All() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Ptr> out;
    out.reserve(items_.size());
    for (const auto& [key, value] : items_) {
      out.push_back(value);
    }
    return out;
  }

  template <typename Predicate>
  std::vector<Ptr> Filter(Predicate&& pred) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Ptr> out;
    for (const auto& [key, value] : items_) {
      if (pred(*value)) {
        out.push_back(value);
      }
    }
    return out;
  }

  std::size_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return items_.size();
  }

  void Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    items_.clear();
  }

 private:
  static constexpr std::size_t kStripeCount = 32;

  std::mutex& StripeFor(const Key& key) { return stripes_[std::hash<Key>{}(key) % kStripeCount]; }

  mutable std::shared_mutex mutex_;
  std::unordered_map<Key, Ptr> items_;
  std::array<std::mutex, kStripeCount> stripes_;
};

class EntityStore {
 public:
  EntityTable<Guild>& Guilds() { return guilds_; }
  EntityTable<Channel>& Channels() { return channels_; }
  EntityTable<Thread>& Threads() { return threads_; }
  EntityTable<Member>& Members() { return members_; }
  EntityTable<Role>& Roles() { return roles_; }
  EntityTable<User>& Users() { return users_; }
  const EntityTable<Guild>& Guilds() const { return guilds_; }
  const EntityTable<Channel>& Channels() const { return channels_; }
  const EntityTable<Thread>& Threads() const { return threads_; }
  const EntityTable<Member>& Members() const { return members_; }
  const EntityTable<Role>& Roles() const { return roles_; }
  const EntityTable<User>& Users() const { return users_; }

  // 멤버는 payload의 guild_id(또는 guild_id 인자)로 키를 만든다.
  JsonDiff Upsert(EntityKind kind, Snowflake id, const nlohmann::json& partial);
  std::optional<nlohmann::json> Get(EntityKind kind, Snowflake id,
                                    std::optional<Snowflake> guild_id = std::nullopt) const;
  std::optional<nlohmann::json> Remove(EntityKind kind, Snowflake id, std::optional<Snowflake> guild_id = std::nullopt);

  Diff<Guild> UpsertGuild(Snowflake id, const nlohmann::json& partial);
  Diff<Channel> UpsertChannel(Snowflake id, const nlohmann::json& partial);
  Diff<Thread> UpsertThread(Snowflake id, const nlohmann::json& partial);
  Diff<Role> UpsertRole(Snowflake guild_id, Snowflake id, const nlohmann::json& partial);
  Diff<Member> UpsertMember(Snowflake guild_id, Snowflake user_id, const nlohmann::json& partial);
  Diff<User> UpsertUser(Snowflake id, const nlohmann::json& partial);

  // 길드 삭제는 하위 채널/스레드/역할/멤버까지 제거한다.
  std::shared_ptr<const Guild> RemoveGuild(Snowflake id);
  std::shared_ptr<const Channel> RemoveChannel(Snowflake id);
  std::shared_ptr<const Thread> RemoveThread(Snowflake id);
  std::shared_ptr<const Role> RemoveRole(Snowflake guild_id, Snowflake id);
  std::shared_ptr<const Member> RemoveMember(Snowflake guild_id, Snowflake user_id);

  // 로컬 사용자 자신은 일반 추가 경로로 저장하지 않는다(self 슬롯 전용).
  Diff<Thread> AddThreadMember(Snowflake thread_id, const ThreadMember& member);
  Diff<Thread> RemoveThreadMember(Snowflake thread_id, Snowflake user_id);
  Diff<Thread> SetSelfThreadMember(Snowflake thread_id, std::optional<ThreadMember> member);

  std::vector<ThreadMember> ThreadMembers(Snowflake thread_id) const;

  void SetSelfId(Snowflake id) { self_id_.store(id.value); }
  Snowflake SelfId() const { return Snowflake{self_id_.load()}; }

  // 전체 재동기화 경계. self id는 유지한다.
  void Clear();

 private:
  void LinkToGuild(EntityKind kind, Snowflake guild_id, Snowflake id);
  void UnlinkFromGuild(EntityKind kind, Snowflake guild_id, Snowflake id);

  EntityTable<Guild> guilds_;
  EntityTable<Channel> channels_;
  EntityTable<Thread> threads_;
  EntityTable<Member> members_;
  EntityTable<Role> roles_;
  EntityTable<User> users_;
  std::atomic<std::uint64_t> self_id_{0};
};

}  // namespace cord
