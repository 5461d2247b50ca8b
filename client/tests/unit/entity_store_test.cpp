#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <vector>

#include "cord/entity_store.hpp"

namespace {

nlohmann::json ThreadPayload(const std::string& id, const std::string& parent) {
  return {{"id", id},
          {"guild_id", "100"},
          {"parent_id", parent},
          {"owner_id", "10"},
          {"type", 11},
          {"name", "thread-" + id},
          {"message_count", 3},
          {"member_count", 2},
          {"thread_metadata", {{"archived", false}, {"auto_archive_duration", 60}, {"locked", false}}}};
}

TEST(EntityStoreTest, PartialUpdateKeepsAbsentFields) {
  cord::EntityStore store;
  store.UpsertChannel(200, {{"guild_id", "100"}, {"type", 0}, {"name", "general"}, {"topic", "hello"}});
  auto diff = store.UpsertChannel(200, {{"name", "renamed"}});

  ASSERT_TRUE(diff.changed);
  EXPECT_FALSE(diff.created);
  EXPECT_EQ(diff.before->name, "general");
  EXPECT_EQ(diff.after->name, "renamed");
  ASSERT_TRUE(diff.after->topic.has_value());
  EXPECT_EQ(*diff.after->topic, "hello");
  EXPECT_EQ(diff.after->guild_id, cord::Snowflake{100});
}

TEST(EntityStoreTest, ExplicitNullClearsOptionalField) {
  cord::EntityStore store;
  store.UpsertChannel(200, {{"type", 0}, {"topic", "hello"}});
  auto diff = store.UpsertChannel(200, {{"topic", nullptr}});
  EXPECT_TRUE(diff.changed);
  EXPECT_FALSE(diff.after->topic.has_value());
}

TEST(EntityStoreTest, IdenticalUpsertIsNotAChange) {
  cord::EntityStore store;
  auto first = store.UpsertChannel(200, {{"type", 0}, {"name", "general"}});
  EXPECT_TRUE(first.created);
  EXPECT_TRUE(first.changed);
  EXPECT_EQ(first.OldSnapshot(), nullptr);

  auto second = store.UpsertChannel(200, {{"type", 0}, {"name", "general"}});
  EXPECT_FALSE(second.changed);
  EXPECT_TRUE(second.Empty());
  EXPECT_EQ(second.after.get(), first.after.get());
  EXPECT_EQ(store.Channels().Get(200).get(), first.after.get());
}

TEST(EntityStoreTest, ThreadCountersAreNotObservable) {
  cord::EntityStore store;
  store.UpsertThread(300, ThreadPayload("300", "200"));
  auto diff = store.UpsertThread(300, {{"message_count", 9}, {"member_count", 5}, {"member_ids_preview", {"1", "2"}}});

  EXPECT_FALSE(diff.changed);
  EXPECT_EQ(diff.after->message_count, 9);
  EXPECT_EQ(diff.after->member_count, 5);

  auto renamed = store.UpsertThread(300, {{"name", "renamed"}});
  EXPECT_TRUE(renamed.changed);
  ASSERT_NE(renamed.OldSnapshot(), nullptr);
  EXPECT_EQ(renamed.OldSnapshot()->name, "thread-300");
}

TEST(EntityStoreTest, SnapshotsAreImmutableAfterReplacement) {
  cord::EntityStore store;
  store.UpsertGuild(100, {{"name", "before"}});
  auto held = store.Guilds().Get(100);
  store.UpsertGuild(100, {{"name", "after"}});
  EXPECT_EQ(held->name, "before");
  EXPECT_EQ(store.Guilds().Get(100)->name, "after");
}

TEST(EntityStoreTest, RemoveIsIdempotent) {
  cord::EntityStore store;
  store.UpsertGuild(100, {{"name", "g"}});
  store.UpsertChannel(200, {{"guild_id", "100"}, {"type", 0}});
  EXPECT_NE(store.RemoveChannel(200), nullptr);
  EXPECT_EQ(store.RemoveChannel(200), nullptr);
  EXPECT_EQ(store.Guilds().Get(100)->channel_ids.count(200), 0u);
  EXPECT_FALSE(store.Remove(cord::EntityKind::kChannel, 200).has_value());
}

TEST(EntityStoreTest, GenericMemberUpsertRequiresGuildId) {
  cord::EntityStore store;
  EXPECT_THROW(store.Upsert(cord::EntityKind::kMember, 10, {{"nick", "n"}}), std::invalid_argument);

  auto diff = store.Upsert(cord::EntityKind::kMember, 10, {{"guild_id", "100"}, {"nick", "n"}});
  EXPECT_TRUE(diff.created);
  auto fetched = store.Get(cord::EntityKind::kMember, 10, cord::Snowflake{100});
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ((*fetched)["nick"], "n");
}

TEST(EntityStoreTest, GuildRemovalCascades) {
  cord::EntityStore store;
  store.UpsertGuild(100, {{"name", "g"}});
  store.UpsertChannel(200, {{"guild_id", "100"}, {"type", 0}});
  store.UpsertThread(300, ThreadPayload("300", "200"));
  store.UpsertRole(100, 400, {{"name", "mod"}});
  store.UpsertMember(100, 10, {{"user", {{"id", "10"}, {"username", "me"}}}});

  auto guild = store.Guilds().Get(100);
  EXPECT_EQ(guild->channel_ids.count(200), 1u);
  EXPECT_EQ(guild->thread_ids.count(300), 1u);
  EXPECT_EQ(guild->role_ids.count(400), 1u);
  EXPECT_EQ(guild->member_ids.count(10), 1u);

  ASSERT_NE(store.RemoveGuild(100), nullptr);
  EXPECT_EQ(store.Channels().Get(200), nullptr);
  EXPECT_EQ(store.Threads().Get(300), nullptr);
  EXPECT_EQ(store.Roles().Get(400), nullptr);
  EXPECT_EQ(store.Members().Get(cord::MemberKey{100, 10}), nullptr);
  // 사용자는 길드에 속하지 않는다.
  EXPECT_NE(store.Users().Get(10), nullptr);
}

TEST(EntityStoreTest, ChannelRemovalDropsChildThreads) {
  cord::EntityStore store;
  store.UpsertGuild(100, {{"name", "g"}});
  store.UpsertChannel(200, {{"guild_id", "100"}, {"type", 0}});
  store.UpsertThread(300, ThreadPayload("300", "200"));
  store.UpsertThread(301, ThreadPayload("301", "201"));

  store.RemoveChannel(200);
  EXPECT_EQ(store.Threads().Get(300), nullptr);
  EXPECT_NE(store.Threads().Get(301), nullptr);
  EXPECT_EQ(store.Guilds().Get(100)->thread_ids.count(300), 0u);
}

TEST(EntityStoreTest, SelfIsNotAddedThroughMemberPath) {
  cord::EntityStore store;
  store.SetSelfId(10);
  store.UpsertThread(300, ThreadPayload("300", "200"));

  auto diff = store.AddThreadMember(300, cord::ThreadMember{10, 300});
  EXPECT_FALSE(diff.changed);
  EXPECT_TRUE(store.Threads().Get(300)->members.empty());

  store.SetSelfThreadMember(300, cord::ThreadMember{10, 300});
  store.AddThreadMember(300, cord::ThreadMember{11, 300});
  auto members = store.ThreadMembers(300);
  ASSERT_EQ(members.size(), 2u);
  EXPECT_EQ(store.Threads().Get(300)->self_member->user_id, cord::Snowflake{10});

  store.RemoveThreadMember(300, 10);
  EXPECT_FALSE(store.Threads().Get(300)->self_member.has_value());
  EXPECT_EQ(store.ThreadMembers(300).size(), 1u);
}

TEST(EntityStoreTest, EmbeddedSelfMemberGetsLocalUserId) {
  cord::EntityStore store;
  store.SetSelfId(10);
  auto payload = ThreadPayload("300", "200");
  payload["member"] = {{"join_timestamp", "2021-06-01T00:00:00+00:00"}, {"flags", 1}};
  store.UpsertThread(300, payload);

  auto thread = store.Threads().Get(300);
  ASSERT_TRUE(thread->self_member.has_value());
  EXPECT_EQ(thread->self_member->user_id, cord::Snowflake{10});
  EXPECT_EQ(thread->self_member->thread_id, cord::Snowflake{300});
  EXPECT_EQ(thread->self_member->flags, 1);
  EXPECT_TRUE(thread->members.empty());
}

TEST(EntityStoreTest, ThreadMemberChangesOnMissingThreadAreNoOps) {
  cord::EntityStore store;
  auto diff = store.AddThreadMember(999, cord::ThreadMember{11, 999});
  EXPECT_EQ(diff.after, nullptr);
  EXPECT_EQ(store.Threads().Get(999), nullptr);
  EXPECT_TRUE(store.ThreadMembers(999).empty());
}

TEST(EntityStoreTest, ConcurrentMemberAddsAreAllKept) {
  cord::EntityStore store;
  store.UpsertThread(300, ThreadPayload("300", "200"));

  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&store, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        auto user = static_cast<std::uint64_t>(1000 + t * kPerThread + i);
        store.AddThreadMember(300, cord::ThreadMember{user, 300});
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  EXPECT_EQ(store.Threads().Get(300)->members.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(EntityStoreTest, ClearKeepsSelfId) {
  cord::EntityStore store;
  store.SetSelfId(10);
  store.UpsertGuild(100, {{"name", "g"}});
  store.Clear();
  EXPECT_EQ(store.Guilds().Size(), 0u);
  EXPECT_EQ(store.SelfId(), cord::Snowflake{10});
}

TEST(EntityStoreTest, UnknownChannelTypeIsPreserved) {
  cord::EntityStore store;
  auto diff = store.UpsertChannel(200, {{"type", 99}});
  EXPECT_TRUE(diff.after->type.IsUnknown());
  EXPECT_EQ(diff.after->type.raw, 99);
  EXPECT_EQ(cord::ToJson(*diff.after)["type"], 99);
}

}  // namespace
