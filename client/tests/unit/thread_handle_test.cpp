#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <vector>

#include "cord/client.hpp"
#include "cord/errors.hpp"
#include "cord/thread_handle.hpp"
#include "test_fakes.hpp"

namespace {

using namespace std::chrono_literals;
using cord::testing::FakeGatewayTransport;
using cord::testing::FakeHttpTransport;
using cord::testing::JsonResponse;

class ThreadHandleTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config.token = "token";
    observability = std::make_shared<cord::Observability>(cord::LogLevel::kError);
    store = std::make_shared<cord::EntityStore>();
    pending = std::make_shared<cord::PendingRequests>();
    transport = std::make_shared<FakeHttpTransport>();
    rest = std::make_shared<cord::RestClient>(transport, std::make_shared<cord::RateLimiter>(50, observability), config,
                                              observability);

    store->SetSelfId(10);
    store->UpsertGuild(100, {{"name", "guild"}});
    store->UpsertChannel(150, {{"guild_id", "100"}, {"type", 4}, {"name", "category"}});
    store->UpsertChannel(200, {{"guild_id", "100"}, {"type", 0}, {"name", "general"}, {"parent_id", "150"}, {"nsfw", true}});
    store->UpsertThread(300, {{"guild_id", "100"},
                              {"parent_id", "200"},
                              {"owner_id", "11"},
                              {"type", 11},
                              {"name", "talk"},
                              {"thread_metadata", {{"archived", false}, {"create_timestamp", "2021-06-01T00:00:00+00:00"}}},
                              {"member", {{"user_id", "10"}, {"flags", 1}}}});
    store->UpsertMember(100, 11, {{"user", {{"id", "11"}, {"username", "owner"}}}, {"nick", "boss"}});
  }

  cord::ThreadHandle Handle(cord::Snowflake id, cord::ThreadHandle::LazyRequest lazy = nullptr,
                            std::chrono::milliseconds timeout = 1000ms) {
    if (!lazy) {
      lazy = [](cord::Snowflake, std::vector<cord::Snowflake>) {};
    }
    return cord::ThreadHandle(id, store, rest, pending, std::move(lazy), timeout);
  }

  cord::ClientConfig config;
  std::shared_ptr<cord::Observability> observability;
  std::shared_ptr<cord::EntityStore> store;
  std::shared_ptr<cord::PendingRequests> pending;
  std::shared_ptr<FakeHttpTransport> transport;
  std::shared_ptr<cord::RestClient> rest;
};

TEST_F(ThreadHandleTest, FetchMembersMergesListResponse) {
  nlohmann::json response = {
      {"thread_id", "300"},
      {"guild_id", "100"},
      {"members",
       {{{"user_id", "11"}, {"member", {{"user", {{"id", "11"}, {"username", "owner"}}}, {"nick", "chief"}}}},
        {{"user_id", "10"}, {"flags", 3}},
        {{"member", {{"user", {{"id", "12"}, {"username", "guest"}}}}}}}}};

  std::vector<cord::Snowflake> requested;
  auto handle = Handle(300, [&](cord::Snowflake guild_id, std::vector<cord::Snowflake> thread_ids) {
    EXPECT_EQ(guild_id, cord::Snowflake{100});
    requested = thread_ids;
    pending->Resolve("THREAD_MEMBER_LIST_UPDATE", response);
  });

  auto members = handle.FetchMembers();
  ASSERT_EQ(requested.size(), 1u);
  EXPECT_EQ(requested[0], cord::Snowflake{300});
  EXPECT_EQ(members.size(), 3u);

  auto thread = store->Threads().Get(300);
  EXPECT_EQ(thread->members.count(11), 1u);
  EXPECT_EQ(thread->members.count(12), 1u);
  EXPECT_EQ(thread->members.count(10), 0u);
  EXPECT_EQ(handle.Me()->flags, 3);
  EXPECT_EQ(*store->Members().Get(cord::MemberKey{100, 11})->nick, "chief");
  EXPECT_NE(store->Members().Get(cord::MemberKey{100, 12}), nullptr);
  EXPECT_EQ(pending->Size(), 0u);
}

TEST_F(ThreadHandleTest, FetchMembersTimesOut) {
  auto handle = Handle(300, nullptr, 50ms);
  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(handle.FetchMembers(), cord::ProtocolTimeout);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
  EXPECT_EQ(pending->Size(), 0u);
  EXPECT_TRUE(store->Threads().Get(300)->members.empty());

  // 늦게 도착한 응답은 아무 대기자도 깨우지 않는다.
  EXPECT_EQ(pending->Resolve("THREAD_MEMBER_LIST_UPDATE", {{"thread_id", "300"}}), 0u);
}

TEST_F(ThreadHandleTest, ArchivedThreadRejectsEditWithoutUnarchive) {
  store->UpsertThread(300, {{"thread_metadata", {{"archived", true}}}});
  auto handle = Handle(300);

  cord::ThreadEdit edit;
  edit.name = "renamed";
  EXPECT_THROW(handle.Edit(edit), cord::ThreadArchived);
  EXPECT_TRUE(transport->Requests().empty());

  transport->Enqueue(JsonResponse(200, {{"id", "300"}, {"name", "renamed"}, {"thread_metadata", {{"archived", false}}}}));
  edit.archived = false;
  auto updated = handle.Edit(edit);
  ASSERT_NE(updated, nullptr);
  EXPECT_FALSE(updated->archived);
  EXPECT_EQ(updated->name, "renamed");

  auto requests = transport->Requests();
  ASSERT_EQ(requests.size(), 1u);
  auto body = nlohmann::json::parse(requests[0].body);
  EXPECT_EQ(body["archived"], false);
  EXPECT_EQ(body["name"], "renamed");
}

TEST_F(ThreadHandleTest, EditPayloadUsesWireFieldNames) {
  cord::ThreadEdit edit;
  edit.slowmode_delay = 30;
  edit.locked = true;
  edit.auto_archive_duration = 60;
  auto payload = edit.ToPayload();
  EXPECT_EQ(payload["rate_limit_per_user"], 30);
  EXPECT_EQ(payload["locked"], true);
  EXPECT_EQ(payload["auto_archive_duration"], 60);
  EXPECT_FALSE(payload.contains("slowmode_delay"));
  EXPECT_FALSE(payload.contains("name"));
  EXPECT_FALSE(edit.Unarchives());
}

TEST_F(ThreadHandleTest, PurgeDeletesMatchingMessagesOneByOne) {
  transport->SetHandler([](const cord::HttpRequest& request) {
    if (request.method == "GET") {
      return JsonResponse(200, nlohmann::json::array({{{"id", "503"}, {"author", {{"id", "11"}}}},
                                                      {{"id", "502"}, {"author", {{"id", "12"}}}},
                                                      {{"id", "501"}, {"author", {{"id", "11"}}}}}));
    }
    return JsonResponse(204, nullptr);
  });
  auto handle = Handle(300);

  cord::PurgeOptions options;
  options.check = [](const cord::Message& message) { return message.author_id == cord::Snowflake{11}; };
  auto removed = handle.Purge(options);

  ASSERT_EQ(removed.size(), 2u);
  EXPECT_EQ(removed[0].id, cord::Snowflake{503});
  EXPECT_EQ(removed[1].id, cord::Snowflake{501});

  std::vector<std::string> deletes;
  for (const auto& request : transport->Requests()) {
    if (request.method == "DELETE") {
      deletes.push_back(request.path);
    }
  }
  ASSERT_EQ(deletes.size(), 2u);
  EXPECT_EQ(deletes[0], "/api/v9/channels/300/messages/503");
  EXPECT_EQ(deletes[1], "/api/v9/channels/300/messages/501");
}

TEST_F(ThreadHandleTest, MembershipCallsUseThreadMemberRoutes) {
  auto handle = Handle(300);
  handle.Join();
  handle.AddUser(12);
  handle.RemoveUser(12);
  handle.Leave();
  handle.DeleteMessages({1, 2});

  auto requests = transport->Requests();
  ASSERT_EQ(requests.size(), 6u);
  EXPECT_EQ(requests[0].method, "PUT");
  EXPECT_EQ(requests[0].path, "/api/v9/channels/300/thread-members/@me");
  EXPECT_EQ(requests[1].path, "/api/v9/channels/300/thread-members/12");
  EXPECT_EQ(requests[2].method, "DELETE");
  EXPECT_EQ(requests[3].path, "/api/v9/channels/300/thread-members/@me");
  EXPECT_EQ(requests[4].path, "/api/v9/channels/300/messages/1");
  EXPECT_EQ(requests[5].path, "/api/v9/channels/300/messages/2");
}

TEST_F(ThreadHandleTest, LocalMemberChangesSkipSelf) {
  auto handle = Handle(300);
  handle.AddMember(cord::ThreadMember{12, 300});
  handle.AddMember(cord::ThreadMember{10, 300});
  EXPECT_EQ(store->Threads().Get(300)->members.size(), 1u);
  EXPECT_EQ(handle.Members().size(), 2u);
  handle.RemoveMember(12);
  EXPECT_EQ(handle.Members().size(), 1u);
}

TEST_F(ThreadHandleTest, DeleteRemovesFromCache) {
  auto handle = Handle(300);
  handle.Delete();
  EXPECT_EQ(store->Threads().Get(300), nullptr);
  EXPECT_EQ(store->Guilds().Get(100)->thread_ids.count(300), 0u);
  EXPECT_THROW(handle.Snapshot(), cord::ClientError);
}

TEST_F(ThreadHandleTest, ReadHelpersFollowCache) {
  auto handle = Handle(300);
  ASSERT_NE(handle.Parent(), nullptr);
  EXPECT_EQ(handle.Parent()->id, cord::Snowflake{200});
  EXPECT_TRUE(handle.IsNsfw());
  EXPECT_FALSE(handle.IsPrivate());
  EXPECT_FALSE(handle.IsNews());
  EXPECT_EQ(handle.CategoryId().value(), cord::Snowflake{150});
  EXPECT_EQ(handle.Mention(), "<#300>");
  ASSERT_NE(handle.Owner(), nullptr);
  EXPECT_EQ(*handle.Owner()->nick, "boss");
  EXPECT_EQ(std::chrono::system_clock::to_time_t(handle.CreatedAt()), 1622505600);
  EXPECT_EQ(handle.Me()->user_id, cord::Snowflake{10});
}

TEST_F(ThreadHandleTest, CreatedAtFallsBackToSnowflake) {
  store->UpsertThread(175928847299117063ULL, {{"guild_id", "100"}, {"parent_id", "200"}, {"type", 12}});
  auto handle = Handle(175928847299117063ULL);
  EXPECT_TRUE(handle.IsPrivate());
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(handle.CreatedAt().time_since_epoch());
  EXPECT_EQ(ms.count(), 1462015105796LL);
}

TEST_F(ThreadHandleTest, MissingParentMakesCategoryAnError) {
  store->UpsertThread(301, {{"guild_id", "100"}, {"parent_id", "999"}, {"type", 11}});
  auto handle = Handle(301);
  EXPECT_EQ(handle.Parent(), nullptr);
  EXPECT_FALSE(handle.IsNsfw());
  EXPECT_THROW(handle.CategoryId(), cord::ClientError);
}

TEST_F(ThreadHandleTest, HistoryPagesOldestFirst) {
  transport->SetHandler([](const cord::HttpRequest&) {
    return JsonResponse(200, nlohmann::json::array({{{"id", "103"}}, {{"id", "102"}}, {{"id", "101"}}}));
  });
  auto handle = Handle(300);

  cord::HistoryQuery query;
  query.limit = 3;
  query.after = cord::Snowflake{100};
  query.oldest_first = true;
  auto messages = handle.History(query);

  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(messages[0].id, cord::Snowflake{101});
  EXPECT_EQ(messages[2].id, cord::Snowflake{103});
  auto requests = transport->Requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].path, "/api/v9/channels/300/messages?limit=3&after=100");
}

TEST_F(ThreadHandleTest, HistoryStopsAtShortPage) {
  transport->Enqueue(JsonResponse(200, nlohmann::json::array({{{"id", "205"}}, {{"id", "204"}}})));
  auto handle = Handle(300);
  cord::HistoryQuery query;
  query.limit = 0;
  auto messages = handle.History(query);
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].id, cord::Snowflake{205});
  EXPECT_EQ(transport->Requests().size(), 1u);
}

TEST_F(ThreadHandleTest, SendReturnsCreatedMessage) {
  transport->Enqueue(
      JsonResponse(200, {{"id", "600"}, {"channel_id", "300"}, {"content", "hi"}, {"author", {{"id", "10"}}}}));
  auto handle = Handle(300);
  auto message = handle.Send("hi");
  EXPECT_EQ(message.id, cord::Snowflake{600});
  EXPECT_EQ(message.author_id, cord::Snowflake{10});
  EXPECT_EQ(message.content, "hi");
  EXPECT_EQ(nlohmann::json::parse(transport->Requests()[0].body)["content"], "hi");
}

TEST(ClientTest, HandlesComeFromCache) {
  cord::ClientConfig config;
  config.token = "token";
  config.log_level = "error";
  cord::Client client(config, std::make_shared<FakeHttpTransport>(), std::make_shared<FakeGatewayTransport>());

  EXPECT_FALSE(client.GetThread(300).has_value());
  EXPECT_EQ(client.Self(), nullptr);

  client.Store()->UpsertChannel(200, {{"type", 0}});
  client.Store()->UpsertChannel(201, {{"type", 2}});
  client.Store()->UpsertThread(300, {{"parent_id", "200"}, {"type", 11}});

  EXPECT_TRUE(client.GetThread(300).has_value());
  EXPECT_TRUE(client.GetTextChannel(200).has_value());
  EXPECT_FALSE(client.GetTextChannel(201).has_value());
  EXPECT_EQ(client.State(), cord::GatewayState::kDisconnected);
}

}  // namespace
