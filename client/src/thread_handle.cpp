/*
 * 설명: 스레드 멤버 조회(지연 요청 + 대기), 참여/탈퇴, 편집, 삭제, 메시지 일괄 삭제를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/thread_handle_test.cpp
 */
#include "cord/thread_handle.hpp"

#include <algorithm>
#include <stdexcept>

#include "cord/errors.hpp"

namespace cord {
namespace {
constexpr std::size_t kPurgeChunk = 50;

Snowflake EntryUserId(const nlohmann::json& entry) {
  if (entry.contains("user_id")) {
    return ParseSnowflake(entry.at("user_id"));
  }
  const auto& member = entry.contains("member") ? entry.at("member") : entry;
  return ParseSnowflake(member.at("user").at("id"));
}
}  // namespace

nlohmann::json ThreadEdit::ToPayload() const {
  nlohmann::json payload = nlohmann::json::object();
  if (name) {
    payload["name"] = *name;
  }
  if (archived) {
    payload["archived"] = *archived;
  }
  if (auto_archive_duration) {
    payload["auto_archive_duration"] = *auto_archive_duration;
  }
  if (locked) {
    payload["locked"] = *locked;
  }
  if (invitable) {
    payload["invitable"] = *invitable;
  }
  if (slowmode_delay) {
    payload["rate_limit_per_user"] = *slowmode_delay;
  }
  return payload;
}

ThreadHandle::ThreadHandle(Snowflake id, std::shared_ptr<EntityStore> store, std::shared_ptr<RestClient> rest,
                           std::shared_ptr<PendingRequests> pending, LazyRequest lazy_request,
                           std::chrono::milliseconds member_fetch_timeout)
    : Messageable(std::move(rest)), id_(id), store_(std::move(store)), pending_(std::move(pending)),
      lazy_request_(std::move(lazy_request)), member_fetch_timeout_(member_fetch_timeout) {}

std::shared_ptr<const Thread> ThreadHandle::Snapshot() const {
  auto thread = store_->Threads().Get(id_);
  if (!thread) {
    throw ClientError("스레드가 캐시에 없습니다: " + id_.ToString());
  }
  return thread;
}

std::vector<ThreadMember> ThreadHandle::FetchMembers() {
  auto thread = Snapshot();
  const auto thread_id = id_;
  auto ticket = pending_->Register("THREAD_MEMBER_LIST_UPDATE", [thread_id](const nlohmann::json& payload) {
    if (!payload.is_object()) {
      return false;
    }
    try {
      auto id = ParseOptionalSnowflake(payload, "thread_id");
      return id && *id == thread_id;
    } catch (const std::invalid_argument&) {
      return false;
    }
  });
  lazy_request_(thread->guild_id, {id_});

  if (ticket.future.wait_for(member_fetch_timeout_) != std::future_status::ready) {
    pending_->Cancel(ticket.id);
    throw ProtocolTimeout("서버가 스레드 멤버 목록에 응답하지 않았습니다");
  }
  MergeMemberList(ticket.future.get());
  return Members();
}

void ThreadHandle::MergeMemberList(const nlohmann::json& payload) {
  auto guild_id = Snapshot()->guild_id;
  auto members_it = payload.find("members");
  if (members_it == payload.end() || !members_it->is_array()) {
    return;
  }
  for (const auto& entry : *members_it) {
    auto user_id = EntryUserId(entry);
    auto member = ThreadMemberFromJson(entry, id_, user_id);
    member.user_id = user_id;
    member.thread_id = id_;
    if (user_id == store_->SelfId()) {
      store_->SetSelfThreadMember(id_, member);
    } else {
      store_->AddThreadMember(id_, member);
    }
    const auto& guild_member = entry.contains("member") ? entry.at("member") : entry;
    if (guild_member.is_object() && guild_member.contains("user")) {
      store_->UpsertMember(guild_id, user_id, guild_member);
    }
  }
}

void ThreadHandle::AddMember(const ThreadMember& member) { store_->AddThreadMember(id_, member); }

void ThreadHandle::RemoveMember(Snowflake user_id) { store_->RemoveThreadMember(id_, user_id); }

void ThreadHandle::Join() { Rest().JoinThread(id_); }

void ThreadHandle::Leave() { Rest().LeaveThread(id_); }

void ThreadHandle::AddUser(Snowflake user_id) { Rest().AddThreadMember(id_, user_id); }

void ThreadHandle::RemoveUser(Snowflake user_id) { Rest().RemoveThreadMember(id_, user_id); }

std::shared_ptr<const Thread> ThreadHandle::Edit(const ThreadEdit& edit) {
  auto thread = Snapshot();
  if (thread->archived && !edit.Unarchives()) {
    throw ThreadArchived("보관된 스레드는 보관 해제 전까지 편집할 수 없습니다: " + id_.ToString());
  }
  auto data = Rest().EditChannel(id_, edit.ToPayload(), edit.reason);
  if (!data.is_object()) {
    return Snapshot();
  }
  return store_->UpsertThread(id_, data).after;
}

void ThreadHandle::Delete() {
  Rest().DeleteChannel(id_);
  store_->RemoveThread(id_);
}

void ThreadHandle::DeleteMessages(const std::vector<Snowflake>& message_ids) {
  // 사용자 계정은 일괄 삭제 엔드포인트를 쓸 수 없다.
  for (const auto& message_id : message_ids) {
    Rest().DeleteMessage(id_, message_id);
  }
}

std::vector<Message> ThreadHandle::Purge(const PurgeOptions& options) {
  auto history = History(options.query);
  std::vector<Message> matched;
  std::vector<Snowflake> chunk;
  chunk.reserve(kPurgeChunk);
  for (auto& message : history) {
    if (options.check && !options.check(message)) {
      continue;
    }
    chunk.push_back(message.id);
    matched.push_back(std::move(message));
    if (chunk.size() == kPurgeChunk) {
      DeleteMessages(chunk);
      chunk.clear();
    }
  }
  if (!chunk.empty()) {
    DeleteMessages(chunk);
  }
  return matched;
}

std::shared_ptr<const Channel> ThreadHandle::Parent() const { return store_->Channels().Get(Snapshot()->parent_id); }

std::shared_ptr<const Member> ThreadHandle::Owner() const {
  auto thread = Snapshot();
  return store_->Members().Get(MemberKey{thread->guild_id, thread->owner_id});
}

std::vector<ThreadMember> ThreadHandle::Members() const { return store_->ThreadMembers(id_); }

std::optional<ThreadMember> ThreadHandle::Me() const { return Snapshot()->self_member; }

bool ThreadHandle::IsNsfw() const {
  auto parent = Parent();
  return parent && parent->nsfw;
}

std::optional<Snowflake> ThreadHandle::CategoryId() const {
  auto parent = Parent();
  if (!parent) {
    throw ClientError("부모 채널이 캐시에 없습니다: " + Snapshot()->parent_id.ToString());
  }
  return parent->parent_id;
}

}  // namespace cord
