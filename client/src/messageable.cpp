/*
 * 설명: 메시지 전송과 이력 페이지 순회(최신순/오래된순/around)를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/thread_handle_test.cpp
 */
#include "cord/messageable.hpp"

#include <algorithm>
#include <limits>

namespace cord {
namespace {
constexpr int kPageSize = 100;

std::vector<Message> ToMessages(const std::vector<nlohmann::json>& page) {
  std::vector<Message> out;
  out.reserve(page.size());
  for (const auto& item : page) {
    out.push_back(MessageFromJson(item));
  }
  return out;
}
}  // namespace

Message Messageable::Send(const std::string& content) {
  return MessageFromJson(rest_->SendMessage(MessageChannelId(), content));
}

std::vector<Message> Messageable::History(const HistoryQuery& query) {
  std::vector<Message> out;
  int remaining = query.limit > 0 ? query.limit : std::numeric_limits<int>::max();
  const auto channel_id = MessageChannelId();

  if (query.around) {
    auto page = ToMessages(rest_->GetMessages(channel_id, std::min(remaining, kPageSize), std::nullopt, std::nullopt,
                                              query.around));
    std::sort(page.begin(), page.end(), [&query](const Message& a, const Message& b) {
      return query.oldest_first ? a.id < b.id : a.id > b.id;
    });
    return page;
  }

  if (query.oldest_first) {
    Snowflake after = query.after.value_or(Snowflake{0});
    while (remaining > 0) {
      const int requested = std::min(remaining, kPageSize);
      auto page = ToMessages(rest_->GetMessages(channel_id, requested, std::nullopt, after, std::nullopt));
      if (page.empty()) {
        break;
      }
      std::sort(page.begin(), page.end(), [](const Message& a, const Message& b) { return a.id < b.id; });
      for (auto& message : page) {
        if (query.before && message.id >= *query.before) {
          return out;
        }
        after = message.id;
        out.push_back(std::move(message));
        if (--remaining == 0) {
          break;
        }
      }
      if (static_cast<int>(page.size()) < requested) {
        break;
      }
    }
    return out;
  }

  std::optional<Snowflake> before = query.before;
  while (remaining > 0) {
    const int requested = std::min(remaining, kPageSize);
    auto page = ToMessages(rest_->GetMessages(channel_id, requested, before, std::nullopt, std::nullopt));
    if (page.empty()) {
      break;
    }
    std::sort(page.begin(), page.end(), [](const Message& a, const Message& b) { return a.id > b.id; });
    for (auto& message : page) {
      if (query.after && message.id <= *query.after) {
        return out;
      }
      before = message.id;
      out.push_back(std::move(message));
      if (--remaining == 0) {
        break;
      }
    }
    if (static_cast<int>(page.size()) < requested) {
      break;
    }
  }
  return out;
}

TextChannelHandle::TextChannelHandle(Snowflake id, std::shared_ptr<EntityStore> store,
                                     std::shared_ptr<RestClient> rest)
    : Messageable(std::move(rest)), id_(id), store_(std::move(store)) {}

std::shared_ptr<const Channel> TextChannelHandle::Snapshot() const { return store_->Channels().Get(id_); }

}  // namespace cord
