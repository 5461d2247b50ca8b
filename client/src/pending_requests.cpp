/*
 * 설명: 이벤트 이름과 조건으로 대기 항목을 찾아 promise를 완료시킨다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/thread_handle_test.cpp
 */
#include "cord/pending_requests.hpp"

#include <utility>
#include <vector>

namespace cord {

PendingRequests::Ticket PendingRequests::Register(std::string event_name, Predicate predicate) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_id_++;
  Entry entry{std::move(event_name), std::move(predicate), {}};
  Ticket ticket{id, entry.promise.get_future()};
  entries_.emplace(id, std::move(entry));
  return ticket;
}

std::size_t PendingRequests::Resolve(const std::string& event_name, const nlohmann::json& payload) {
  std::vector<std::promise<nlohmann::json>> matched;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second.event_name == event_name && (!it->second.predicate || it->second.predicate(payload))) {
        matched.push_back(std::move(it->second.promise));
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& promise : matched) {
    promise.set_value(payload);
  }
  return matched.size();
}

bool PendingRequests::Cancel(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(id) > 0;
}

std::size_t PendingRequests::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace cord
