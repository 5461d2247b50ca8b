/*
 * 설명: 게이트웨이 요청과 뒤따르는 디스패치 이벤트를 짝지어 기다리는 대기 테이블.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/thread_handle_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace cord {

class PendingRequests {
 public:
  using Predicate = std::function<bool(const nlohmann::json&)>;

  struct Ticket {
    std::uint64_t id{0};
    std::future<nlohmann::json> future;
  };

  Ticket Register(std::string event_name, Predicate predicate);

  // 일치하는 대기 항목을 모두 완료시키고 완료된 개수를 돌려준다.
  std::size_t Resolve(const std::string& event_name, const nlohmann::json& payload);

  bool Cancel(std::uint64_t id);
  std::size_t Size() const;

 private:
  struct Entry {
    std::string event_name;
    Predicate predicate;
    std::promise<nlohmann::json> promise;
  };

  mutable std::mutex mutex_;
  std::uint64_t next_id_{1};
  std::unordered_map<std::uint64_t, Entry> entries_;
};

}  // namespace cord
