/*
 * 설명: 메시지를 보낼 수 있는 채널의 공통 기능(전송, 이력 조회)과 일반 텍스트 채널 핸들을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/thread_handle_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cord/entities.hpp"
#include "cord/entity_store.hpp"
#include "cord/rest_client.hpp"

namespace cord {

class Messageable {
 public:
  virtual ~Messageable() = default;

  virtual Snowflake MessageChannelId() const = 0;

  Message Send(const std::string& content);
  // limit이 0 이하이면 채널 끝까지 읽는다.
  std::vector<Message> History(const HistoryQuery& query);

 protected:
  explicit Messageable(std::shared_ptr<RestClient> rest) : rest_(std::move(rest)) {}

  RestClient& Rest() const { return *rest_; }

 private:
  std::shared_ptr<RestClient> rest_;
};

class TextChannelHandle : public Messageable {
 public:
  TextChannelHandle(Snowflake id, std::shared_ptr<EntityStore> store, std::shared_ptr<RestClient> rest);

  Snowflake Id() const { return id_; }
  Snowflake MessageChannelId() const override { return id_; }
  std::shared_ptr<const Channel> Snapshot() const;

 private:
  Snowflake id_;
  std::shared_ptr<EntityStore> store_;
};

}  // namespace cord
