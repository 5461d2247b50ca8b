/*
 * 설명: 클라이언트 진입점. 설정을 읽어 게이트웨이에 접속하고 준비 완료 요약과 엔티티 변경을 로그로 남긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <iostream>
#include <memory>
#include <string>

#include "cord/client.hpp"

int main(int argc, char** argv) {
  using namespace cord;
  ClientConfig config;
  try {
    config = argc > 1 ? LoadConfigFromFile(argv[1]) : LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "설정 로드 실패: " << ex.what() << "\n";
    return 1;
  }

  Client client(config);
  auto observability = client.GetObservability();
  auto store = client.Store();

  client.SetNotificationSink(
      std::make_shared<CallbackNotificationSink>([observability](const ChangeNotification& notification) {
        observability->Log(LogLevel::kDebug, "entity.changed",
                           {{"kind", std::string(ToString(notification.kind))},
                            {"id", notification.id.ToString()},
                            {"created", notification.IsCreate()},
                            {"deleted", notification.IsDelete()}});
      }));

  client.Session()->SetStateObserver([observability, store](GatewayState from, GatewayState to) {
    if (to != GatewayState::kReady || from != GatewayState::kIdentifying) {
      return;
    }
    auto self = store->Users().Get(store->SelfId());
    nlohmann::json guilds = nlohmann::json::array();
    for (const auto& guild : store->Guilds().All()) {
      guilds.push_back({{"id", guild->id.ToString()}, {"name", guild->name}, {"members", guild->member_count}});
    }
    std::string user = self ? self->username + "#" + self->discriminator : store->SelfId().ToString();
    observability->Log(LogLevel::kInfo, "client.connected",
                       {{"message", user + "(으)로 접속, 길드 " + std::to_string(guilds.size()) + "개"},
                        {"userId", store->SelfId().ToString()},
                        {"guilds", guilds}});
  });

  try {
    client.Run();
  } catch (const std::exception& ex) {
    std::cerr << "클라이언트 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }

  auto metrics = observability->Snapshot();
  observability->Log(LogLevel::kInfo, "client.stopped",
                     {{"eventsDispatched", metrics.events_dispatched},
                      {"eventsDropped", metrics.events_dropped},
                      {"reconnects", metrics.reconnects},
                      {"restRequests", metrics.rest_requests}});
  return 0;
}
