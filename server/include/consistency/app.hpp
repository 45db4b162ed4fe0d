/*
 * 설명: 브로커 전체 수명주기(리스너 두 개, 워커 스레드, 종료 신호)를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "consistency/backend_ingest.hpp"
#include "consistency/config.hpp"
#include "consistency/connection_manager.hpp"
#include "consistency/dispatcher.hpp"
#include "consistency/observability.hpp"
#include "consistency/registry.hpp"

namespace consistency {

class Listener;

class ServerApp {
 public:
  // 설정이 유효하지 않으면 std::invalid_argument를 던진다.
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 두 포트를 바인드한다. 실패하면 boost::system::system_error를 던진다.
  void Start();
  void Run();
  void Stop();

  // Start() 이후 실제로 바인드된 포트. 설정 포트가 0이면 커널이 고른 값이다.
  unsigned short PublicPort() const;
  unsigned short BackendPort() const;

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SubscriptionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<ConnectionManager> GetConnectionManager() { return connections_; }
  std::shared_ptr<Dispatcher> GetDispatcher() { return dispatcher_; }
  std::shared_ptr<BackendIngest> GetBackendIngest() { return ingest_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  QueueLimits limits_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> public_listener_;
  std::shared_ptr<Listener> backend_listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SubscriptionRegistry> registry_;
  std::shared_ptr<ConnectionManager> connections_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::shared_ptr<BackendIngest> ingest_;
  std::vector<std::thread> workers_;
  std::atomic<bool> started_{false};
  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
};

}  // namespace consistency
