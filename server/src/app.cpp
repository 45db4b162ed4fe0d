/*
 * 설명: 브로커 수명주기와 클라이언트/백엔드 리스너, 워커 스레드를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#include "consistency/app.hpp"

#include <algorithm>
#include <csignal>
#include <functional>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "consistency/backend_session.hpp"
#include "consistency/http_session.hpp"

namespace consistency {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  using AcceptHandler = std::function<void(boost::asio::ip::tcp::socket)>;

  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, AcceptHandler on_accept)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), on_accept_(std::move(on_accept)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

  unsigned short LocalPort() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            self->on_accept_(std::move(socket));
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AcceptHandler on_accept_;
};

namespace {
QueueLimits ValidatedLimits(const AppConfig& config, LogLevel& log_level) {
  QueueLimits limits;
  std::string error_message;
  if (!ValidateConfig(config, limits, log_level, error_message)) {
    throw std::invalid_argument(error_message);
  }
  return limits;
}

unsigned int ResolveThreadCount(std::size_t configured) {
  if (configured > 0) {
    return static_cast<unsigned int>(configured);
  }
  return std::max(1u, std::thread::hardware_concurrency());
}

boost::asio::ip::tcp::endpoint MakeEndpoint(const std::string& host, unsigned short port) {
  boost::beast::error_code ec;
  auto address = boost::asio::ip::make_address(host, ec);
  if (ec) {
    throw boost::beast::system_error{ec, "잘못된 바인드 주소: " + host};
  }
  return {address, port};
}
}  // namespace

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(static_cast<int>(ResolveThreadCount(config.worker_threads))),
      work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  LogLevel log_level = LogLevel::kInfo;
  limits_ = ValidatedLimits(config_, log_level);
  observability_ = std::make_shared<Observability>(log_level);
  registry_ = std::make_shared<SubscriptionRegistry>();
  connections_ = std::make_shared<ConnectionManager>(registry_, limits_, observability_);
  dispatcher_ = std::make_shared<Dispatcher>(registry_, connections_, observability_);
  ingest_ = std::make_shared<BackendIngest>(ioc_, dispatcher_, config_.ingest_coalesce, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Start() {
  if (started_.exchange(true)) {
    return;
  }
  auto connections = connections_;
  auto registry = registry_;
  auto observability = observability_;
  auto ingest = ingest_;

  public_listener_ = std::make_shared<Listener>(
      ioc_, MakeEndpoint(config_.public_host, config_.public_port),
      [connections, registry, observability](boost::asio::ip::tcp::socket socket) {
        std::make_shared<HttpSession>(std::move(socket), connections, registry, observability)->Run();
      });
  backend_listener_ = std::make_shared<Listener>(
      ioc_, MakeEndpoint(config_.backend_host, config_.backend_port),
      [ingest, observability](boost::asio::ip::tcp::socket socket) {
        std::make_shared<BackendSession>(std::move(socket), ingest, observability)->Run();
      });
  public_listener_->Run();
  backend_listener_->Run();

  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Log(LogContext{.level = LogLevel::kInfo,
                                   .name = "server.signal",
                                   .detail = "signal=" + std::to_string(signal_number)});
    // 워커 스레드 안이므로 join 없이 io_context만 멈춘다. join은 소멸자의 Stop()이 맡는다.
    ingest_->Stop();
    public_listener_->Stop();
    backend_listener_->Stop();
    connections_->Shutdown();
    work_guard_.reset();
    ioc_.stop();
  });

  running_ = true;
  observability_->Log(LogContext{
      .level = LogLevel::kInfo,
      .name = "server.started",
      .detail = "public=" + config_.public_host + ":" + std::to_string(public_listener_->LocalPort()) +
                " backend=" + config_.backend_host + ":" + std::to_string(backend_listener_->LocalPort()) +
                " overflow=" + std::string(OverflowPolicyName(limits_.policy)) +
                " coalesce=" + (config_.ingest_coalesce ? "on" : "off")});
}

unsigned short ServerApp::PublicPort() const { return public_listener_ ? public_listener_->LocalPort() : 0; }

unsigned short ServerApp::BackendPort() const { return backend_listener_ ? backend_listener_->LocalPort() : 0; }

void ServerApp::Run() {
  Start();
  RunWorkers();
  ioc_.run();
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = ResolveThreadCount(config_.worker_threads);
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (running_.exchange(false)) {
    ingest_->Stop();
    if (public_listener_) {
      public_listener_->Stop();
    }
    if (backend_listener_) {
      backend_listener_->Stop();
    }
    connections_->Shutdown();
    boost::system::error_code ignored;
    signals_.cancel(ignored);
    work_guard_.reset();
    ioc_.stop();
    observability_->Log(LogContext{.level = LogLevel::kInfo, .name = "server.stopped"});
  }
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
  workers_.clear();
}

}  // namespace consistency
