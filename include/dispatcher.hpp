#pragma once
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "bounded_queue.hpp"
#include "types.hpp"
#include "worker_thread.hpp"

namespace httplib {
class Client;
}

void to_json(nlohmann::json& j, const ActuatorPayload& p);

// One network call per payload. Implementations report failure by return
// value; they must not retry.
class PayloadTransport {
public:
  virtual ~PayloadTransport() = default;
  virtual bool post(const ActuatorPayload& payload) = 0;
  virtual std::string endpoint() const = 0;
};

// POSTs the payload as JSON to http://host:port<path>.
class HttpTransport : public PayloadTransport {
public:
  HttpTransport(std::string host, int port, std::string path = "/position",
                std::chrono::milliseconds timeout = std::chrono::milliseconds(1000),
                std::shared_ptr<spdlog::logger> log = nullptr);
  ~HttpTransport() override;

  bool post(const ActuatorPayload& payload) override;
  std::string endpoint() const override;

private:
  std::string host_;
  int port_;
  std::string path_;
  std::unique_ptr<httplib::Client> client_;
  std::shared_ptr<spdlog::logger> log_;
};

struct DispatcherConfig {
  std::string name{"one"};
  size_t queue_capacity{32};
  std::chrono::milliseconds min_interval{100};
  std::chrono::milliseconds poll_interval{100};  // queue wait granularity
  std::chrono::milliseconds sleep_step{20};      // rate-limit sleep granularity
};

// Bounded, rate-limited background sender. send() never blocks: when the
// queue is full the payload is dropped and counted.
class Dispatcher {
public:
  Dispatcher(DispatcherConfig cfg, std::unique_ptr<PayloadTransport> transport,
             std::shared_ptr<spdlog::logger> log = nullptr);
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  bool start();
  // Throws std::invalid_argument for a malformed payload.
  bool send(const ActuatorPayload& payload);
  void stop();
  bool join_for(std::chrono::milliseconds timeout);
  void join();
  bool running() const { return worker_.running(); }

  const std::string& name() const { return cfg_.name; }
  std::string endpoint() const { return transport_->endpoint(); }
  size_t queue_size() const { return queue_.size(); }
  size_t capacity() const { return queue_.capacity(); }
  uint64_t dropped() const { return dropped_.load(); }
  uint64_t sent() const { return sent_.load(); }
  uint64_t failed() const { return failed_.load(); }

private:
  void run();
  void cooperative_sleep(std::chrono::steady_clock::duration d);

  DispatcherConfig cfg_;
  std::unique_ptr<PayloadTransport> transport_;
  std::shared_ptr<spdlog::logger> log_;

  BoundedQueue<ActuatorPayload> queue_;
  std::optional<TimePoint> last_send_;

  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> failed_{0};

  WorkerThread worker_;
};
