#include "dispatcher.hpp"

#include <httplib.h>

#include <algorithm>
#include <thread>

#include "logging.hpp"

using namespace std::chrono;

void to_json(nlohmann::json& j, const ActuatorPayload& p) {
  j = nlohmann::json{{"x", p.x},   {"y", p.y},   {"z", p.z},
                     {"h", p.h},   {"ears", p.ears},
                     {"ax", p.ax}, {"ay", p.ay}, {"az", p.az},
                     {"duration_ms", p.duration_ms}};
}

HttpTransport::HttpTransport(std::string host, int port, std::string path,
                             milliseconds timeout, std::shared_ptr<spdlog::logger> log)
    : host_(std::move(host)),
      port_(port),
      path_(std::move(path)),
      client_(std::make_unique<httplib::Client>(host_, port_)),
      log_(or_default(std::move(log))) {
  const auto secs = duration_cast<seconds>(timeout);
  const auto usecs = duration_cast<microseconds>(timeout - secs);
  client_->set_connection_timeout(secs.count(), usecs.count());
  client_->set_read_timeout(secs.count(), usecs.count());
  client_->set_write_timeout(secs.count(), usecs.count());
  client_->set_keep_alive(true);
}

HttpTransport::~HttpTransport() = default;

bool HttpTransport::post(const ActuatorPayload& payload) {
  const std::string body = nlohmann::json(payload).dump();
  auto res = client_->Post(path_.c_str(), body, "application/json");
  if (!res) {
    log_->error("POST {} failed: {}", endpoint(), httplib::to_string(res.error()));
    return false;
  }
  if (res->status < 200 || res->status >= 300) {
    log_->error("POST {} returned HTTP {}", endpoint(), res->status);
    return false;
  }
  return true;
}

std::string HttpTransport::endpoint() const {
  return "http://" + host_ + ":" + std::to_string(port_) + path_;
}

Dispatcher::Dispatcher(DispatcherConfig cfg, std::unique_ptr<PayloadTransport> transport,
                       std::shared_ptr<spdlog::logger> log)
    : cfg_(std::move(cfg)),
      transport_(std::move(transport)),
      log_(or_default(std::move(log))),
      queue_(cfg_.queue_capacity) {
  if (!transport_) throw std::invalid_argument("Dispatcher needs a transport");
  if (cfg_.poll_interval <= milliseconds(0) || cfg_.sleep_step <= milliseconds(0)) {
    throw std::invalid_argument("Dispatcher poll intervals must be positive");
  }
}

Dispatcher::~Dispatcher() {
  stop();
  join();
}

bool Dispatcher::start() {
  if (worker_.running()) return true;
  if (!worker_.join_for(milliseconds(0))) {
    log_->warn("[{}] Sender from the previous run is still exiting", cfg_.name);
    return false;
  }
  queue_.reopen();
  if (!worker_.start([this] { run(); })) return false;
  log_->info("[{}] Sender started -> {}", cfg_.name, transport_->endpoint());
  return true;
}

bool Dispatcher::send(const ActuatorPayload& payload) {
  validate(payload);
  if (!queue_.try_push(payload)) {
    const auto n = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
    log_->warn("[{}] Queue full, dropping pose ({} dropped)", cfg_.name, n);
    return false;
  }
  return true;
}

void Dispatcher::stop() {
  worker_.request_stop();
  queue_.close();
  queue_.clear();
}

bool Dispatcher::join_for(milliseconds timeout) { return worker_.join_for(timeout); }

void Dispatcher::join() { worker_.join(); }

void Dispatcher::cooperative_sleep(steady_clock::duration d) {
  const auto end = steady_clock::now() + d;
  while (!worker_.stop_requested()) {
    const auto now = steady_clock::now();
    if (now >= end) break;
    std::this_thread::sleep_for(
        std::min<steady_clock::duration>(cfg_.sleep_step, end - now));
  }
}

void Dispatcher::run() {
  while (!worker_.stop_requested()) {
    auto payload = queue_.pop_for(cfg_.poll_interval);
    if (!payload) continue;

    if (last_send_) {
      const auto since = Clock::now() - *last_send_;
      if (since < cfg_.min_interval) cooperative_sleep(cfg_.min_interval - since);
    }
    if (worker_.stop_requested()) break;

    bool ok = false;
    try {
      ok = transport_->post(*payload);
    } catch (const std::exception& e) {
      log_->error("[{}] Error sending: {}", cfg_.name, e.what());
    }
    if (ok) {
      last_send_ = Clock::now();
      sent_.fetch_add(1, std::memory_order_relaxed);
      log_->debug("[{}] Sent -> Pitch: {:.3f}, Roll: {:.3f}, Yaw: {:.3f}, Height: {:.3f}, "
                  "Duration: {:.2f}s",
                  cfg_.name, payload->x, payload->y, payload->z, payload->h,
                  payload->duration_ms / 1000.0);
    } else {
      const auto n = failed_.fetch_add(1, std::memory_order_relaxed) + 1;
      log_->debug("[{}] Send failed, payload discarded ({} failures)", cfg_.name, n);
    }
  }
  log_->info("[{}] Sender stopped (sent={}, dropped={}, failed={})", cfg_.name, sent_.load(),
             dropped_.load(), failed_.load());
}
