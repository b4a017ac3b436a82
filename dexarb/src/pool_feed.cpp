#include "dexarb/pool_feed.hpp"
#include <ixwebsocket/IXWebSocket.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace dexarb {

WebSocketPoolFeed::WebSocketPoolFeed(std::string url) : url_(std::move(url)) {
  ws_ = std::make_unique<ix::WebSocket>();
  ws_->setUrl(url_);
  ws_->setPingInterval(30);
  ws_->setOnMessageCallback(
      [this](const ix::WebSocketMessagePtr &msg) { onMessage(*msg); });
}

WebSocketPoolFeed::~WebSocketPoolFeed() {
  if (ws_)
    ws_->stop();
}

void WebSocketPoolFeed::start() {
  spdlog::info("[Feed] Connecting to {}...", url_);
  ws_->start();
}

void WebSocketPoolFeed::stop() {
  ws_->stop();
  connected_ = false;
}

void WebSocketPoolFeed::subscribe(const std::vector<std::string> &pool_ids,
                                  UpdateCallback callback) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    pool_ids_ = pool_ids;
    callback_ = std::move(callback);
  }
  if (connected_)
    sendSubscription();
}

// Re-sent on every (re)connect
void WebSocketPoolFeed::sendSubscription() {
  json sub;
  {
    std::lock_guard<std::mutex> lock(mu_);
    sub["type"] = "subscribe";
    sub["pools"] = pool_ids_;
  }
  spdlog::info("[Feed] Subscribing to {} pools", sub["pools"].size());
  ws_->send(sub.dump());
}

// Numbers arrive either as JSON numbers or as decimal strings
static double number(const json &v) {
  if (v.is_string())
    return std::stod(v.get<std::string>());
  return v.get<double>();
}

static Token parseToken(const json &j) {
  Token t;
  t.address = j.at("address").get<std::string>();
  t.symbol = j.value("symbol", "");
  t.decimals = j.value("decimals", 18);
  return t;
}

std::optional<PoolUpdate> WebSocketPoolFeed::parsePoolUpdate(const json &j) {
  if (!j.is_object() || !j.contains("pool") || !j.contains("token0") ||
      !j.contains("token1") || !j.contains("reserve0") ||
      !j.contains("reserve1"))
    return std::nullopt;

  try {
    PoolUpdate u;
    u.pool_id = j["pool"].get<std::string>();
    u.venue = j.value("venue", "");
    u.token0 = parseToken(j["token0"]);
    u.token1 = parseToken(j["token1"]);
    u.reserve0 = number(j["reserve0"]);
    u.reserve1 = number(j["reserve1"]);
    if (j.contains("fee"))
      u.fee = number(j["fee"]);
    else if (j.contains("fee_bps"))
      u.fee = number(j["fee_bps"]) / 10000.0;
    if (j.contains("block"))
      u.block_number = j["block"].get<uint64_t>();
    u.received_at = Clock::now();
    return u;
  } catch (const json::exception &e) {
    spdlog::debug("[Feed] Unparseable pool update: {}", e.what());
  } catch (const std::logic_error &e) {
    spdlog::debug("[Feed] Bad number in pool update: {}", e.what());
  }
  return std::nullopt;
}

std::vector<PoolUpdate> WebSocketPoolFeed::parseMessage(const std::string &payload) {
  std::vector<PoolUpdate> updates;
  auto j = json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    return updates;

  std::string type = j.value("type", "");
  if (type == "pool_update") {
    if (auto u = parsePoolUpdate(j))
      updates.push_back(*u);
  } else if (type == "batch" && j.contains("updates") &&
             j["updates"].is_array()) {
    for (const auto &item : j["updates"]) {
      if (auto u = parsePoolUpdate(item))
        updates.push_back(*u);
    }
  }
  return updates;
}

void WebSocketPoolFeed::onMessage(const ix::WebSocketMessage &msg) {
  if (msg.type == ix::WebSocketMessageType::Open) {
    spdlog::info("[Feed] Connected to {}", url_);
    connected_ = true;
    sendSubscription();
  } else if (msg.type == ix::WebSocketMessageType::Close) {
    spdlog::warn("[Feed] Disconnected ({}): {}", msg.closeInfo.code,
                 msg.closeInfo.reason);
    connected_ = false;
  } else if (msg.type == ix::WebSocketMessageType::Error) {
    spdlog::error("[Feed] WebSocket error: {}", msg.errorInfo.reason);
  } else if (msg.type == ix::WebSocketMessageType::Message) {
    UpdateCallback cb;
    {
      std::lock_guard<std::mutex> lock(mu_);
      cb = callback_;
    }
    if (!cb)
      return;
    for (const auto &u : parseMessage(msg.str)) {
      try {
        cb(u);
      } catch (const std::exception &e) {
        spdlog::error("[Feed] Update handler failed for {}: {}", u.pool_id,
                      e.what());
      }
    }
  }
}

} // namespace dexarb
