#pragma once
#include "dexarb/common.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Forward declaration
namespace ix {
class WebSocket;
struct WebSocketMessage;
} // namespace ix

namespace dexarb {

// Venue adapter: pushes pool state, at-least-once
class PoolAdapter {
public:
  using UpdateCallback = std::function<void(const PoolUpdate &)>;

  virtual ~PoolAdapter() = default;

  virtual void subscribe(const std::vector<std::string> &pool_ids,
                         UpdateCallback callback) = 0;
  virtual void start() = 0;
  virtual void stop() = 0;
};

// Pool-state stream over a WebSocket. Messages look like
//   {"type":"pool_update","pool":"0x..","venue":"uniswap_v2",
//    "token0":{"address":"0x..","symbol":"WETH","decimals":18},
//    "token1":{...},"reserve0":"1500.2","reserve1":"2710000",
//    "fee":0.003,"block":19000000}
// or {"type":"batch","updates":[...]}.
class WebSocketPoolFeed : public PoolAdapter {
public:
  explicit WebSocketPoolFeed(std::string url);
  ~WebSocketPoolFeed() override;

  void subscribe(const std::vector<std::string> &pool_ids,
                 UpdateCallback callback) override;
  void start() override;
  void stop() override;

  bool connected() const { return connected_; }

  static std::optional<PoolUpdate> parsePoolUpdate(const nlohmann::json &j);
  static std::vector<PoolUpdate> parseMessage(const std::string &payload);

private:
  std::string url_;
  std::unique_ptr<ix::WebSocket> ws_;
  std::atomic<bool> connected_{false};
  std::mutex mu_;
  std::vector<std::string> pool_ids_;
  UpdateCallback callback_;

  void onMessage(const ix::WebSocketMessage &msg);
  void sendSubscription();
};

} // namespace dexarb
