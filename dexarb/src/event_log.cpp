#include "dexarb/event_log.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

using json = nlohmann::json;

namespace dexarb {

static std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::ostringstream ss;
  ss << std::put_time(std::localtime(&t), "%Y-%m-%dT%H:%M:%S") << '.'
     << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

EventLog::EventLog(const std::string &log_dir) : log_dir_(log_dir) {
  std::filesystem::create_directories(log_dir_);

  exec_csv_.open(log_dir_ + "/executions.csv", std::ios::app);
  events_.open(log_dir_ + "/events.jsonl", std::ios::app);
  ensureHeaders();
}

EventLog::~EventLog() {
  if (exec_csv_.is_open())
    exec_csv_.close();
  if (events_.is_open())
    events_.close();
}

void EventLog::ensureHeaders() {
  // tellp() is unreliable with ios::app
  auto exec_path = std::filesystem::path(log_dir_) / "executions.csv";
  if (std::filesystem::file_size(exec_path) == 0) {
    exec_csv_ << "timestamp,opportunity_id,status,reason,expected_profit,"
                 "simulated_profit,capital,flash_loan,bundle_hash,block,"
                 "elapsed_ms\n";
  }
}

void EventLog::opportunityDiscovered(const MultiPathOpportunity &opp) {
  std::lock_guard<std::mutex> lock(mtx_);
  json paths = json::array();
  for (const auto &p : opp.paths) {
    paths.push_back({{"tokens", p.tokens},
                     {"venues", p.venues},
                     {"yield", p.yield},
                     {"required_input", p.required_input}});
  }
  json ev = {{"ts", timestamp()},
             {"event", "opportunity_discovered"},
             {"id", opp.id},
             {"expected_profit", opp.expected_profit},
             {"confidence", opp.confidence},
             {"paths", paths}};
  events_ << ev.dump() << "\n";
  events_.flush();

  spdlog::info("💰 Opportunity {}: {} paths, expected={:.6f}, conf={:.2f}",
               opp.id, opp.paths.size(), opp.expected_profit, opp.confidence);
  for (const auto &p : opp.paths) {
    spdlog::info("  ├─ {} hops, yield={:.5f}, input={:.4f}", p.hopCount(),
                 p.yield, p.required_input);
  }
}

void EventLog::opportunityExecuted(const ExecutionReport &r) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto ts = timestamp();
  const char *status = toString(r.state);
  double profit = r.state == OpportunityState::INCLUDED ? r.simulated_profit
                                                        : 0.0;

  json ev = {{"ts", ts},
             {"event", "opportunity_executed"},
             {"id", r.opportunity_id},
             {"status", status},
             {"reason", toString(r.reason)},
             {"profit", profit}};
  events_ << ev.dump() << "\n";
  events_.flush();

  exec_csv_ << ts << "," << r.opportunity_id << "," << status << ","
            << toString(r.reason) << "," << std::fixed << std::setprecision(6)
            << r.expected_profit << "," << r.simulated_profit << ","
            << r.capital << "," << (r.flash_loan ? 1 : 0) << ","
            << r.bundle_hash << "," << r.included_block << ","
            << std::setprecision(1) << r.elapsed_ms << "\n";
  exec_csv_.flush();

  if (r.state == OpportunityState::INCLUDED) {
    spdlog::info("✅ {} included in block {}: profit={:.6f}", r.opportunity_id,
                 r.included_block, r.simulated_profit);
  } else if (r.state == OpportunityState::EXPIRED) {
    spdlog::warn("⌛ {} missed: not included within the wait window",
                 r.opportunity_id);
  } else {
    spdlog::info("⚠️  {} {}: {} {}", r.opportunity_id, status,
                 toString(r.reason), r.detail);
  }
}

void EventLog::graphStats(size_t nodes, size_t edges) {
  std::lock_guard<std::mutex> lock(mtx_);
  json ev = {{"ts", timestamp()},
             {"event", "graph_stats"},
             {"nodes", nodes},
             {"edges", edges}};
  events_ << ev.dump() << "\n";
  events_.flush();
  spdlog::debug("[Graph] nodes={} edges={}", nodes, edges);
}

} // namespace dexarb
