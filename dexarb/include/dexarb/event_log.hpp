#pragma once
#include "dexarb/common.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace dexarb {

// Dashboard / metrics events
class EventSink {
public:
  virtual ~EventSink() = default;

  virtual void opportunityDiscovered(const MultiPathOpportunity &opp) = 0;
  virtual void opportunityExecuted(const ExecutionReport &report) = 0;
  virtual void graphStats(size_t nodes, size_t edges) = 0;
};

// events.jsonl for the dashboard, executions.csv for history, spdlog for
// the console
class EventLog : public EventSink {
public:
  explicit EventLog(const std::string &log_dir = "logs");
  ~EventLog() override;

  void opportunityDiscovered(const MultiPathOpportunity &opp) override;
  void opportunityExecuted(const ExecutionReport &report) override;
  void graphStats(size_t nodes, size_t edges) override;

private:
  std::string log_dir_;
  std::ofstream exec_csv_;
  std::ofstream events_;
  std::mutex mtx_;

  void ensureHeaders();
};

} // namespace dexarb
