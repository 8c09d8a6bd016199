#pragma once

#include "transfer/types.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <map>
#include <memory>

namespace discofill {

namespace util {
class ThreadPool;
}

namespace transfer {

class SessionRouter;
class TransferRegistry;

// AutoMatcher - attaches completed downloads to their destination
//
// Runs on the orchestrator's io_context. The first attempt is made as soon as
// the transfer completes; a Retryable answer schedules the next attempt on a
// timer with exponential backoff (base_delay, 2*base_delay, ... capped at
// max_delay), so waiting never holds up other transfers' events. Fatal
// answers and exhausted attempts end with MatchStatus::Failed; the file stays
// where the protocol put it and the transfer stays Completed.
class AutoMatcher {
public:
  struct Config {
    int max_attempts;
    std::chrono::milliseconds base_delay;
    std::chrono::milliseconds max_delay;
    bool analysis_enabled; // call Destination::TriggerAnalysis after success

    Config()
        : max_attempts(5), base_delay(std::chrono::milliseconds(1000)),
          max_delay(std::chrono::milliseconds(30000)),
          analysis_enabled(false) {}
  };

  AutoMatcher(boost::asio::io_context &io_context, TransferRegistry &registry,
              SessionRouter &router, util::ThreadPool *analysis_pool,
              const Config &config = Config{});
  ~AutoMatcher();

  // Begin matching a Completed transfer. Call on the io_context thread.
  void Start(TransferId id);

  // Drop every scheduled retry (shutdown). Matches in flight end as Failed.
  void CancelAll();

  size_t PendingRetries() const { return timers_.size(); }

  // Delay before attempt (attempt + 1), attempt >= 1
  static std::chrono::milliseconds BackoffDelay(const Config &config,
                                                int attempt);

private:
  void attempt(TransferId id);
  void schedule_retry(TransferId id, int attempts_made);
  void finish(TransferId id, MatchStatus status, const std::string &reason);
  void publish(TransferId id);

  boost::asio::io_context &io_context_;
  TransferRegistry &registry_;
  SessionRouter &router_;
  util::ThreadPool *analysis_pool_;
  Config config_;

  std::map<TransferId, std::unique_ptr<boost::asio::steady_timer>> timers_;
};

} // namespace transfer
} // namespace discofill
