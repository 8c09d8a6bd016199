#include "transfer/auto_matcher.hpp"
#include "transfer/session_router.hpp"
#include "transfer/transfer_registry.hpp"
#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include <algorithm>

namespace discofill {
namespace transfer {

AutoMatcher::AutoMatcher(boost::asio::io_context &io_context,
                         TransferRegistry &registry, SessionRouter &router,
                         util::ThreadPool *analysis_pool, const Config &config)
    : io_context_(io_context), registry_(registry), router_(router),
      analysis_pool_(analysis_pool), config_(config) {
  if (config_.max_attempts < 1) {
    config_.max_attempts = 1;
  }
}

AutoMatcher::~AutoMatcher() { CancelAll(); }

std::chrono::milliseconds AutoMatcher::BackoffDelay(const Config &config,
                                                    int attempt) {
  auto delay = config.base_delay;
  for (int i = 1; i < attempt && delay < config.max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, config.max_delay);
}

void AutoMatcher::Start(TransferId id) {
  auto transfer = registry_.Get(id);
  if (!transfer || transfer->state != TransferState::Completed) {
    LOG_XFER_WARN("AutoMatcher: transfer {} is not completed, not matching",
                  id);
    return;
  }

  registry_.Update(id, [](Transfer &t) {
    t.match_status = MatchStatus::Pending;
    t.match_attempts = 0;
  });
  publish(id);

  attempt(id);
}

void AutoMatcher::attempt(TransferId id) {
  timers_.erase(id);

  auto transfer = registry_.Get(id);
  if (!transfer) {
    LOG_XFER_DEBUG("AutoMatcher: transfer {} vanished from registry", id);
    return;
  }

  if (!transfer->destination) {
    finish(id, MatchStatus::Failed, "no destination");
    return;
  }

  const int attempt_no = transfer->match_attempts + 1;
  registry_.Update(id, [attempt_no](Transfer &t) { t.match_attempts = attempt_no; });

  AttachResult result = AttachResult::Fatal;
  try {
    result = transfer->destination->AttachFile(transfer->local_path);
  } catch (const std::exception &e) {
    LOG_XFER_ERROR("AutoMatcher: AttachFile threw for transfer {}: {}", id,
                   e.what());
    result = AttachResult::Fatal;
  }

  LOG_XFER_DEBUG("AutoMatcher: transfer {} attempt {}/{} -> {} ({})", id,
                 attempt_no, config_.max_attempts, ToString(result),
                 transfer->destination->Describe());

  switch (result) {
  case AttachResult::Success: {
    finish(id, MatchStatus::Success, "");
    if (config_.analysis_enabled && analysis_pool_) {
      auto destination = transfer->destination;
      auto path = transfer->local_path;
      if (!analysis_pool_->post([destination, path]() {
            destination->TriggerAnalysis(path);
          })) {
        LOG_XFER_DEBUG("AutoMatcher: analysis of {} skipped (pool stopped)",
                       path);
      }
    }
    return;
  }
  case AttachResult::Fatal:
    finish(id, MatchStatus::Failed, "destination rejected the file");
    return;
  case AttachResult::Retryable:
    break;
  }

  if (attempt_no >= config_.max_attempts) {
    finish(id, MatchStatus::Failed,
           "destination not ready after " + std::to_string(attempt_no) +
               " attempts");
    return;
  }

  publish(id);
  schedule_retry(id, attempt_no);
}

void AutoMatcher::schedule_retry(TransferId id, int attempts_made) {
  auto delay = BackoffDelay(config_, attempts_made);
  auto timer = std::make_unique<boost::asio::steady_timer>(io_context_);
  timer->expires_after(delay);
  timer->async_wait([this, id](const boost::system::error_code &ec) {
    if (ec) {
      return; // cancelled
    }
    attempt(id);
  });
  timers_[id] = std::move(timer);

  LOG_XFER_TRACE("AutoMatcher: retrying transfer {} in {} ms", id,
                 delay.count());
}

void AutoMatcher::finish(TransferId id, MatchStatus status,
                         const std::string &reason) {
  timers_.erase(id);
  registry_.Update(id, [status](Transfer &t) { t.match_status = status; });

  if (status == MatchStatus::Success) {
    LOG_XFER_INFO("AutoMatcher: transfer {} attached to its destination", id);
  } else {
    LOG_XFER_WARN("AutoMatcher: giving up on transfer {} ({}); file kept on disk",
                  id, reason);
  }
  publish(id);
}

void AutoMatcher::publish(TransferId id) {
  if (auto transfer = registry_.Get(id)) {
    router_.PublishTransfer(SessionEventType::MatchUpdate, *transfer);
  }
}

void AutoMatcher::CancelAll() {
  if (timers_.empty()) {
    return;
  }

  std::vector<TransferId> ids;
  for (auto &[id, timer] : timers_) {
    timer->cancel();
    ids.push_back(id);
  }
  timers_.clear();

  for (TransferId id : ids) {
    registry_.Update(id, [](Transfer &t) {
      if (t.match_status == MatchStatus::Pending) {
        t.match_status = MatchStatus::Failed;
      }
    });
  }
}

} // namespace transfer
} // namespace discofill
