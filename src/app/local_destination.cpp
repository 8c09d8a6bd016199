#include "app/local_destination.hpp"
#include "util/logging.hpp"
#include <filesystem>

namespace discofill {
namespace app {

LocalFileDestination::LocalFileDestination(std::string label)
    : label_(std::move(label)) {}

transfer::AttachResult
LocalFileDestination::AttachFile(const std::string &local_path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(local_path, ec)) {
    LOG_APP_WARN("{}: {} not on disk yet", label_, local_path);
    return transfer::AttachResult::Retryable;
  }
  ++attached_;
  LOG_APP_INFO("{}: attached {}", label_, local_path);
  return transfer::AttachResult::Success;
}

void LocalFileDestination::TriggerAnalysis(const std::string &local_path) {
  LOG_APP_INFO("{}: fingerprinting requested for {}", label_, local_path);
}

} // namespace app
} // namespace discofill
