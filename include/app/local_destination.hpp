#ifndef DISCOFILL_APP_LOCAL_DESTINATION_HPP
#define DISCOFILL_APP_LOCAL_DESTINATION_HPP

#include "transfer/types.hpp"
#include <atomic>
#include <string>

namespace discofill {
namespace app {

/**
 * Destination used when running standalone: a completed download counts as
 * attached once the file is visible on disk. A missing file is retried
 * (the protocol may still be flushing it).
 */
class LocalFileDestination : public transfer::Destination {
public:
  explicit LocalFileDestination(std::string label);

  transfer::AttachResult AttachFile(const std::string &local_path) override;
  void TriggerAnalysis(const std::string &local_path) override;
  std::string Describe() const override { return label_; }

  int attached() const { return attached_; }

private:
  std::string label_;
  std::atomic<int> attached_{0};
};

} // namespace app
} // namespace discofill

#endif // DISCOFILL_APP_LOCAL_DESTINATION_HPP
