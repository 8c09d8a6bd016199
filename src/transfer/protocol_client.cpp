#include "transfer/protocol_client.hpp"

namespace discofill {
namespace transfer {

const char *ToString(ProtocolEventType type) {
  switch (type) {
  case ProtocolEventType::Progress:
    return "progress";
  case ProtocolEventType::Completed:
    return "completed";
  case ProtocolEventType::Failed:
    return "failed";
  case ProtocolEventType::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

} // namespace transfer
} // namespace discofill
