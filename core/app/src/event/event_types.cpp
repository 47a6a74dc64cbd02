#include "agrovest/events/event_types.hpp"

namespace agrovest {

const char* toString(ConfirmationSource source) {
  switch (source) {
    case ConfirmationSource::Webhook:       return "webhook";
    case ConfirmationSource::Verify:        return "verify";
    case ConfirmationSource::AdminOverride: return "admin_override";
  }
  return "unknown";
}

}  // namespace agrovest
