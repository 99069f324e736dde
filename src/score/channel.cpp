// Channel helpers.

#include "score/channel.h"

namespace engrave {

const char* channelKindToString(ChannelKind kind) {
  switch (kind) {
    case ChannelKind::Notes:           return "notes";
    case ChannelKind::RepeatsPrevious: return "repeats_previous";
  }
  return "unknown";
}

}  // namespace engrave
