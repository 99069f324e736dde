// One instrument's notation within a bar.

#ifndef ENGRAVE_SCORE_CHANNEL_H
#define ENGRAVE_SCORE_CHANNEL_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "notation/notation_token.h"

namespace engrave {

/// Content of a channel.
enum class ChannelKind : uint8_t {
  Notes,           ///< Decoded tokens.
  RepeatsPrevious  ///< '%': same content as this channel in the previous bar.
};

/// @brief Convert ChannelKind to human-readable string.
const char* channelKindToString(ChannelKind kind);

/// @brief A decoded channel of one bar.
struct Channel {
  ChannelKind kind = ChannelKind::Notes;
  std::vector<NotationToken> tokens;  ///< Empty for RepeatsPrevious.
  std::optional<std::string> lyric;
  std::string source;  ///< Notation text as given.
};

}  // namespace engrave

#endif  // ENGRAVE_SCORE_CHANNEL_H
