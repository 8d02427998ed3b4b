#pragma once
#include "events/events.hpp"
#include "utils/error_codes.hpp"
#include <cstddef>
#include <functional>
#include <string>

namespace stagelink {

// Turns an arbitrarily chunked newline-delimited byte stream into Events.
//
// Lines that do not decode are dropped inside the decoder; the caller only
// ever sees well-formed events, or a terminal error once a line grows past
// the configured maximum. After a terminal error every further feed() fails
// with the same error: the decoder cannot be restarted.
class LineDecoder {
public:
  using EventHandler = std::function<void(Event &&)>;

  LineDecoder(size_t max_line_bytes, EventHandler on_event);

  Result<void> feed(const char *data, size_t length);

  // Flushes a final line that was not newline-terminated
  Result<void> finish();

  size_t deliveredCount() const noexcept { return delivered_; }
  size_t skippedCount() const noexcept { return skipped_; }

private:
  Result<void> emitLine();

  size_t max_line_bytes_;
  EventHandler on_event_;
  std::string pending_;
  size_t delivered_ = 0;
  size_t skipped_ = 0;
  bool failed_ = false;
};

} // namespace stagelink
