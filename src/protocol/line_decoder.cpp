#include "protocol/line_decoder.hpp"
#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <cstring>
#include <utility>

namespace stagelink {

LineDecoder::LineDecoder(size_t max_line_bytes, EventHandler on_event)
    : max_line_bytes_(max_line_bytes), on_event_(std::move(on_event)) {}

Result<void> LineDecoder::feed(const char *data, size_t length) {
  if (failed_) {
    return Result<void>(ErrorCode::StreamOversizedLine,
                        "decoder already failed");
  }

  const char *cursor = data;
  const char *end = data + length;
  while (cursor < end) {
    const char *newline = static_cast<const char *>(
        std::memchr(cursor, '\n', static_cast<size_t>(end - cursor)));
    const char *segment_end = newline ? newline : end;
    size_t segment = static_cast<size_t>(segment_end - cursor);

    if (pending_.size() + segment > max_line_bytes_) {
      failed_ = true;
      pending_.clear();
      return Result<void>(ErrorCode::StreamOversizedLine,
                          "line longer than " +
                              std::to_string(max_line_bytes_) + " bytes");
    }
    pending_.append(cursor, segment);

    if (!newline) {
      break;
    }
    if (auto result = emitLine(); !result) {
      return result;
    }
    cursor = newline + 1;
  }
  return Result<void>();
}

Result<void> LineDecoder::finish() {
  if (failed_) {
    return Result<void>(ErrorCode::StreamOversizedLine,
                        "decoder already failed");
  }
  return emitLine();
}

Result<void> LineDecoder::emitLine() {
  std::string line = std::move(pending_);
  pending_.clear();

  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  // Blank lines are daemon keep-alives
  if (line.empty()) {
    return Result<void>();
  }

  if (auto event = parseEvent(line)) {
    ++delivered_;
    on_event_(std::move(*event));
  } else {
    ++skipped_;
    DEBUG_WARN(errorToString(ErrorCode::StreamMalformedEvent)
               << " (" << line.size() << " bytes), continuing");
  }
  return Result<void>();
}

} // namespace stagelink
