#include "client/stream_client.hpp"
#include "protocol/line_decoder.hpp"
#include "utils/logging.hpp"
#include <atomic>
#include <charconv>
#include <httplib.h>

namespace stagelink {

StreamClient::StreamClient(const ClientConfig &config) : config_(config) {}

bool StreamClient::splitAddress(const std::string &address, std::string &host,
                                int &port) {
  auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 ||
      colon + 1 >= address.size()) {
    return false;
  }
  host = address.substr(0, colon);
  const char *begin = address.data() + colon + 1;
  const char *end = address.data() + address.size();
  auto [ptr, ec] = std::from_chars(begin, end, port);
  return ec == std::errc() && ptr == end && port > 0 && port <= 65535;
}

Result<void> StreamClient::read(const std::string &address,
                                std::stop_token stop,
                                const EventHandler &on_event) const {
  std::string host;
  int port = 0;
  if (!splitAddress(address, host, port)) {
    return Result<void>(ErrorCode::LaunchDaemonUnreachable,
                        "malformed address '" + address + "'");
  }
  if (stop.stop_requested()) {
    return Result<void>(ErrorCode::StreamCancelled);
  }

  httplib::Client client(host, port);
  client.set_connection_timeout(config_.connection_timeout_seconds, 0);
  // The daemon writes keep-alives well inside this window
  client.set_read_timeout(config_.read_timeout_seconds, 0);
  client.set_keep_alive(false);

  // Shutting the socket down unblocks the pending read immediately
  std::atomic<bool> cancelled{false};
  std::stop_callback on_stop(stop, [&client, &cancelled] {
    cancelled = true;
    client.stop();
  });

  bool established = false;
  int status = 0;
  Result<void> decoded;
  // Nothing is delivered once the caller has asked to stop
  LineDecoder decoder(config_.max_line_bytes,
                      [&on_event, &cancelled](Event &&event) {
                        if (!cancelled) {
                          on_event(event);
                        }
                      });

  DEBUG_INFO("Attaching to http://" << address << "/stream");
  auto res = client.Get(
      "/stream", httplib::Headers{{"Accept", "application/x-ndjson"}},
      [&](const httplib::Response &response) {
        status = response.status;
        if (response.status != 200 || cancelled) {
          return false;
        }
        established = true;
        DEBUG_INFO("Stream established with " << address);
        return true;
      },
      [&](const char *data, size_t length) {
        if (cancelled) {
          return false;
        }
        decoded = decoder.feed(data, length);
        return decoded.isSuccess();
      });

  if (cancelled || stop.stop_requested()) {
    DEBUG_INFO("Stream from " << address << " cancelled");
    return Result<void>(ErrorCode::StreamCancelled);
  }
  if (decoded.isError()) {
    LOG_ERROR("Stream from " << address << " aborted: "
                             << describeError(decoded));
    return decoded;
  }

  if (!established) {
    if (status == 503) {
      // Alive but at max_streams; the registration is still valid
      return Result<void>(ErrorCode::LaunchDaemonBusy, address);
    }
    if (status != 0) {
      // The port now belongs to something that is not our daemon
      DEBUG_WARN("Cannot attach to " << address << ": HTTP status " << status);
      return Result<void>(ErrorCode::LaunchDaemonUnreachable,
                          address + ": unexpected HTTP status " +
                              std::to_string(status));
    }
    if (res.error() == httplib::Error::Connection) {
      // Nothing listens there any more
      DEBUG_WARN("Cannot connect to " << address);
      return Result<void>(ErrorCode::LaunchDaemonUnreachable,
                          address + ": " + httplib::to_string(res.error()));
    }
    // Connected but no answer: a live daemon may just be slow
    return Result<void>(ErrorCode::StreamIOError,
                        address + ": no response (" +
                            httplib::to_string(res.error()) + ")");
  }

  if (!res) {
    return Result<void>(ErrorCode::StreamIOError,
                        address + ": " + httplib::to_string(res.error()));
  }

  if (auto tail = decoder.finish(); !tail) {
    return tail;
  }
  DEBUG_INFO("Stream from " << address << " ended after "
                            << decoder.deliveredCount() << " events ("
                            << decoder.skippedCount() << " skipped)");
  return Result<void>();
}

} // namespace stagelink
