#include "protocol/parser.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace stagelink {

std::optional<Event> parseEvent(std::string_view line) {
  try {
    nlohmann::json j = nlohmann::json::parse(line);

    // Validate Required Fields
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
      DEBUG_DEBUG("Event record without a string type: " << line.substr(0, 80));
      return std::nullopt;
    }

    return j.get<Event>();

  } catch (const nlohmann::json::exception &e) {
    DEBUG_DEBUG("Skipping undecodable event line: " << e.what());
    return std::nullopt;
  }
}

std::optional<Registration> parseRegistration(const std::string &body) {
  try {
    nlohmann::json j = nlohmann::json::parse(body);

    // Validate required fields
    if (!j.contains("address") || !j.contains("stage") ||
        !j.contains("config_path") || !j.contains("pid") ||
        !j.contains("created_at")) {
      DEBUG_DEBUG("Missing required fields in registration record");
      return std::nullopt;
    }

    Registration registration = j.get<Registration>();
    if (registration.address.empty()) {
      return std::nullopt;
    }
    return registration;

  } catch (const nlohmann::json::exception &e) {
    DEBUG_ERROR("Registration parsing error: " << e.what());
    return std::nullopt;
  }
}

std::string encodeEvent(const Event &event) {
  nlohmann::json j = event;
  // Engine payloads are not guaranteed to be valid UTF-8
  std::string line =
      j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  line += '\n';
  return line;
}

} // namespace stagelink
