#pragma once
#include "events/events.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace stagelink {

std::optional<Event> parseEvent(std::string_view line);
std::optional<Registration> parseRegistration(const std::string &body);

// One newline-terminated wire record
std::string encodeEvent(const Event &event);

} // namespace stagelink
