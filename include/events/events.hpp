#pragma once
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/types.h>

namespace stagelink {

// Identifies one deployable unit: a project configuration plus a stage name.
struct StageKey {
  std::string config_path;
  std::string stage;

  bool operator==(const StageKey &) const = default;
};

// A daemon's entry in the registry.
struct Registration {
  StageKey key;
  std::string address; // host:port of the daemon's HTTP listener
  pid_t pid = 0;
  std::chrono::time_point<std::chrono::system_clock> created_at;
};

// A deployment event. The payload is opaque to everything but the engine
// producing it and the handler consuming it.
struct Event {
  std::string type;
  nlohmann::json payload;
  uint64_t seq = 0; // assigned by the hub at publish time
};

// JSON conversion functions for StageKey
inline void to_json(nlohmann::json &j, const StageKey &k) {
  j = nlohmann::json{{"config_path", k.config_path}, {"stage", k.stage}};
}

inline void from_json(const nlohmann::json &j, StageKey &k) {
  j.at("config_path").get_to(k.config_path);
  j.at("stage").get_to(k.stage);
}

// JSON conversion functions for Registration
inline void to_json(nlohmann::json &j, const Registration &r) {
  j = nlohmann::json{
      {"config_path", r.key.config_path},
      {"stage", r.key.stage},
      {"address", r.address},
      {"pid", static_cast<int64_t>(r.pid)},
      {"created_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                         r.created_at.time_since_epoch())
                         .count()}};
}

inline void from_json(const nlohmann::json &j, Registration &r) {
  j.at("config_path").get_to(r.key.config_path);
  j.at("stage").get_to(r.key.stage);
  j.at("address").get_to(r.address);
  r.pid = static_cast<pid_t>(j.at("pid").get<int64_t>());

  int64_t created_ms = j.at("created_at");
  r.created_at = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(created_ms));
}

// JSON conversion functions for Event
inline void to_json(nlohmann::json &j, const Event &e) {
  j = nlohmann::json{{"type", e.type}, {"payload", e.payload}, {"seq", e.seq}};
}

// Records without a "payload" member carry their fields inline next to
// "type"; those fields become the payload.
inline void from_json(const nlohmann::json &j, Event &e) {
  j.at("type").get_to(e.type);
  e.seq = j.contains("seq") ? j.at("seq").get<uint64_t>() : 0;

  if (j.contains("payload")) {
    e.payload = j.at("payload");
    return;
  }
  e.payload = nlohmann::json();
  for (const auto &[name, value] : j.items()) {
    if (name != "type" && name != "seq") {
      e.payload[name] = value;
    }
  }
}

} // namespace stagelink
