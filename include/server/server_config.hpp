#pragma once
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

struct ServerConfig {
  // Network settings
  std::string host;
  int port; // 0 = any free port, the registry tells clients which

  // Stream settings
  int subscriber_queue_capacity;
  int max_streams;
  int keepalive_interval_seconds;
  int write_timeout_seconds;

  // Lifetime
  int idle_timeout_seconds; // 0 = run until signalled or stopped

  ServerConfig(const std::string& configFile = "server.json") {
    // Set defaults
    host = "127.0.0.1";
    port = 0;
    subscriber_queue_capacity = 4096;
    max_streams = 64;
    keepalive_interval_seconds = 15;
    write_timeout_seconds = 5;
    idle_timeout_seconds = 0;

    // Try to load from config file
    std::ifstream file(configFile);
    if (file.is_open()) {
      try {
        nlohmann::json config;
        file >> config;

        if (config.contains("host")) host = config["host"];
        if (config.contains("port")) port = config["port"];
        if (config.contains("subscriber_queue_capacity")) subscriber_queue_capacity = config["subscriber_queue_capacity"];
        if (config.contains("max_streams")) max_streams = config["max_streams"];
        if (config.contains("keepalive_interval_seconds")) keepalive_interval_seconds = config["keepalive_interval_seconds"];
        if (config.contains("write_timeout_seconds")) write_timeout_seconds = config["write_timeout_seconds"];
        if (config.contains("idle_timeout_seconds")) idle_timeout_seconds = config["idle_timeout_seconds"];

        validate();
      } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load config from " + configFile + ": " + e.what());
      }
    } else {
      validate();
    }
  }

  void validate() const {
    if (port < 0 || port > 65535) {
      throw std::invalid_argument("Invalid port: " + std::to_string(port) + ". Must be 0-65535 (0 = auto-assign)");
    }

    if (subscriber_queue_capacity < 1) {
      throw std::invalid_argument("Invalid subscriber_queue_capacity: " + std::to_string(subscriber_queue_capacity) + ". Must be >= 1");
    }

    if (max_streams < 1) {
      throw std::invalid_argument("Invalid max_streams: " + std::to_string(max_streams) + ". Must be >= 1");
    }

    if (keepalive_interval_seconds < 1) {
      throw std::invalid_argument("Invalid keepalive_interval_seconds: " + std::to_string(keepalive_interval_seconds) + ". Must be >= 1");
    }

    if (write_timeout_seconds < 1) {
      throw std::invalid_argument("Invalid write_timeout_seconds: " + std::to_string(write_timeout_seconds) + ". Must be >= 1");
    }

    if (idle_timeout_seconds < 0) {
      throw std::invalid_argument("Invalid idle_timeout_seconds: " + std::to_string(idle_timeout_seconds) + ". Must be >= 0");
    }

    if (host.empty()) {
      throw std::invalid_argument("Host cannot be empty");
    }
  }
};
