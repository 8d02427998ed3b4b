#pragma once
#include <cstddef>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

struct ClientConfig {
  // Daemon startup
  std::string daemon_executable; // empty = re-invoke the running executable
  std::vector<std::string> daemon_arguments; // extra flags before "server"
  int poll_interval_ms;
  int registration_timeout_ms;

  // Self-healing reconnect
  int max_connect_attempts;
  int retry_backoff_ms;

  // Stream settings
  int connection_timeout_seconds;
  int read_timeout_seconds;
  size_t max_line_bytes;

  ClientConfig(const std::string& configFile = "client.json") {
    // Set defaults
    daemon_executable = "";
    poll_interval_ms = 100;
    registration_timeout_ms = 30000;
    max_connect_attempts = 3;
    retry_backoff_ms = 200;
    connection_timeout_seconds = 2;
    read_timeout_seconds = 60;
    max_line_bytes = 100 * 1024 * 1024;

    // Try to load from config file
    std::ifstream file(configFile);
    if (file.is_open()) {
      try {
        nlohmann::json config;
        file >> config;

        if (config.contains("daemon_executable")) daemon_executable = config["daemon_executable"];
        if (config.contains("daemon_arguments")) daemon_arguments = config["daemon_arguments"].get<std::vector<std::string>>();
        if (config.contains("poll_interval_ms")) poll_interval_ms = config["poll_interval_ms"];
        if (config.contains("registration_timeout_ms")) registration_timeout_ms = config["registration_timeout_ms"];
        if (config.contains("max_connect_attempts")) max_connect_attempts = config["max_connect_attempts"];
        if (config.contains("retry_backoff_ms")) retry_backoff_ms = config["retry_backoff_ms"];
        if (config.contains("connection_timeout_seconds")) connection_timeout_seconds = config["connection_timeout_seconds"];
        if (config.contains("read_timeout_seconds")) read_timeout_seconds = config["read_timeout_seconds"];
        if (config.contains("max_line_bytes")) max_line_bytes = config["max_line_bytes"];

        validate();
      } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load config from " + configFile + ": " + e.what());
      }
    } else {
      validate();
    }
  }

  void validate() const {
    if (poll_interval_ms < 1) {
      throw std::invalid_argument("Invalid poll_interval_ms: " + std::to_string(poll_interval_ms) + ". Must be >= 1");
    }

    if (registration_timeout_ms < poll_interval_ms) {
      throw std::invalid_argument("Invalid registration_timeout_ms: " + std::to_string(registration_timeout_ms) + ". Must be >= poll_interval_ms (" + std::to_string(poll_interval_ms) + ")");
    }

    if (max_connect_attempts < 1) {
      throw std::invalid_argument("Invalid max_connect_attempts: " + std::to_string(max_connect_attempts) + ". Must be >= 1");
    }

    if (retry_backoff_ms < 0) {
      throw std::invalid_argument("Invalid retry_backoff_ms: " + std::to_string(retry_backoff_ms) + ". Must be >= 0");
    }

    if (connection_timeout_seconds < 1) {
      throw std::invalid_argument("Invalid connection_timeout_seconds: " + std::to_string(connection_timeout_seconds) + ". Must be >= 1");
    }

    if (read_timeout_seconds < 1) {
      throw std::invalid_argument("Invalid read_timeout_seconds: " + std::to_string(read_timeout_seconds) + ". Must be >= 1");
    }

    if (max_line_bytes < 64) {
      throw std::invalid_argument("Invalid max_line_bytes: " + std::to_string(max_line_bytes) + ". Must be >= 64");
    }
  }
};
