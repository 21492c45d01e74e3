#ifndef FNEXEC_ENGINE_CONFIG_HPP
#define FNEXEC_ENGINE_CONFIG_HPP

#include <fnexec/engine/runtime.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace fnexec::engine::config {

  // Interpreter overrides per runtime; empty means the adapter's own candidates.
  struct Interpreters {

    std::string javascript;
    std::string typescript;
    std::string python;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();

    const std::string& get(runtime::Runtime runtime) const;
  };

  struct Engine {

    static constexpr int DEFAULT_TIMEOUT_MS = 7000;
    static constexpr int DEFAULT_MAX_TIMEOUT_MS = 60000;
    static constexpr uint64_t DEFAULT_MAX_LOG_BYTES = 1024 * 1024;
    static constexpr int DEFAULT_WORKERS = 8;
    static constexpr char DEFAULT_ISOLATION[] = "process";

    static constexpr char ENV_WORKSPACE_ROOT[] = "FNEXEC_WORKSPACE_ROOT";
    static constexpr char ENV_TIMEOUT_MS[] = "FNEXEC_TIMEOUT_MS";
    static constexpr char ENV_PYTHON_BIN[] = "PYTHON_BIN";

    // Empty: the system's temporary directory.
    std::string workspace_root;
    int default_timeout_ms;
    int max_timeout_ms;
    uint64_t max_log_bytes;
    int workers;
    std::string isolation;
    Interpreters interpreters;

    Engine()
    {
      set_defaults();
    }

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
    void load_env();

    // Throws common::InvalidConfigurationError on inconsistent values.
    void validate() const;

    std::filesystem::path workspace_directory() const;

    std::chrono::milliseconds default_timeout() const
    {
      return std::chrono::milliseconds{default_timeout_ms};
    }

    std::chrono::milliseconds max_timeout() const
    {
      return std::chrono::milliseconds{max_timeout_ms};
    }
  };

  struct HTTPServer {

    static constexpr int DEFAULT_PORT = 8080;
    static constexpr int DEFAULT_THREADS = 2;
    static constexpr uint64_t DEFAULT_MAX_PAYLOAD_SIZE = 1024 * 1024;

    int port;
    int threads;
    uint64_t max_payload_size;

    HTTPServer()
    {
      set_defaults();
    }

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Config {

    bool verbose;
    HTTPServer http;
    Engine engine;

    Config()
    {
      set_defaults();
    }

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
    void load_env();

    // Every section and field is optional; environment overrides are not applied.
    static Config deserialize(std::istream& json_config);

    // Reads the file when a path is given, then applies the environment.
    static Config load_file(const std::string& path);
  };

} // namespace fnexec::engine::config

#endif
