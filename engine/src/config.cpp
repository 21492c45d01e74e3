#include <fnexec/engine/config.hpp>

#include <fnexec/common/exceptions.hpp>
#include <fnexec/common/util.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fnexec::engine::config {

  void Interpreters::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_optional_value(archive, "javascript", javascript);
    common::util::cereal_load_optional_value(archive, "typescript", typescript);
    common::util::cereal_load_optional_value(archive, "python", python);
  }

  void Interpreters::set_defaults()
  {
    javascript = "";
    typescript = "";
    python = "";
  }

  const std::string& Interpreters::get(runtime::Runtime runtime) const
  {
    switch (runtime) {
    case runtime::Runtime::JAVASCRIPT:
      return javascript;
    case runtime::Runtime::TYPESCRIPT:
      return typescript;
    case runtime::Runtime::PYTHON:
      return python;
    }
    throw common::NotSupportedError{
        fmt::format("No interpreter setting for runtime {}", static_cast<int>(runtime))};
  }

  void Engine::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_optional_value(archive, "workspace-root", workspace_root);
    common::util::cereal_load_optional_value(archive, "default-timeout-ms", default_timeout_ms);
    common::util::cereal_load_optional_value(archive, "max-timeout-ms", max_timeout_ms);
    common::util::cereal_load_optional_value(archive, "max-log-bytes", max_log_bytes);
    common::util::cereal_load_optional_value(archive, "workers", workers);
    common::util::cereal_load_optional_value(archive, "isolation", isolation);
    common::util::cereal_load_optional(archive, "interpreters", interpreters);
  }

  void Engine::set_defaults()
  {
    workspace_root = "";
    default_timeout_ms = DEFAULT_TIMEOUT_MS;
    max_timeout_ms = DEFAULT_MAX_TIMEOUT_MS;
    max_log_bytes = DEFAULT_MAX_LOG_BYTES;
    workers = DEFAULT_WORKERS;
    isolation = DEFAULT_ISOLATION;
    interpreters.set_defaults();
  }

  void Engine::load_env()
  {
    if (const char* root = std::getenv(ENV_WORKSPACE_ROOT); root != nullptr) {
      workspace_root = root;
    }

    if (const char* timeout = std::getenv(ENV_TIMEOUT_MS); timeout != nullptr) {

      std::string_view text{timeout};
      int value{};
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
      if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw common::InvalidConfigurationError{
            fmt::format("{} must be an integer, found: {}", ENV_TIMEOUT_MS, text)};
      }
      default_timeout_ms = value;
    }

    if (const char* python = std::getenv(ENV_PYTHON_BIN); python != nullptr && *python != '\0') {
      interpreters.python = python;
    }
  }

  void Engine::validate() const
  {
    if (default_timeout_ms <= 0) {
      throw common::InvalidConfigurationError{
          fmt::format("default-timeout-ms must be positive, found: {}", default_timeout_ms)};
    }
    if (max_timeout_ms < default_timeout_ms) {
      throw common::InvalidConfigurationError{fmt::format(
          "max-timeout-ms ({}) must not be lower than default-timeout-ms ({})", max_timeout_ms,
          default_timeout_ms
      )};
    }
    if (max_log_bytes == 0) {
      throw common::InvalidConfigurationError{"max-log-bytes must be positive"};
    }
    if (workers <= 0) {
      throw common::InvalidConfigurationError{
          fmt::format("workers must be positive, found: {}", workers)};
    }
  }

  std::filesystem::path Engine::workspace_directory() const
  {
    if (workspace_root.empty()) {
      return std::filesystem::temp_directory_path();
    }
    return std::filesystem::path{workspace_root};
  }

  void HTTPServer::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_optional_value(archive, "port", port);
    common::util::cereal_load_optional_value(archive, "threads", threads);
    common::util::cereal_load_optional_value(archive, "max-payload-size", max_payload_size);
  }

  void HTTPServer::set_defaults()
  {
    port = DEFAULT_PORT;
    threads = DEFAULT_THREADS;
    max_payload_size = DEFAULT_MAX_PAYLOAD_SIZE;
  }

  void Config::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_optional_value(archive, "verbose", verbose);
    common::util::cereal_load_optional(archive, "http", http);
    common::util::cereal_load_optional(archive, "engine", engine);
  }

  void Config::set_defaults()
  {
    verbose = false;
    http.set_defaults();
    engine.set_defaults();
  }

  void Config::load_env()
  {
    engine.load_env();
  }

  Config Config::deserialize(std::istream& json_config)
  {
    Config cfg;

    try {
      cereal::JSONInputArchive archive_in(json_config);
      cfg.load(archive_in);
    } catch (cereal::Exception& exc) {
      throw common::InvalidConfigurationError{
          fmt::format("Could not parse configuration, reason: {}", exc.what())};
    }

    cfg.engine.validate();
    return cfg;
  }

  Config Config::load_file(const std::string& path)
  {
    Config cfg;

    if (!path.empty()) {
      std::ifstream in_stream{path};
      if (!in_stream.is_open()) {
        throw common::InvalidConfigurationError{
            fmt::format("Could not open config file {}", path)};
      }
      cfg = deserialize(in_stream);
      spdlog::debug("Loaded configuration from {}", path);
    }

    cfg.load_env();
    cfg.engine.validate();
    return cfg;
  }

} // namespace fnexec::engine::config
