#include <fnexec/common/exceptions.hpp>
#include <fnexec/engine/config.hpp>
#include <fnexec/engine/isolation.hpp>

#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

using namespace fnexec::engine;

namespace {

  // Restores the variable when the test ends.
  struct ScopedEnv {

    ScopedEnv(const char* name, const char* value) : _name(name)
    {
      if (const char* prev = std::getenv(name); prev != nullptr) {
        _previous = prev;
      }
      setenv(name, value, 1);
    }

    ~ScopedEnv()
    {
      if (_previous.has_value()) {
        setenv(_name, _previous->c_str(), 1);
      } else {
        unsetenv(_name);
      }
    }

  private:
    const char* _name;
    std::optional<std::string> _previous;
  };

} // namespace

TEST(Config, Defaults)
{
  std::stringstream stream{"{}"};
  auto cfg = config::Config::deserialize(stream);

  EXPECT_FALSE(cfg.verbose);
  EXPECT_EQ(cfg.http.port, config::HTTPServer::DEFAULT_PORT);
  EXPECT_EQ(cfg.http.threads, config::HTTPServer::DEFAULT_THREADS);
  EXPECT_EQ(cfg.http.max_payload_size, config::HTTPServer::DEFAULT_MAX_PAYLOAD_SIZE);

  EXPECT_EQ(cfg.engine.default_timeout_ms, 7000);
  EXPECT_EQ(cfg.engine.max_timeout_ms, 60000);
  EXPECT_EQ(cfg.engine.max_log_bytes, 1024 * 1024);
  EXPECT_EQ(cfg.engine.workers, config::Engine::DEFAULT_WORKERS);
  EXPECT_EQ(cfg.engine.isolation, "process");
  EXPECT_TRUE(cfg.engine.workspace_root.empty());
  EXPECT_EQ(cfg.engine.workspace_directory(), std::filesystem::temp_directory_path());
  EXPECT_TRUE(cfg.engine.interpreters.python.empty());
}

TEST(Config, FullConfiguration)
{
  std::string config = R"(
    {
      "verbose": true,
      "http": {
        "port": 9000,
        "threads": 4,
        "max-payload-size": 2048
      },
      "engine": {
        "workspace-root": "/var/tmp",
        "default-timeout-ms": 1500,
        "max-timeout-ms": 3000,
        "max-log-bytes": 4096,
        "workers": 2,
        "isolation": "process",
        "interpreters": {
          "javascript": "/opt/node/bin/node",
          "typescript": "bun",
          "python": "python3.12 -X dev"
        }
      }
    }
  )";
  std::stringstream stream{config};
  auto cfg = config::Config::deserialize(stream);

  EXPECT_TRUE(cfg.verbose);
  EXPECT_EQ(cfg.http.port, 9000);
  EXPECT_EQ(cfg.http.threads, 4);
  EXPECT_EQ(cfg.http.max_payload_size, 2048);

  EXPECT_EQ(cfg.engine.workspace_directory(), std::filesystem::path{"/var/tmp"});
  EXPECT_EQ(cfg.engine.default_timeout(), std::chrono::milliseconds{1500});
  EXPECT_EQ(cfg.engine.max_timeout(), std::chrono::milliseconds{3000});
  EXPECT_EQ(cfg.engine.max_log_bytes, 4096);
  EXPECT_EQ(cfg.engine.workers, 2);
  EXPECT_EQ(cfg.engine.interpreters.get(runtime::Runtime::JAVASCRIPT), "/opt/node/bin/node");
  EXPECT_EQ(cfg.engine.interpreters.get(runtime::Runtime::TYPESCRIPT), "bun");
  EXPECT_EQ(cfg.engine.interpreters.get(runtime::Runtime::PYTHON), "python3.12 -X dev");
}

TEST(Config, PartialSections)
{
  std::string config = R"(
    {
      "engine": {
        "default-timeout-ms": 250,
        "interpreters": { "python": "/usr/bin/python3" }
      }
    }
  )";
  std::stringstream stream{config};
  auto cfg = config::Config::deserialize(stream);

  EXPECT_EQ(cfg.http.port, config::HTTPServer::DEFAULT_PORT);
  EXPECT_EQ(cfg.engine.default_timeout_ms, 250);
  EXPECT_EQ(cfg.engine.max_timeout_ms, config::Engine::DEFAULT_MAX_TIMEOUT_MS);
  EXPECT_EQ(cfg.engine.interpreters.python, "/usr/bin/python3");
  EXPECT_TRUE(cfg.engine.interpreters.javascript.empty());
}

TEST(Config, MalformedValues)
{
  {
    std::stringstream stream{R"({"http": {"port": "eighty"}})"};
    EXPECT_THROW(config::Config::deserialize(stream), fnexec::common::InvalidConfigurationError);
  }
  {
    std::stringstream stream{"{ not json"};
    EXPECT_THROW(config::Config::deserialize(stream), fnexec::common::InvalidConfigurationError);
  }
  {
    std::stringstream stream{R"({"engine": {"default-timeout-ms": 0}})"};
    EXPECT_THROW(config::Config::deserialize(stream), fnexec::common::InvalidConfigurationError);
  }
  {
    std::stringstream stream{R"({"engine": {"default-timeout-ms": 5000, "max-timeout-ms": 100}})"};
    EXPECT_THROW(config::Config::deserialize(stream), fnexec::common::InvalidConfigurationError);
  }
  {
    std::stringstream stream{R"({"engine": {"workers": 0}})"};
    EXPECT_THROW(config::Config::deserialize(stream), fnexec::common::InvalidConfigurationError);
  }
}

TEST(Config, MissingFile)
{
  EXPECT_THROW(
      config::Config::load_file("/nonexistent/fnexec.json"), fnexec::common::InvalidConfigurationError
  );
}

TEST(Config, EnvironmentOverrides)
{
  ScopedEnv root{config::Engine::ENV_WORKSPACE_ROOT, "/srv/workspaces"};
  ScopedEnv timeout{config::Engine::ENV_TIMEOUT_MS, "1234"};
  ScopedEnv python{config::Engine::ENV_PYTHON_BIN, "/opt/python/bin/python3"};

  auto cfg = config::Config::load_file("");

  EXPECT_EQ(cfg.engine.workspace_root, "/srv/workspaces");
  EXPECT_EQ(cfg.engine.default_timeout_ms, 1234);
  EXPECT_EQ(cfg.engine.interpreters.python, "/opt/python/bin/python3");
}

TEST(Config, InvalidTimeoutEnvironment)
{
  ScopedEnv timeout{config::Engine::ENV_TIMEOUT_MS, "7s"};
  EXPECT_THROW(config::Config::load_file(""), fnexec::common::InvalidConfigurationError);
}

TEST(Config, IsolationPolicies)
{
  auto isolation = make_isolation("process");
  ASSERT_NE(isolation, nullptr);
  EXPECT_EQ(isolation->name(), "process");
  EXPECT_TRUE(isolation->owns_process_group());

  EXPECT_THROW(make_isolation("firecracker"), fnexec::common::InvalidConfigurationError);
}
