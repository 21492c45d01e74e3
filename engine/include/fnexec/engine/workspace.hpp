#ifndef FNEXEC_ENGINE_WORKSPACE_HPP
#define FNEXEC_ENGINE_WORKSPACE_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <json/value.h>
#include <spdlog/spdlog.h>

namespace fnexec::common {
  class UUID;
} // namespace fnexec::common

namespace fnexec::engine {

  namespace runtime {
    struct RuntimeAdapter;
  } // namespace runtime

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Ephemeral directory owned by exactly one invocation.
  ///
  /// Holds the user's source, the generated runner and the serialized event.
  /// The directory is removed by reap() or, at the latest, by the destructor;
  /// removal happens once, tolerates a directory that is already gone and never
  /// throws.
  ////////////////////////////////////////////////////////////////////////////////
  struct Workspace {

    static constexpr std::string_view EVENT_FILE = "event.json";
    static constexpr std::string_view DIRECTORY_PREFIX = "fnexec-";
    static constexpr int MAX_NAME_ATTEMPTS = 16;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Creates a uniquely named directory under root and writes the three
    /// artifacts into it.
    ///
    /// The name is claimed with an atomic mkdir; a collision retries with a fresh
    /// random suffix. If writing an artifact fails, the directory is reaped before
    /// the error propagates.
    ///
    /// @throws common::ProvisioningError
    ////////////////////////////////////////////////////////////////////////////////
    static Workspace provision(
        const std::filesystem::path& root, const runtime::RuntimeAdapter& adapter,
        std::string_view code, const Json::Value& event, std::string_view handler_name,
        common::UUID& ids
    );

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    Workspace(Workspace&&) noexcept;
    Workspace& operator=(Workspace&&) noexcept;

    ~Workspace();

    void reap() noexcept;

    bool reaped() const
    {
      return _reaped;
    }

    const std::filesystem::path& directory() const
    {
      return _directory;
    }

    std::filesystem::path source_path() const;
    std::filesystem::path runner_path() const;
    std::filesystem::path event_path() const;

    const std::string& handler_name() const
    {
      return _handler_name;
    }

  private:
    Workspace(
        std::filesystem::path directory, const runtime::RuntimeAdapter& adapter,
        std::string handler_name
    );

    std::filesystem::path _directory;
    const runtime::RuntimeAdapter* _adapter;
    std::string _handler_name;
    bool _reaped = false;
  };

} // namespace fnexec::engine

#endif
