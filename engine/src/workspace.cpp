#include <fnexec/engine/workspace.hpp>

#include <fnexec/common/exceptions.hpp>
#include <fnexec/common/util.hpp>
#include <fnexec/common/uuid.hpp>
#include <fnexec/engine/response.hpp>
#include <fnexec/engine/runtime.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>

#include <sys/stat.h>

#include <fmt/format.h>

namespace fnexec::engine {

  namespace {

    std::shared_ptr<spdlog::logger> logger()
    {
      static auto instance = common::util::create_logger("Workspace");
      return instance;
    }

    void write_file(const std::filesystem::path& path, std::string_view content)
    {
      std::ofstream out{path, std::ios::binary | std::ios::trunc};
      if (!out.is_open()) {
        throw common::ProvisioningError{
            fmt::format("Could not create file {}, reason: {}", path.string(), strerror(errno))};
      }

      out.write(content.data(), static_cast<std::streamsize>(content.size()));
      out.close();
      if (out.fail()) {
        throw common::ProvisioningError{fmt::format("Could not write file {}", path.string())};
      }
    }

  } // namespace

  Workspace::Workspace(
      std::filesystem::path directory, const runtime::RuntimeAdapter& adapter,
      std::string handler_name
  )
      : _directory(std::move(directory)), _adapter(&adapter), _handler_name(std::move(handler_name))
  {
  }

  Workspace::Workspace(Workspace&& other) noexcept
      : _directory(std::move(other._directory)), _adapter(other._adapter),
        _handler_name(std::move(other._handler_name)), _reaped(other._reaped)
  {
    other._reaped = true;
  }

  Workspace& Workspace::operator=(Workspace&& other) noexcept
  {
    if (this != &other) {
      reap();
      _directory = std::move(other._directory);
      _adapter = other._adapter;
      _handler_name = std::move(other._handler_name);
      _reaped = other._reaped;
      other._reaped = true;
    }
    return *this;
  }

  Workspace::~Workspace()
  {
    reap();
  }

  Workspace Workspace::provision(
      const std::filesystem::path& root, const runtime::RuntimeAdapter& adapter,
      std::string_view code, const Json::Value& event, std::string_view handler_name,
      common::UUID& ids
  )
  {
    std::filesystem::path directory;
    for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS && directory.empty(); ++attempt) {

      auto candidate = root / fmt::format("{}{}", DIRECTORY_PREFIX, ids.generate_str());

      // mkdir fails with EEXIST instead of reusing an existing directory.
      if (mkdir(candidate.c_str(), S_IRWXU) == 0) {
        directory = std::move(candidate);
      } else if (errno != EEXIST) {
        throw common::ProvisioningError{fmt::format(
            "Could not create workspace under {}, reason: {}", root.string(), strerror(errno)
        )};
      }
    }

    if (directory.empty()) {
      throw common::ProvisioningError{
          fmt::format("Could not allocate a unique workspace name under {}", root.string())};
    }

    // From here on, the destructor removes the directory if anything fails.
    Workspace workspace{std::move(directory), adapter, std::string{handler_name}};

    write_file(workspace.source_path(), code);
    write_file(workspace.runner_path(), adapter.render_runner(handler_name));
    write_file(
        workspace.event_path(),
        json::write(event.isNull() ? Json::Value{Json::objectValue} : event)
    );

    SPDLOG_LOGGER_DEBUG(logger(), "Provisioned workspace {}", workspace.directory().string());

    return workspace;
  }

  void Workspace::reap() noexcept
  {
    if (_reaped) {
      return;
    }
    _reaped = true;

    std::error_code ec;
    std::filesystem::remove_all(_directory, ec);
    if (ec) {
      logger()->warn("Could not remove workspace {}, reason: {}", _directory.string(), ec.message());
    } else {
      SPDLOG_LOGGER_DEBUG(logger(), "Removed workspace {}", _directory.string());
    }
  }

  std::filesystem::path Workspace::source_path() const
  {
    return _directory / _adapter->source_file();
  }

  std::filesystem::path Workspace::runner_path() const
  {
    return _directory / _adapter->runner_file();
  }

  std::filesystem::path Workspace::event_path() const
  {
    return _directory / EVENT_FILE;
  }

} // namespace fnexec::engine
