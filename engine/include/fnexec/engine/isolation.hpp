#ifndef FNEXEC_ENGINE_ISOLATION_HPP
#define FNEXEC_ENGINE_ISOLATION_HPP

#include <memory>
#include <string_view>

namespace fnexec::engine {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Isolation applied to the interpreter process before it starts.
  ///
  /// apply() runs in the forked child, right before exec. Implementations may
  /// only use async-signal-safe calls; on failure they return false with errno
  /// set, and the spawn is reported as failed.
  ////////////////////////////////////////////////////////////////////////////////
  struct Isolation {

    virtual ~Isolation() = default;

    virtual std::string_view name() const = 0;

    virtual bool apply(const char* working_directory) const noexcept = 0;

    // Whether the child leads its own process group, so the whole group can be killed.
    virtual bool owns_process_group() const = 0;
  };

  // OS process boundary only: own session and process group, death signal when
  // the engine goes away, no stdin, workspace as working directory.
  // No namespaces, cgroups or seccomp filters.
  struct ProcessIsolation : Isolation {

    static constexpr std::string_view NAME = "process";

    std::string_view name() const override;

    bool apply(const char* working_directory) const noexcept override;

    bool owns_process_group() const override;
  };

  // Throws common::InvalidConfigurationError for unknown policies.
  std::unique_ptr<Isolation> make_isolation(std::string_view name);

} // namespace fnexec::engine

#endif
