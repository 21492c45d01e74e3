#include <fnexec/common/exceptions.hpp>
#include <fnexec/engine/config.hpp>
#include <fnexec/engine/engine.hpp>
#include <fnexec/serving/server.hpp>

#include <csignal>
#include <iostream>
#include <memory>

#include <pthread.h>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char** argv)
{
  cxxopts::Options options("fnexec-serving", "HTTP front end of the function invocation engine.");
  options.add_options()("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""))(
      "p,port", "HTTP port, overrides the config.", cxxopts::value<int>()
  )("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))(
      "h,help", "Print usage."
  );

  fnexec::engine::config::Config cfg;
  bool verbose = false;
  try {
    auto parsed_options = options.parse(argc, argv);
    if (parsed_options.count("help")) {
      std::cout << options.help() << std::endl;
      return 0;
    }

    cfg = fnexec::engine::config::Config::load_file(parsed_options["config"].as<std::string>());
    if (parsed_options.count("port")) {
      cfg.http.port = parsed_options["port"].as<int>();
    }
    verbose = parsed_options["verbose"].as<bool>();

  } catch (fnexec::common::InvalidConfigurationError& exc) {
    spdlog::error("{}", exc.what());
    return 1;
  } catch (std::exception& exc) {
    // Malformed command line.
    spdlog::error("{}", exc.what());
    std::cerr << options.help() << std::endl;
    return 1;
  }

  if (cfg.verbose || verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing fnexec serving!");

  // Blocked in every thread started from here on; only the main thread waits for them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  std::unique_ptr<fnexec::engine::Engine> engine;
  try {
    engine = std::make_unique<fnexec::engine::Engine>(cfg.engine);
  } catch (fnexec::common::InvalidConfigurationError& exc) {
    spdlog::error("{}", exc.what());
    return 1;
  }

  auto server = std::make_shared<fnexec::serving::HttpServer>(cfg.http, *engine, cfg.engine.workers);
  server->run();

  int signal = 0;
  if (sigwait(&signals, &signal) != 0) {
    spdlog::error("Waiting for signals failed");
  } else {
    spdlog::info("Received signal {}", signal);
  }

  spdlog::info("fnexec serving is closing down");
  server->shutdown();
  server->wait();

  return 0;
}
