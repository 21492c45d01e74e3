#include <fnexec/common/exceptions.hpp>
#include <fnexec/engine/config.hpp>
#include <fnexec/engine/engine.hpp>
#include <fnexec/engine/invocation.hpp>
#include <fnexec/engine/response.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

namespace {

  constexpr int EXIT_USAGE = 2;

  std::optional<std::string> read_file(const std::string& path)
  {
    std::ifstream in_stream{path, std::ios::binary};
    if (!in_stream.is_open()) {
      spdlog::error("Could not open file {}", path);
      return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in_stream.rdbuf();
    return buffer.str();
  }

  int run(const cxxopts::Options& options, const cxxopts::ParseResult& parsed_options)
  {
    if (parsed_options.count("help")) {
      std::cout << options.help() << std::endl;
      return 0;
    }
    if (!parsed_options.count("runtime") || !parsed_options.count("file")) {
      spdlog::error("Both --runtime and --file are required");
      std::cerr << options.help() << std::endl;
      return EXIT_USAGE;
    }

    fnexec::engine::config::Config cfg;
    try {
      cfg = fnexec::engine::config::Config::load_file(parsed_options["config"].as<std::string>());
    } catch (fnexec::common::InvalidConfigurationError& exc) {
      spdlog::error("{}", exc.what());
      return EXIT_USAGE;
    }

    // Service logs go to stderr; stdout carries only the result.
    if (cfg.verbose || parsed_options["verbose"].as<bool>()) {
      spdlog::set_level(spdlog::level::debug);
    } else {
      spdlog::set_level(spdlog::level::warn);
    }

    fnexec::engine::InvocationRequest request;
    request.runtime = parsed_options["runtime"].as<std::string>();
    request.handler_name = parsed_options["handler"].as<std::string>();

    auto code = read_file(parsed_options["file"].as<std::string>());
    if (!code.has_value()) {
      return EXIT_USAGE;
    }
    request.code = std::move(code.value());

    std::string event_text = parsed_options["event-json"].as<std::string>();
    if (const auto& event_file = parsed_options["event"].as<std::string>(); !event_file.empty()) {
      auto text = read_file(event_file);
      if (!text.has_value()) {
        return EXIT_USAGE;
      }
      event_text = std::move(text.value());
    }
    if (!event_text.empty()) {
      std::string error;
      auto event = fnexec::engine::json::parse(event_text, &error);
      if (!event.has_value()) {
        spdlog::error("Event is not valid JSON: {}", error);
        return EXIT_USAGE;
      }
      request.event = std::move(event.value());
    }

    if (parsed_options.count("timeout")) {
      request.timeout = std::chrono::milliseconds{parsed_options["timeout"].as<int>()};
    }

    std::unique_ptr<fnexec::engine::Engine> engine;
    try {
      engine = std::make_unique<fnexec::engine::Engine>(cfg.engine);
    } catch (fnexec::common::InvalidConfigurationError& exc) {
      spdlog::error("{}", exc.what());
      return EXIT_USAGE;
    }

    auto outcome = engine->invoke(request);
    std::cout << fnexec::engine::json::write(fnexec::engine::to_json(outcome)) << std::endl;

    auto* result = std::get_if<fnexec::engine::ExecutionResult>(&outcome);
    return result != nullptr && result->ok() ? 0 : 1;
  }

} // namespace

int main(int argc, char** argv)
{
  cxxopts::Options options(
      "fnexec-invoke", "Run a single handler invocation and print the result."
  );
  options.add_options()("r,runtime", "Runtime of the handler.", cxxopts::value<std::string>())(
      "f,file", "Handler source file.", cxxopts::value<std::string>()
  )("e,event", "File with the JSON event.", cxxopts::value<std::string>()->default_value(""))(
      "event-json", "JSON event given inline.", cxxopts::value<std::string>()->default_value("")
  )("handler", "Name of the exported handler.",
    cxxopts::value<std::string>()->default_value("handler"))(
      "t,timeout", "Timeout in milliseconds.", cxxopts::value<int>()
  )("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""))(
      "v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false")
  )("h,help", "Print usage.");

  try {
    auto parsed_options = options.parse(argc, argv);
    return run(options, parsed_options);
  } catch (fnexec::common::FnexecException& exc) {
    spdlog::error("Invocation failed: {}", exc.what());
    return 1;
  } catch (std::exception& exc) {
    // Malformed command line.
    spdlog::error("{}", exc.what());
    std::cerr << options.help() << std::endl;
    return EXIT_USAGE;
  }
}
