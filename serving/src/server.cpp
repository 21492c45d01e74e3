#include <fnexec/serving/server.hpp>

#include <fnexec/common/exceptions.hpp>
#include <fnexec/common/util.hpp>
#include <fnexec/engine/cancellation.hpp>
#include <fnexec/engine/config.hpp>
#include <fnexec/engine/engine.hpp>
#include <fnexec/engine/invocation.hpp>
#include <fnexec/engine/response.hpp>
#include <fnexec/engine/runtime.hpp>

#include <drogon/HttpAppFramework.h>

namespace fnexec::serving {

  HttpServer::HttpServer(const engine::config::HTTPServer& cfg, engine::Engine& engine, int workers)
      : _port(cfg.port), _threads(cfg.threads), _engine(engine),
        _pool(static_cast<BS::concurrency_t>(workers))
  {
    _logger = common::util::create_logger("HttpServer");
    drogon::app().setClientMaxBodySize(cfg.max_payload_size);
  }

  void HttpServer::run()
  {
    _logger->info("Starting HTTP server at port {}", _port);
    drogon::app().disableSigtermHandling();
    drogon::app().registerController(shared_from_this());
    drogon::app().setThreadNum(_threads);
    _server_thread = std::thread{[this]() { drogon::app().addListener("0.0.0.0", _port).run(); }};
  }

  void HttpServer::shutdown()
  {
    if (_stopping.exchange(true)) {
      return;
    }

    _logger->info("Stopping HTTP server, cancelling {} invocations", in_flight());
    _cancel_all();
    _pool.wait();

    if (drogon::app().isRunning()) {
      drogon::app().getLoop()->queueInLoop([]() { drogon::app().quit(); });
    }
  }

  void HttpServer::wait()
  {
    if (_server_thread.joinable()) {
      _server_thread.join();
    }
    _logger->info("Stopped HTTP server");
  }

  drogon::HttpResponsePtr
  HttpServer::json_response(const Json::Value& body, drogon::HttpStatusCode code)
  {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(code);
    return resp;
  }

  void HttpServer::invoke(const request_t& request, callback_t&& callback)
  {
    auto body = engine::json::parse(request->getBody());
    if (!body.has_value()) {
      callback(json_response(
          engine::to_json(engine::ValidationError{"Invalid JSON body"}), drogon::k400BadRequest
      ));
      return;
    }

    auto parsed = engine::parse_request(body.value());
    if (auto* error = std::get_if<engine::ValidationError>(&parsed)) {
      callback(json_response(engine::to_json(*error), drogon::k400BadRequest));
      return;
    }

    // Invocations block for up to their timeout, never on the event loop.
    _pool.detach_task([this, invocation = std::get<engine::InvocationRequest>(std::move(parsed)),
                       callback = std::move(callback)]() {
      std::shared_ptr<engine::CancellationToken> token;
      try {
        token = _register();
      } catch (common::FnexecException& exc) {
        _logger->error("Could not start invocation, reason: {}", exc.what());
        callback(json_response(
            engine::to_json(engine::ValidationError{exc.what()}), drogon::k500InternalServerError
        ));
        return;
      }

      auto outcome = _engine.invoke(invocation, token.get());
      _unregister(token);

      drogon::HttpStatusCode code = std::visit(
          common::util::overloaded{
              [](const engine::ExecutionResult& result) {
                return result.ok() ? drogon::k200OK : drogon::k500InternalServerError;
              },
              [](const engine::ValidationError&) { return drogon::k400BadRequest; }},
          outcome
      );
      callback(json_response(engine::to_json(outcome), code));
    });
  }

  void HttpServer::health(const request_t&, callback_t&& callback)
  {
    Json::Value json;
    json["status"] = "healthy";
    json["isolation"] = std::string{_engine.isolation().name()};

    Json::Value runtimes{Json::objectValue};
    for (engine::runtime::Runtime rt : engine::runtime::RUNTIMES) {

      const auto& interpreter = _engine.interpreter(rt);
      Json::Value entry;
      entry["available"] = interpreter.has_value();
      entry["interpreter"] =
          interpreter.has_value() ? Json::Value{interpreter->executable} : Json::Value{};
      runtimes[engine::runtime::runtime_to_string(rt)] = std::move(entry);
    }
    json["runtimes"] = std::move(runtimes);

    callback(json_response(json));
  }

  size_t HttpServer::in_flight() const
  {
    std::lock_guard<std::mutex> lock{_tokens_mutex};
    return _tokens.size();
  }

  std::shared_ptr<engine::CancellationToken> HttpServer::_register()
  {
    auto token = std::make_shared<engine::CancellationToken>();
    {
      std::lock_guard<std::mutex> lock{_tokens_mutex};
      _tokens.insert(token);
    }

    // Shutdown may have started before we registered.
    if (_stopping.load()) {
      token->cancel();
    }
    return token;
  }

  void HttpServer::_unregister(const std::shared_ptr<engine::CancellationToken>& token)
  {
    std::lock_guard<std::mutex> lock{_tokens_mutex};
    _tokens.erase(token);
  }

  void HttpServer::_cancel_all()
  {
    std::lock_guard<std::mutex> lock{_tokens_mutex};
    for (const auto& token : _tokens) {
      token->cancel();
    }
  }

} // namespace fnexec::serving
