#ifndef FNEXEC_SERVING_SERVER_HPP
#define FNEXEC_SERVING_SERVER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include <BS_thread_pool.hpp>
#include <drogon/HttpTypes.h>
#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

namespace fnexec::engine {
  struct CancellationToken;
  struct Engine;

  namespace config {
    struct HTTPServer;
  } // namespace config
} // namespace fnexec::engine

namespace fnexec::serving {

  struct HttpServer : public drogon::HttpController<HttpServer, false>,
                      std::enable_shared_from_this<HttpServer> {
    using request_t = drogon::HttpRequestPtr;
    using callback_t = std::function<void(const drogon::HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(HttpServer::invoke, "/invoke", drogon::Post);
    // Used by the dashboard's test action.
    ADD_METHOD_TO(HttpServer::invoke, "/api/test", drogon::Post);
    ADD_METHOD_TO(HttpServer::health, "/health", drogon::Get);
    METHOD_LIST_END

    HttpServer(const engine::config::HTTPServer& cfg, engine::Engine& engine, int workers);

    void run();

    // Cancels in-flight invocations, waits for their responses and stops the event loop.
    void shutdown();
    void wait();

    void invoke(const request_t& request, callback_t&& callback);

    void health(const request_t& request, callback_t&& callback);

    static drogon::HttpResponsePtr
    json_response(const Json::Value& body, drogon::HttpStatusCode code = drogon::k200OK);

    int port() const
    {
      return _port;
    }

    // Number of invocations currently running on the pool.
    size_t in_flight() const;

  private:
    std::shared_ptr<engine::CancellationToken> _register();
    void _unregister(const std::shared_ptr<engine::CancellationToken>& token);
    void _cancel_all();

    int _port;
    int _threads;

    engine::Engine& _engine;
    BS::thread_pool _pool;

    mutable std::mutex _tokens_mutex;
    std::set<std::shared_ptr<engine::CancellationToken>> _tokens;
    std::atomic<bool> _stopping{false};

    std::shared_ptr<spdlog::logger> _logger;
    std::thread _server_thread;
  };

} // namespace fnexec::serving

#endif
