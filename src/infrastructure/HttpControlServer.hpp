/**
 * @file HttpControlServer.hpp
 * @brief HTTP surface of the scheduler (cpp-httplib).
 */

#pragma once

#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
class Response;
}

namespace stenodesk::application {
class TranscriptionScheduler;
}

namespace stenodesk::infrastructure {

/**
 * @class HttpControlServer
 * @brief Maps JSON requests onto TranscriptionScheduler calls.
 *
 * Routes:
 *   GET    /api/health
 *   GET    /api/jobs                      POST /api/jobs {"media_path","name"}
 *   GET    /api/jobs/<id>                 DELETE /api/jobs/<id>
 *   POST   /api/jobs/<id>/transcribe      (blocks until the run settles)
 *   POST   /api/jobs/<id>/pause | resume | cancel
 *   GET    /api/jobs/<id>/progress
 *   GET    /api/jobs/<id>/export?format=vtt|srt|txt
 *   POST   /api/queue {"ids":[...]}
 *   POST   /api/stop-all
 */
class HttpControlServer {
public:
    explicit HttpControlServer(std::shared_ptr<application::TranscriptionScheduler> scheduler);
    ~HttpControlServer();

    HttpControlServer(const HttpControlServer&) = delete;
    HttpControlServer& operator=(const HttpControlServer&) = delete;

    /**
     * @brief Binds and serves on a background thread. Port 0 picks a free port, see port().
     * @return False if the port could not be bound.
     */
    bool start(const std::string& host, int port);

    void stop();

    int port() const { return m_port; }

    /** @brief HTTP status for a scheduler failure (404, 409, 499, 400, 500). */
    static int StatusFor(const std::exception& e);

private:
    void registerRoutes();
    static void SendError(httplib::Response& res, const std::exception& e);

    std::shared_ptr<application::TranscriptionScheduler> m_scheduler;
    std::unique_ptr<httplib::Server> m_server;
    std::thread m_thread;
    int m_port = 0;
};

} // namespace stenodesk::infrastructure
