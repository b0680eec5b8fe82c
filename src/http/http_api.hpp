#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include "facade/snap_service.hpp"

namespace httplib {
class Server;
} // namespace httplib

namespace devsnap::http {

// HTTP status for a service failure
int status_for(facade::ErrorKind kind);

// Operator-facing HTTP routes under a prefix (default /__snap):
//   GET  /sessions?active=1&activeMs=N
//   POST /dump         {sid, types?, waitMs?}
//   GET  /html|/console|/network|/screenshot?sid=&waitMs=
//   GET  /ping?sid=&waitMs=
class HttpApi {
public:
    HttpApi(facade::SnapService& service, std::string route_prefix, int worker_threads);
    ~HttpApi();

    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;

    // Bind and serve on a background thread. Port 0 picks a free port.
    bool start(const std::string& host, int port);

    // Stop serving and join the listener thread. Idempotent.
    void stop();

    // Port actually bound, 0 before start()
    int port() const { return port_; }

    bool is_running() const { return running_; }

private:
    facade::SnapService& service_;
    std::string prefix_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    int port_ = 0;

    void register_routes();
};

} // namespace devsnap::http
