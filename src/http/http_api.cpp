#include "http/http_api.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <httplib.h>
#include <limits>

using json = nlohmann::json;

namespace devsnap::http {

namespace {

void send_error(httplib::Response& res, int status, facade::ErrorKind kind, const std::string& message) {
    json body;
    body["error"] = message;
    body["kind"] = facade::error_kind_to_string(kind);
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void send_result(httplib::Response& res, const facade::ServiceResult& result) {
    if (!result.success) {
        send_error(res, status_for(result.error_kind), result.error_kind, result.error);
        return;
    }

    res.status = 200;
    if (result.content_type == "application/json") {
        res.set_content(result.body.dump(), "application/json");
    } else {
        res.set_content(result.raw, result.content_type.c_str());
    }
}

// Optional integer query parameter; false if present but not a number
bool read_ms_param(const httplib::Request& req, const char* name, std::optional<int64_t>& out) {
    if (!req.has_param(name)) {
        return true;
    }
    try {
        size_t used = 0;
        std::string text = req.get_param_value(name);
        int64_t value = std::stoll(text, &used);
        if (used != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string sid_param(const httplib::Request& req) {
    return req.has_param("sid") ? req.get_param_value("sid") : std::string();
}

} // namespace

int status_for(facade::ErrorKind kind) {
    switch (kind) {
        case facade::ErrorKind::NONE:            return 200;
        case facade::ErrorKind::BAD_REQUEST:     return 400;
        case facade::ErrorKind::UNKNOWN_SESSION: return 404;
        case facade::ErrorKind::NOT_FOUND:       return 404;
        case facade::ErrorKind::TIMEOUT:         return 504;
        case facade::ErrorKind::AGENT_FAILURE:   return 502;
        case facade::ErrorKind::CHANNEL_CLOSED:  return 502;
        case facade::ErrorKind::SHUTDOWN:        return 503;
        case facade::ErrorKind::BAD_PAYLOAD:     return 500;
        case facade::ErrorKind::INTERNAL:        return 500;
    }
    return 500;
}

HttpApi::HttpApi(facade::SnapService& service, std::string route_prefix, int worker_threads)
    : service_(service), prefix_(std::move(route_prefix)), server_(std::make_unique<httplib::Server>()) {
    while (!prefix_.empty() && prefix_.back() == '/') {
        prefix_.pop_back();
    }

    size_t threads = worker_threads > 0 ? static_cast<size_t>(worker_threads) : 1;
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    register_routes();
}

HttpApi::~HttpApi() {
    stop();
}

void HttpApi::register_routes() {
    server_->Get(prefix_ + "/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<int64_t> active_ms;
        if (!read_ms_param(req, "activeMs", active_ms)) {
            send_error(res, 400, facade::ErrorKind::BAD_REQUEST, "activeMs must be a number");
            return;
        }
        bool active = req.has_param("active") && req.get_param_value("active") == "1";
        res.set_content(service_.list_sessions(active, active_ms).dump(), "application/json");
    });

    server_->Post(prefix_ + "/dump", [this](const httplib::Request& req, httplib::Response& res) {
        json body = json::object();
        if (!req.body.empty()) {
            try {
                body = json::parse(req.body);
            } catch (const std::exception& e) {
                send_error(res, 400, facade::ErrorKind::BAD_REQUEST, std::string("invalid JSON body: ") + e.what());
                return;
            }
        }
        if (!body.is_object()) {
            send_error(res, 400, facade::ErrorKind::BAD_REQUEST, "body must be a JSON object");
            return;
        }

        std::string sid = body.contains("sid") && body["sid"].is_string() ? body["sid"].get<std::string>() : "";

        std::optional<std::vector<std::string>> types;
        if (body.contains("types") && !body["types"].is_null()) {
            const auto& list = body["types"];
            if (!list.is_array()) {
                send_error(res, 400, facade::ErrorKind::BAD_REQUEST, "types must be an array");
                return;
            }
            types.emplace();
            for (const auto& item : list) {
                if (!item.is_string()) {
                    send_error(res, 400, facade::ErrorKind::BAD_REQUEST, "types must contain strings");
                    return;
                }
                types->push_back(item.get<std::string>());
            }
        }

        std::optional<int64_t> wait_ms;
        if (body.contains("waitMs") && !body["waitMs"].is_null()) {
            // Integers only: doubles such as 1e300 have no int64 value
            if (!body["waitMs"].is_number_integer()) {
                send_error(res, 400, facade::ErrorKind::BAD_REQUEST, "waitMs must be an integer");
                return;
            }
            if (body["waitMs"].is_number_unsigned() &&
                body["waitMs"].get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                send_error(res, 400, facade::ErrorKind::BAD_REQUEST, "waitMs out of range");
                return;
            }
            wait_ms = body["waitMs"].get<int64_t>();
        }

        send_result(res, service_.dump(sid, types, wait_ms));
    });

    using Shortcut = facade::ServiceResult (facade::SnapService::*)(const std::string&, std::optional<int64_t>);
    auto shortcut = [this](const std::string& path, Shortcut fn) {
        server_->Get(prefix_ + path, [this, fn](const httplib::Request& req, httplib::Response& res) {
            std::optional<int64_t> wait_ms;
            if (!read_ms_param(req, "waitMs", wait_ms)) {
                send_error(res, 400, facade::ErrorKind::BAD_REQUEST, "waitMs must be a number");
                return;
            }
            send_result(res, (service_.*fn)(sid_param(req), wait_ms));
        });
    };

    shortcut("/html", &facade::SnapService::dump_html);
    shortcut("/console", &facade::SnapService::dump_console);
    shortcut("/network", &facade::SnapService::dump_network);
    shortcut("/screenshot", &facade::SnapService::screenshot);
    shortcut("/ping", &facade::SnapService::ping);

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "internal error";
        try {
            if (ep) {
                std::rethrow_exception(ep);
            }
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "unknown exception";
        }
        spdlog::error("Unhandled error serving {} {}: {}", req.method, req.path, message);
        send_error(res, 500, facade::ErrorKind::INTERNAL, message);
    });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
    });
}

bool HttpApi::start(const std::string& host, int port) {
    if (running_) {
        return true;
    }

    if (port == 0) {
        port_ = server_->bind_to_any_port(host);
        if (port_ <= 0) {
            spdlog::error("Failed to bind HTTP API on {}", host);
            port_ = 0;
            return false;
        }
    } else {
        if (!server_->bind_to_port(host, port)) {
            spdlog::error("Failed to bind HTTP API on {}:{}", host, port);
            return false;
        }
        port_ = port;
    }

    running_ = true;
    listener_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            spdlog::debug("HTTP listener exited");
        }
        running_ = false;
    });

    spdlog::info("HTTP API listening on http://{}:{}{}", host, port_, prefix_);
    return true;
}

void HttpApi::stop() {
    if (server_) {
        server_->stop();
    }
    if (listener_.joinable()) {
        listener_.join();
    }
    running_ = false;
}

} // namespace devsnap::http
