#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace agentlink {
namespace http {

namespace {
constexpr int kSocketTimeoutSeconds = 5;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;

constexpr const char *kAllowedMethods = "GET, POST, OPTIONS";
constexpr const char *kAllowedHeaders = "Content-Type";

bool wildcard_match(const std::string &pattern, const std::string &origin) {
    const auto star = pattern.find('*');
    if (star == std::string::npos) {
        return pattern == origin;
    }
    const std::string head = pattern.substr(0, star);
    const std::string tail = pattern.substr(star + 1);
    if (origin.size() < head.size() + tail.size()) {
        return false;
    }
    return origin.compare(0, head.size(), head) == 0 &&
           origin.compare(origin.size() - tail.size(), tail.size(), tail) == 0;
}
}  // namespace

std::optional<std::string> match_cors_origin(const std::vector<std::string> &allowed, const std::string &origin) {
    for (const auto &pattern : allowed) {
        if (pattern == "*") {
            return std::string("*");
        }
        if (wildcard_match(pattern, origin)) {
            return origin;
        }
    }
    return std::nullopt;
}

HttpServer::HttpServer(const runtime::HttpConfig &config, conversation::RequestCoordinator &coordinator,
                       conversation::ConversationStore &store, std::shared_ptr<events::EventStream> event_stream,
                       agent::AgentSupervisor *supervisor)
    : config_(config),
      coordinator_(coordinator),
      store_(store),
      event_stream_(std::move(event_stream)),
      supervisor_(supervisor),
      started_at_(std::chrono::steady_clock::now()) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kSocketTimeoutSeconds, 0);
    server_->set_write_timeout(kSocketTimeoutSeconds, 0);

    // SSE clients each pin a pool thread for the life of their stream
    const int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    install_cors();
    setup_routes();
    install_error_handlers();

    if (!bind(error)) {
        server_.reset();
        return false;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        if (!server_->listen_after_bind()) {
            LOG_ERROR("[HTTP] Listener on port " << port_ << " exited with an error");
        }
        LOG_DEBUG("[HTTP] Listener thread exiting");
    });

    LOG_INFO("[HTTP] Listening on " << config_.bind << ":" << port_);
    return true;
}

bool HttpServer::bind(std::string &error) {
    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind);
        if (port_ <= 0) {
            error = "Failed to bind an ephemeral port on " + config_.bind;
            return false;
        }
        return true;
    }

    if (!server_->bind_to_port(config_.bind, config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        return false;
    }
    port_ = config_.port;
    return true;
}

void HttpServer::install_cors() {
    const bool allow_credentials = config_.cors_allow_credentials;
    const std::vector<std::string> origins = config_.cors_allowed_origins;

    server_->set_post_routing_handler(
        [allow_credentials, origins](const httplib::Request &req, httplib::Response &res) {
            if (!req.has_header("Origin")) {
                return;
            }
            auto allowed = match_cors_origin(origins, req.get_header_value("Origin"));
            if (!allowed) {
                return;
            }
            res.set_header("Access-Control-Allow-Origin", *allowed);
            res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
            res.set_header("Access-Control-Allow-Headers", kAllowedHeaders);
            if (allow_credentials) {
                res.set_header("Access-Control-Allow-Credentials", "true");
            }
        });
}

void HttpServer::install_error_handlers() {
    // Bodyless errors (unrouted paths, httplib-level 400s) get the same JSON envelope as handler errors
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }
        nlohmann::json response;
        if (res.status == kStatusNotFound) {
            response = make_error_response(StatusCode::NOT_FOUND, "Route not found: " + req.method + " " + req.path);
        } else if (res.status == kStatusBadRequest) {
            response = make_error_response(StatusCode::INVALID_ARGUMENT, "Bad request");
        } else {
            response = make_error_response(StatusCode::INTERNAL, "Internal server error");
        }
        res.set_content(response.dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string message = "Unknown exception";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            message = e.what();
        } catch (...) {
            message = "Non-standard exception";
        }
        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " threw: " << message);
        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, message).dump(), "application/json");
    });
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    if (server_) {
        server_->stop();
    }
    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }
    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    using Handler = void (HttpServer::*)(const httplib::Request &, httplib::Response &);
    auto bind_handler = [this](Handler handler) {
        return [this, handler](const httplib::Request &req, httplib::Response &res) { (this->*handler)(req, res); };
    };

    server_->Post("/v0/conversation/messages", bind_handler(&HttpServer::handle_post_message));
    server_->Post("/v0/conversation/interrupt", bind_handler(&HttpServer::handle_post_interrupt));
    server_->Post("/v0/conversation/inbound", bind_handler(&HttpServer::handle_post_inbound));
    server_->Get("/v0/conversation/history", bind_handler(&HttpServer::handle_get_history));
    server_->Get("/v0/conversation/status", bind_handler(&HttpServer::handle_get_status));
    server_->Get("/v0/events", bind_handler(&HttpServer::handle_get_events));

    // CORS preflight for every route
    server_->Options(R"(/v0/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowedHeaders);
    });

    LOG_DEBUG("[HTTP] Routes: POST /v0/conversation/{messages,interrupt,inbound}, "
              "GET /v0/conversation/{history,status}, GET /v0/events");
}

}  // namespace http
}  // namespace agentlink
