#include "server.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <event2/buffer.h>
#include <event2/event.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <event2/thread.h>

#include <fcntl.h>
#include <unistd.h>

#include <csignal>
#include <cerrno>
#include <cstring>

namespace {
    const char* reason_phrase(int status) {
        switch (status) {
            case 200: return "OK";
            case 302: return "Found";
            case 400: return "Bad Request";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 500: return "Internal Server Error";
            case 503: return "Service Unavailable";
            default: return "";
        }
    }

    const char* method_name(enum evhttp_cmd_type type) {
        switch (type) {
            case EVHTTP_REQ_GET: return "GET";
            case EVHTTP_REQ_HEAD: return "HEAD";
            case EVHTTP_REQ_POST: return "POST";
            case EVHTTP_REQ_PUT: return "PUT";
            case EVHTTP_REQ_DELETE: return "DELETE";
            case EVHTTP_REQ_OPTIONS: return "OPTIONS";
            default: return "OTHER";
        }
    }

    Response text_response(int status, const std::string& message) {
        BufferedResponder responder;
        responder.send_text(status, message);
        return responder.take();
    }

    bool add_headers(struct evkeyvalq* headers, const Response& response) {
        if (evhttp_add_header(headers, "Server", "pkgcdn/" PKGCDN_VERSION) != 0) return false;
        for (const auto& [name, value] : response.headers) {
            if (evhttp_add_header(headers, name.c_str(), value.c_str()) != 0) {
                log_error(string_format("error.bad_header", name, value));
                return false;
            }
        }
        return true;
    }
}

void EventBaseDeleter::operator()(struct event_base* base) const {
    if (base) event_base_free(base);
}

void EvhttpDeleter::operator()(struct evhttp* http) const {
    if (http) evhttp_free(http);
}

void EventDeleter::operator()(struct event* ev) const {
    if (ev) event_free(ev);
}

CdnServer::CdnServer(const CdnConfig& config, const RequestHandler& handler)
    : config_(config), handler_(handler) {
    // Workers post completed responses back into the loop.
    if (evthread_use_pthreads() != 0) {
        throw PkgcdnException(get_string("error.event_threads_failed"));
    }

    base_.reset(event_base_new());
    if (!base_) {
        throw PkgcdnException(get_string("error.event_base_failed"));
    }

    http_.reset(evhttp_new(base_.get()));
    if (!http_) {
        throw PkgcdnException(get_string("error.evhttp_failed"));
    }
    evhttp_set_gencb(http_.get(), &CdnServer::on_request, this);
    evhttp_set_timeout(http_.get(), static_cast<int>(config_.request_timeout));

    for (int signum : {SIGINT, SIGTERM}) {
        std::unique_ptr<struct event, EventDeleter> ev(evsignal_new(base_.get(), signum, &CdnServer::on_signal, this));
        if (!ev || event_add(ev.get(), nullptr) != 0) {
            throw PkgcdnException(get_string("error.signal_setup_failed"));
        }
        signal_events_.push_back(std::move(ev));
    }
}

CdnServer::~CdnServer() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    // Flush completions the workers posted before they exited.
    if (base_) event_base_loop(base_.get(), EVLOOP_NONBLOCK);
    queue_.clear();
}

std::optional<std::string> CdnServer::strip_mount_path(const std::string& mount_path, const std::string& uri) {
    std::string mount = mount_path;
    while (mount.size() > 1 && mount.back() == '/') mount.pop_back();
    if (mount == "/") return uri;

    if (uri.compare(0, mount.size(), mount) != 0) return std::nullopt;
    std::string rest = uri.substr(mount.size());
    if (rest.empty() || rest[0] == '?') return "/" + rest;
    if (rest[0] != '/') return std::nullopt;
    return rest;
}

void CdnServer::run() {
    if (!evhttp_bind_socket_with_handle(http_.get(), config_.bind_address.c_str(), static_cast<ev_uint16_t>(config_.port))) {
        throw PkgcdnException(string_format("error.bind_failed", config_.bind_address, config_.port, std::strerror(errno)));
    }

    for (int i = 0; i < config_.workers; ++i) {
        workers_.emplace_back(&CdnServer::worker_loop, this);
    }

    log_info(string_format("info.server_listening", config_.bind_address, config_.port, config_.registry_url));
    if (event_base_dispatch(base_.get()) < 0) {
        throw PkgcdnException(get_string("error.event_loop_failed"));
    }
    log_info(get_string("info.server_stopped"));
}

void CdnServer::stop() {
    if (base_) event_base_loopbreak(base_.get());
}

void CdnServer::on_request(struct evhttp_request* req, void* arg) {
    static_cast<CdnServer*>(arg)->dispatch(req);
}

void CdnServer::on_signal(int, short, void* arg) {
    log_info(get_string("info.shutdown_signal"));
    static_cast<CdnServer*>(arg)->stop();
}

void CdnServer::on_complete(int, short, void* arg) {
    std::unique_ptr<PendingRequest> pending(static_cast<PendingRequest*>(arg));
    pending->server->reply(pending->req, pending->method, pending->request.original_url, pending->response);
}

void CdnServer::dispatch(struct evhttp_request* req) {
    const std::string method = method_name(evhttp_request_get_command(req));
    const char* raw_uri = evhttp_request_get_uri(req);
    const std::string uri = raw_uri ? raw_uri : "";

    if (method != "GET" && method != "HEAD") {
        Response response = text_response(405, "Method not allowed");
        response.headers.emplace_back("Allow", "GET, HEAD");
        reply(req, method, uri, response);
        return;
    }

    auto url = strip_mount_path(config_.mount_path, uri);
    if (!url) {
        Response response = text_response(404, "Not found: " + uri);
        reply(req, method, uri, response);
        return;
    }

    auto pending = std::make_unique<PendingRequest>();
    pending->server = this;
    pending->req = req;
    pending->method = method;
    pending->request = Request{*url, uri};
    {
        std::lock_guard<std::mutex> lock(mtx_);
        queue_.push_back(std::move(pending));
    }
    cv_.notify_one();
}

void CdnServer::worker_loop() {
    while (true) {
        std::unique_ptr<PendingRequest> pending;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) return;
            pending = std::move(queue_.front());
            queue_.pop_front();
        }

        BufferedResponder responder;
        try {
            handler_.handle(pending->request, responder);
        } catch (const std::exception& e) {
            if (!responder.sent()) responder.send_server_error(e.what());
            else log_error(e.what());
        }
        if (!responder.sent()) {
            responder.send_server_error(string_format("error.no_response", pending->request.original_url));
        }
        pending->response = responder.take();
        complete(std::move(pending));
    }
}

void CdnServer::complete(std::unique_ptr<PendingRequest> pending) {
    struct timeval now = {0, 0};
    PendingRequest* raw = pending.release();
    if (event_base_once(base_.get(), -1, EV_TIMEOUT, &CdnServer::on_complete, raw, &now) != 0) {
        log_error(string_format("error.post_completion_failed", raw->request.original_url));
        delete raw;
    }
}

void CdnServer::reply(struct evhttp_request* req, const std::string& method, const std::string& uri, Response& response) {
    struct evbuffer* buf = evbuffer_new();
    if (!buf) {
        log_error(get_string("error.evbuffer_failed"));
        evhttp_send_error(req, 500, nullptr);
        return;
    }

    if (response.file) {
        bool added = false;
        int fd = open(response.file->c_str(), O_RDONLY);
        if (fd >= 0) {
            struct evbuffer_file_segment* seg = evbuffer_file_segment_new(fd, 0, response.file_size, EVBUF_FS_CLOSE_ON_FREE);
            if (seg) {
                added = evbuffer_add_file_segment(buf, seg, 0, -1) == 0;
                evbuffer_file_segment_free(seg);
            } else {
                close(fd);
            }
        }
        if (!added) {
            log_error(string_format("error.open_file_failed", response.file->string()));
            response = text_response(500, "Server error");
        }
    }

    struct evkeyvalq* headers = evhttp_request_get_output_headers(req);
    if (!add_headers(headers, response)) {
        // evhttp refuses values containing CR or LF.
        evhttp_clear_headers(headers);
        evbuffer_drain(buf, evbuffer_get_length(buf));
        response = text_response(500, "Server error");
        if (!add_headers(headers, response)) {
            evbuffer_free(buf);
            evhttp_send_error(req, 500, nullptr);
            return;
        }
    }

    if (!response.file) {
        evbuffer_add(buf, response.body.data(), response.body.size());
    }

    evhttp_send_reply(req, response.status, reason_phrase(response.status), buf);
    evbuffer_free(buf);

    log_info(string_format("info.access_log", method, uri, response.status));
}
