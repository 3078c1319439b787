#pragma once

#include "config.hpp"
#include "request_handler.hpp"
#include "response.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct event_base;
struct evhttp;
struct evhttp_request;
struct event;

struct EventBaseDeleter {
    void operator()(struct event_base* base) const;
};

struct EvhttpDeleter {
    void operator()(struct evhttp* http) const;
};

struct EventDeleter {
    void operator()(struct event* ev) const;
};

// HTTP front end. One libevent loop accepts connections and writes responses;
// a fixed pool of worker threads runs the request pipeline.
class CdnServer {
public:
    CdnServer(const CdnConfig& config, const RequestHandler& handler);
    ~CdnServer();

    CdnServer(const CdnServer&) = delete;
    CdnServer& operator=(const CdnServer&) = delete;

    // Binds the listening socket and runs the event loop until stop() or a
    // SIGINT/SIGTERM.
    void run();
    void stop();

    // Maps a request URI onto the handler's URL space. std::nullopt when the
    // URI lies outside the mount path.
    static std::optional<std::string> strip_mount_path(const std::string& mount_path, const std::string& uri);

private:
    struct PendingRequest {
        CdnServer* server = nullptr;
        struct evhttp_request* req = nullptr;
        std::string method;
        Request request;
        Response response;
    };

    static void on_request(struct evhttp_request* req, void* arg);
    static void on_complete(int fd, short what, void* arg);
    static void on_signal(int fd, short what, void* arg);

    void dispatch(struct evhttp_request* req);
    void worker_loop();
    void complete(std::unique_ptr<PendingRequest> pending);
    void reply(struct evhttp_request* req, const std::string& method, const std::string& uri, Response& response);

    const CdnConfig& config_;
    const RequestHandler& handler_;

    std::unique_ptr<struct event_base, EventBaseDeleter> base_;
    std::unique_ptr<struct evhttp, EvhttpDeleter> http_;
    std::vector<std::unique_ptr<struct event, EventDeleter>> signal_events_;

    std::vector<std::thread> workers_;
    std::deque<std::unique_ptr<PendingRequest>> queue_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool stopping_ = false;
};
