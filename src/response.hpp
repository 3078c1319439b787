#pragma once

#include <json/json.h>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Sink for the single response of one request.
class Responder {
public:
    virtual ~Responder() = default;

    virtual void send_file(const std::filesystem::path& file, long long max_age) = 0;
    virtual void send_redirect(const std::string& location, long long max_age) = 0;
    virtual void send_json(const Json::Value& value, long long max_age) = 0;
    virtual void send_text(int status, const std::string& message) = 0;

    void send_not_found(const std::string& what);
    void send_invalid_url(const std::string& url);
    // Logs the cause; the client only sees a generic message.
    void send_server_error(const std::string& cause);
};

struct Response {
    int status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::optional<std::filesystem::path> file; // body is streamed from here when set
    long long file_size = 0;

    const std::string* header(const std::string& name) const;
};

// Collects the response in memory; the transport writes it out afterwards.
class BufferedResponder : public Responder {
public:
    void send_file(const std::filesystem::path& file, long long max_age) override;
    void send_redirect(const std::string& location, long long max_age) override;
    void send_json(const Json::Value& value, long long max_age) override;
    void send_text(int status, const std::string& message) override;

    bool sent() const { return sent_; }
    const Response& response() const { return response_; }
    Response take() { return std::move(response_); }

private:
    void begin(int status);

    Response response_;
    bool sent_ = false;
};
