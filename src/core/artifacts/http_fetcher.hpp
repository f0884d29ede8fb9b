#pragma once

#include <optional>
#include <string>
#include <utility>

namespace cattlediag {

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Blocking HTTP GET, injectable so artifact resolution can be tested offline
class HttpFetcher {
public:
    virtual ~HttpFetcher() = default;

    // nullopt on transport failure (DNS, connect, timeout)
    virtual std::optional<HttpResponse> get(const std::string& url) = 0;
};

// cpp-httplib client with a per-attempt timeout
class HttplibFetcher : public HttpFetcher {
public:
    explicit HttplibFetcher(int timeout_sec = 20);

    std::optional<HttpResponse> get(const std::string& url) override;

    // "http://host:8001/gradcams/a.png" -> {"http://host:8001", "/gradcams/a.png"}
    static std::optional<std::pair<std::string, std::string>> split_url(const std::string& url);

private:
    int timeout_sec_;
};

} // namespace cattlediag
