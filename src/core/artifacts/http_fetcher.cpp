#include "http_fetcher.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include <httplib.h>

namespace cattlediag {

using common::StringUtils;

HttplibFetcher::HttplibFetcher(int timeout_sec)
    : timeout_sec_(timeout_sec) {
}

std::optional<std::pair<std::string, std::string>> HttplibFetcher::split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    auto scheme = StringUtils::to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        return std::make_pair(url, std::string("/"));
    }
    if (path_start == scheme_end + 3) {
        return std::nullopt;    // no host
    }
    return std::make_pair(url.substr(0, path_start), url.substr(path_start));
}

std::optional<HttpResponse> HttplibFetcher::get(const std::string& url) {
    auto parts = split_url(url);
    if (!parts) {
        LOG_DEBUG("Not an HTTP URL: " + url);
        return std::nullopt;
    }

    httplib::Client client(parts->first);
    client.set_connection_timeout(timeout_sec_, 0);
    client.set_read_timeout(timeout_sec_, 0);
    client.set_follow_location(true);

    auto result = client.Get(parts->second);
    if (!result) {
        LOG_DEBUG("GET " + url + " failed: " + httplib::to_string(result.error()));
        return std::nullopt;
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;
    return response;
}

} // namespace cattlediag
