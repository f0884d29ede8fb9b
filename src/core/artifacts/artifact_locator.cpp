#include "artifact_locator.hpp"
#include "../../common/logging.hpp"
#include "../../common/utils.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unordered_set>

namespace cattlediag {

namespace fs = std::filesystem;
using common::StringUtils;

namespace {

std::string normalize_separators(const std::string& locator) {
    return StringUtils::trim(StringUtils::replace(locator, "\\", "/"));
}

std::string basename_of(const std::string& normalized) {
    return fs::path(normalized).filename().string();
}

std::string strip_leading_slashes(const std::string& text) {
    auto pos = text.find_first_not_of('/');
    return pos == std::string::npos ? std::string() : text.substr(pos);
}

void append_unique(std::vector<std::string>& out, std::unordered_set<std::string>& seen,
                   const std::string& candidate) {
    if (!candidate.empty() && seen.insert(candidate).second) {
        out.push_back(candidate);
    }
}

} // namespace

ArtifactLocator::ArtifactLocator(const ArtifactConfig& config, std::shared_ptr<HttpFetcher> fetcher)
    : config_(config)
    , fetcher_(std::move(fetcher)) {
    if (!fetcher_) {
        fetcher_ = std::make_shared<HttplibFetcher>(config_.http_timeout_sec);
    }
}

bool ArtifactLocator::is_http_url(const std::string& locator) {
    auto lower = StringUtils::to_lower(StringUtils::trim(locator));
    return StringUtils::starts_with(lower, "http://") || StringUtils::starts_with(lower, "https://");
}

bool ArtifactLocator::is_file_uri(const std::string& locator) {
    return StringUtils::starts_with(StringUtils::to_lower(StringUtils::trim(locator)), "file://");
}

bool ArtifactLocator::is_absolute_path(const std::string& locator) {
    if (locator.empty()) {
        return false;
    }
    if (locator[0] == '/') {
        return true;
    }
    return locator.size() >= 3 &&
           std::isalpha(static_cast<unsigned char>(locator[0])) &&
           locator[1] == ':' &&
           (locator[2] == '\\' || locator[2] == '/');
}

std::string ArtifactLocator::file_uri_path(const std::string& uri) {
    std::string rest = normalize_separators(uri).substr(std::string("file://").size());

    // file://host/path keeps only the path
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        return rest;
    }
    std::string path = rest.substr(slash);

    // file:///C:/x -> C:/x
    if (path.size() >= 3 && path[0] == '/' &&
        std::isalpha(static_cast<unsigned char>(path[1])) && path[2] == ':') {
        path.erase(0, 1);
    }
    return path;
}

std::vector<std::string> ArtifactLocator::local_candidates(const std::string& locator) const {
    std::vector<std::string> candidates;
    std::unordered_set<std::string> seen;

    std::string normalized = normalize_separators(locator);
    if (normalized.empty()) {
        return candidates;
    }

    fs::path root(config_.project_root);
    std::string name = basename_of(normalized);

    if (StringUtils::starts_with(normalized, "/")) {
        std::string relative = strip_leading_slashes(normalized);
        append_unique(candidates, seen, (root / relative).string());
        append_unique(candidates, seen, (root / config_.inference_subdir / relative).string());
        append_unique(candidates, seen,
                      (root / config_.inference_subdir / config_.gradcam_subdir / name).string());
        append_unique(candidates, seen, (root / config_.fallback_dir / name).string());
    } else {
        append_unique(candidates, seen, (root / config_.inference_subdir / name).string());
        append_unique(candidates, seen, (root / config_.fallback_dir / name).string());
        append_unique(candidates, seen, (root / name).string());
        append_unique(candidates, seen, normalized);
    }

    append_unique(candidates, seen, config_.sample_gradcam_path);
    return candidates;
}

std::vector<std::string> ArtifactLocator::http_candidates(const std::string& locator) const {
    std::vector<std::string> candidates;
    std::unordered_set<std::string> seen;

    std::string base = !config_.public_base.empty() ? config_.public_base : config_.inference_url;
    std::string normalized = normalize_separators(locator);
    if (base.empty() || normalized.empty()) {
        return candidates;
    }

    while (StringUtils::ends_with(base, "/")) {
        base.pop_back();
    }
    if (StringUtils::ends_with(base, "/predict")) {
        base.erase(base.size() - std::string("/predict").size());
    }

    std::string name = basename_of(normalized);
    if (StringUtils::starts_with(normalized, "/")) {
        append_unique(candidates, seen, base + normalized);
        append_unique(candidates, seen, base + "/gradcams/" + name);
    } else {
        append_unique(candidates, seen, base + "/gradcams/" + name);
        append_unique(candidates, seen, base + "/" + normalized);
    }
    return candidates;
}

std::optional<std::string> ArtifactLocator::resolve(const std::string& locator) const {
    std::string raw = StringUtils::trim(locator);
    if (raw.empty()) {
        return std::nullopt;
    }
    std::string normalized = normalize_separators(raw);
    LOG_DEBUG("Resolving artifact " + raw);

    // 1. the locator is itself a URL
    if (is_http_url(raw)) {
        if (auto body = fetch(raw, false)) {
            LOG_INFO("Fetched artifact from " + raw);
            return body;
        }
        LOG_WARNING("HTTP fetch failed for " + raw + ", trying local candidates");
    }

    // 2. file:// URI
    if (is_file_uri(normalized)) {
        std::string path = file_uri_path(normalized);
        if (auto bytes = read_file(path)) {
            LOG_INFO("Read artifact from file URI path " + path);
            return bytes;
        }
        LOG_WARNING("file:// path not found " + path);
    }

    // 3. absolute path as given, then with forward slashes
    if (is_absolute_path(raw)) {
        for (const auto& path : {raw, normalized}) {
            if (auto bytes = read_file(path)) {
                LOG_INFO("Read artifact from absolute path " + path);
                return bytes;
            }
        }
    }

    // 4. local candidates
    for (const auto& candidate : local_candidates(normalized)) {
        if (auto bytes = read_file(candidate)) {
            LOG_INFO("Found artifact candidate " + candidate);
            return bytes;
        }
        LOG_DEBUG("Candidate does not exist " + candidate);
    }

    // 5. the inference host
    for (const auto& url : http_candidates(normalized)) {
        if (auto body = fetch(url, true)) {
            LOG_INFO("Fetched artifact from inference host " + url);
            return body;
        }
    }

    LOG_WARNING("Could not locate artifact " + raw);
    return std::nullopt;
}

std::optional<std::string> ArtifactLocator::fetch(const std::string& url, bool require_body) const {
    std::optional<HttpResponse> response;
    try {
        response = fetcher_->get(url);
    } catch (const std::exception& e) {
        LOG_DEBUG("GET " + url + " raised: " + std::string(e.what()));
        return std::nullopt;
    }

    if (!response) {
        return std::nullopt;
    }
    if (!response->ok() || (require_body && response->body.empty())) {
        LOG_DEBUG("GET " + url + " returned " + std::to_string(response->status));
        return std::nullopt;
    }
    return response->body;
}

std::optional<std::string> ArtifactLocator::read_file(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_DEBUG("Cannot open " + path);
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace cattlediag
