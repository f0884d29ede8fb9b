#pragma once

#include "http_fetcher.hpp"
#include "../config/config_manager.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cattlediag {

/**
 * Resolves a Grad-CAM locator emitted by a (possibly remote) inference host
 * to the artifact bytes. Attempts, first success wins:
 *   1. HTTP(S) GET of the locator itself
 *   2. file:// URI
 *   3. absolute path, including C:\ and C:/ forms
 *   4. local candidate paths under the project root, then the sample image
 *   5. HTTP candidates under the public base or inference URL
 * Failures at any step are logged and the next step runs; resolve() itself
 * never throws.
 */
class ArtifactLocator {
public:
    explicit ArtifactLocator(const ArtifactConfig& config,
                             std::shared_ptr<HttpFetcher> fetcher = nullptr);

    // Artifact bytes, or nullopt when no candidate yields any
    std::optional<std::string> resolve(const std::string& locator) const;

    // Step 4 candidates, de-duplicated in first-seen order
    std::vector<std::string> local_candidates(const std::string& locator) const;

    // Step 5 candidates, de-duplicated in first-seen order
    std::vector<std::string> http_candidates(const std::string& locator) const;

    static bool is_http_url(const std::string& locator);
    static bool is_file_uri(const std::string& locator);

    // "/x", "C:\x" or "C:/x"
    static bool is_absolute_path(const std::string& locator);

    // Path part of a file:// URI
    static std::string file_uri_path(const std::string& uri);

private:
    std::optional<std::string> fetch(const std::string& url, bool require_body) const;
    static std::optional<std::string> read_file(const std::string& path);

    ArtifactConfig config_;
    std::shared_ptr<HttpFetcher> fetcher_;
};

} // namespace cattlediag
