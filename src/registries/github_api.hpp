#pragma once
#include "registry.hpp"
#include <optional>
#include <string>

namespace crancache {

// README lookup through the GitHub REST API.
class GitHubApi {
public:
    static constexpr const char* kDefaultBaseUrl = "https://api.github.com";

    GitHubApi(HttpClient& http, std::string base_url = kDefaultBaseUrl,
              std::string token = "", long timeout_seconds = 10);

    // "owner/repo" from a github.com URL, or nullopt for anything else.
    static std::optional<std::string> parse_repo(const std::string& url);

    // Raw README text of the repository the URL points at. nullopt when the
    // URL is not a GitHub repo, the repo has no README, or the request fails.
    std::optional<std::string> readme(const std::string& repo_url);

private:
    HttpClient& http_;
    std::string base_url_;
    std::string token_;
    long timeout_seconds_;
};

} // namespace crancache
