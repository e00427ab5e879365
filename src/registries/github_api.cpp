#include "github_api.hpp"
#include "../util.hpp"

#include <iostream>
#include <vector>

namespace crancache {

GitHubApi::GitHubApi(HttpClient& http, std::string base_url, std::string token,
                     long timeout_seconds)
    : http_(http), base_url_(std::move(base_url)), token_(std::move(token)),
      timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::optional<std::string> GitHubApi::parse_repo(const std::string& url) {
    const std::string marker = "github.com/";
    size_t pos = url.find(marker);
    if (pos == std::string::npos) return std::nullopt;

    std::string rest = url.substr(pos + marker.size());
    rest = rest.substr(0, rest.find_first_of("?#"));

    auto parts = split(rest, '/');
    if (parts.size() < 2) return std::nullopt;

    std::string owner = trim(parts[0]);
    std::string repo = trim(parts[1]);
    if (repo.size() > 4 && repo.compare(repo.size() - 4, 4, ".git") == 0)
        repo.resize(repo.size() - 4);
    if (owner.empty() || repo.empty()) return std::nullopt;

    return owner + "/" + repo;
}

std::optional<std::string> GitHubApi::readme(const std::string& repo_url) {
    auto repo = parse_repo(repo_url);
    if (!repo) return std::nullopt;

    std::vector<Header> headers = {
        {"User-Agent", "crancache/1.0"},
        {"Accept", "application/vnd.github.raw"}
    };
    if (!token_.empty()) headers.emplace_back("Authorization", "Bearer " + token_);

    std::string url = base_url_ + "/repos/" + *repo + "/readme";
    auto response = http_.get(url, headers, timeout_seconds_);

    if (response.status_code == 200 && !response.body.empty()) return response.body;

    if (response.status_code != 404) {
        std::cerr << "[github] README lookup for " << *repo << " failed (HTTP "
                  << response.status_code << ")\n";
    }
    return std::nullopt;
}

} // namespace crancache
