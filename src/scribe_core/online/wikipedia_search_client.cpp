#include "scribe_core/online/wikipedia_search_client.hpp"

#include <curl/curl.h>

#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

namespace scribe_core {

namespace {

struct CurlDeleter {
  void operator()(CURL *handle) const {
    curl_easy_cleanup(handle);
  }
};

struct SlistDeleter {
  void operator()(curl_slist *list) const {
    curl_slist_free_all(list);
  }
};

size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

}  // namespace

WikipediaSearchClient::WikipediaSearchClient(std::string api_url) : api_url_(std::move(api_url)) {}

std::string WikipediaSearchClient::escape(const std::string &value) const {
  std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
  if (!handle) {
    throw OnlineSearchError("Failed to initialize CURL");
  }
  char *escaped = curl_easy_escape(handle.get(), value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    throw OnlineSearchError("Failed to URL-encode query");
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

std::string WikipediaSearchClient::http_get(const std::string &url,
                                            std::chrono::milliseconds timeout) const {
  if (timeout.count() <= 0) {
    throw OnlineSearchError("Online search timed out");
  }

  std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
  if (!handle) {
    throw OnlineSearchError("Failed to initialize CURL");
  }
  std::unique_ptr<curl_slist, SlistDeleter> headers(
      curl_slist_append(nullptr, "Accept: application/json"));

  std::string response_buffer;
  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, "scribe/1.0");
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);

  CURLcode res = curl_easy_perform(handle.get());
  if (res != CURLE_OK) {
    throw OnlineSearchError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code != 200) {
    throw OnlineSearchError("HTTP error " + std::to_string(http_code));
  }
  return response_buffer;
}

std::vector<OnlineHit> WikipediaSearchClient::search(const std::string &query,
                                                     size_t max_results,
                                                     std::chrono::milliseconds timeout) {
  if (query.empty() || max_results == 0) {
    return {};
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto remaining = [&deadline] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                 std::chrono::steady_clock::now());
  };

  std::vector<std::string> titles;
  try {
    const std::string search_url = api_url_ +
                                   "?action=query&list=search&format=json&srsearch=" +
                                   escape(query) + "&srlimit=" + std::to_string(max_results);
    auto search_json = nlohmann::json::parse(http_get(search_url, remaining()));
    for (const auto &item : search_json.at("query").at("search")) {
      titles.push_back(item.at("title").get<std::string>());
    }
  } catch (const nlohmann::json::exception &e) {
    throw OnlineSearchError("Malformed search response: " + std::string(e.what()));
  }

  if (titles.empty()) {
    return {};
  }

  std::string joined;
  for (const auto &title : titles) {
    if (!joined.empty()) {
      joined += "|";
    }
    joined += title;
  }

  std::vector<OnlineHit> hits;
  try {
    const std::string extract_url = api_url_ +
                                    "?action=query&prop=extracts&exintro=1&explaintext=1"
                                    "&redirects=1&format=json&titles=" +
                                    escape(joined);
    auto extract_json = nlohmann::json::parse(http_get(extract_url, remaining()));
    const auto &pages = extract_json.at("query").at("pages");

    // Keep the search ranking rather than the page-id order of the response.
    for (const auto &title : titles) {
      for (const auto &[page_id, page] : pages.items()) {
        if (page.value("title", "") != title) {
          continue;
        }
        std::string extract = page.value("extract", "");
        if (extract.empty()) {
          break;
        }
        OnlineHit hit;
        hit.text = std::move(extract);
        hit.score = 0.0f;
        hit.attribution = "Wikipedia: " + title;
        hits.push_back(std::move(hit));
        break;
      }
    }
  } catch (const nlohmann::json::exception &e) {
    throw OnlineSearchError("Malformed extracts response: " + std::string(e.what()));
  }

  std::cout << "[Online] Wikipedia returned " << hits.size() << " extracts" << std::endl;
  return hits;
}

}  // namespace scribe_core
