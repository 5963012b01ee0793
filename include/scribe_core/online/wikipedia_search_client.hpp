#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "scribe_core/gateways/online_search_gateway.hpp"

namespace scribe_core {

/**
 * @class WikipediaSearchClient
 * @brief Online fallback source using the MediaWiki query API.
 *
 * A search request finds matching page titles, then one extracts request
 * fetches the plain-text introduction of each page. The timeout bounds both
 * requests together.
 */
class WikipediaSearchClient : public OnlineSearchGateway {
 public:
  explicit WikipediaSearchClient(std::string api_url = "https://en.wikipedia.org/w/api.php");

  std::vector<OnlineHit> search(const std::string &query,
                                size_t max_results,
                                std::chrono::milliseconds timeout) override;

 private:
  std::string http_get(const std::string &url, std::chrono::milliseconds timeout) const;
  std::string escape(const std::string &value) const;

  std::string api_url_;
};

}  // namespace scribe_core
