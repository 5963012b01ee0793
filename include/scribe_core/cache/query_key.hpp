#pragma once

#include <string>

namespace scribe_core {

// Lower-cases, trims and collapses whitespace runs to a single space.
std::string normalize_query(const std::string &query);

// SHA-256 hex digest of the normalized query. Equal after normalization
// means equal key.
std::string make_query_key(const std::string &query);

}  // namespace scribe_core
