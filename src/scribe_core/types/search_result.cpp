#include "scribe_core/types/search_result.hpp"

#include <stdexcept>

namespace scribe_core {

std::string to_string(ResultSource source) {
  switch (source) {
    case ResultSource::Local:
      return "local";
    case ResultSource::Online:
      return "online";
    default:
      return "unknown";
  }
}

ResultSource result_source_from_string(const std::string& str) {
  if (str == "local")
    return ResultSource::Local;
  if (str == "online")
    return ResultSource::Online;
  throw std::invalid_argument("Unknown ResultSource: " + str);
}

}  // namespace scribe_core
