#pragma once

#include <string>

namespace scribe_core {

struct Document {
  std::string document_id;
  std::string raw_text;
};

}  // namespace scribe_core
