#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. scribe_core/types/chunk.hpp),
// users can simply do `#include "scribe_core/types.hpp"`.
//
#include "scribe_core/types/chunk.hpp"
#include "scribe_core/types/document.hpp"
#include "scribe_core/types/search_result.hpp"
