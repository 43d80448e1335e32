#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. askdoc_core/types/chunk.hpp),
// users can simply do `#include "askdoc_core/types.hpp"`.
//
#include "askdoc_core/types/chunk.hpp"
#include "askdoc_core/types/document.hpp"
#include "askdoc_core/types/query_result.hpp"
