#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. lore_core/types/file.hpp),
// users can simply do `#include "lore_core/types.hpp"`.
//
#include "lore_core/types/chunk.hpp"
#include "lore_core/types/file.hpp"
#include "lore_core/types/retrieval.hpp"
