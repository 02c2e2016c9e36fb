#pragma once

// Main API: cursor, sources, the four strategies and their result types.
#include "cursor.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "slice.hpp"
#include "source.hpp"

#include "any_strategy.hpp"
#include "deferred_strategy.hpp"
#include "get_strategy.hpp"
#include "immediate_strategy.hpp"
