// ============================================================================
// cotree/cotree.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete cotree library.
//
// USAGE:
// ------
//   #include <cotree/cotree.hpp>
//   using namespace cotree;
//
// ============================================================================

#pragma once

// Support
#include "cotree/core/check.hpp"
#include "cotree/core/defer.hpp"
#include "cotree/core/error.hpp"
#include "cotree/core/result.hpp"

// Containers
#include "cotree/core/children.hpp"
#include "cotree/core/intrusive_list.hpp"

// Hierarchy
#include "cotree/core/node.hpp"
