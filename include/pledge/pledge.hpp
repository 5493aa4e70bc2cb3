// ============================================================================
// pledge/pledge.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete pledge library.
// For smaller builds, include individual headers as needed.
//
// USAGE:
// ------
//   #include <pledge/pledge.hpp>
//   using namespace pledge;
//
// ============================================================================

#pragma once

// Core primitives
#include "pledge/core/concepts.hpp"
#include "pledge/core/defer.hpp"
#include "pledge/core/error.hpp"
#include "pledge/core/log.hpp"
#include "pledge/core/try.hpp"

// Promise / Future
#include "pledge/core/future.hpp"
#include "pledge/core/promise.hpp"
#include "pledge/core/spawn.hpp"

// Combinators
#include "pledge/core/aggregate.hpp"
#include "pledge/core/combinators.hpp"

// Dataflow
#include "pledge/core/dataflow.hpp"

// Executors
#include "pledge/runtime/executor.hpp"
#include "pledge/runtime/quiescence.hpp"
#include "pledge/runtime/thread_pool_executor.hpp"
#include "pledge/runtime/thread_utils.hpp"

// Blocking reads
#include "pledge/sync/await.hpp"
