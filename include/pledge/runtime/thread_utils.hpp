// ============================================================================
// pledge/runtime/thread_utils.hpp - Worker Thread Naming
// ============================================================================
//
// Pool workers carry readable names ("<prefix>-<index>") so they can be told
// apart in top, gdb and perf.
//
// USAGE:
// ------
//   SetThreadName("replies-0");
//   NameWorkerThread("replies", i);   // same, for worker #i
//
// ============================================================================

#pragma once

#include <cstddef>
#include <string>

namespace pledge {

// Linux limits thread names to 15 characters; longer names are truncated.
// Returns true on success.
bool SetThreadName(const std::string& name);

// Name the calling thread "<prefix>-<index>". An empty prefix leaves the
// name alone. Returns true on success.
bool NameWorkerThread(const std::string& prefix, size_t index);

}  // namespace pledge
