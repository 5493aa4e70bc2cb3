// ============================================================================
// pledge/core/dataflow.hpp - Single-Assignment Dataflow Variable
// ============================================================================
//
// A DataflowVariable<T> is a cell that is written once and read by anyone.
// Readers block until a value is there; writers either assign a value or
// make the variable follow another future. This lets two concurrent units of
// work hand a value over without referring to each other.
//
// USAGE:
// ------
//   DataflowVariable<int> a(executor), b(executor);
//
//   std::thread reader([&] {
//       b.Follow(a);           // b completes with whatever a completes with
//       Use(b.Get());          // blocks until a is assigned
//   });
//   std::thread writer([&] { a.Assign(5); });
//
// Copies share the same cell.
//
// ============================================================================

#pragma once

#include <chrono>
#include <utility>

#include "pledge/core/future.hpp"
#include "pledge/core/promise.hpp"
#include "pledge/core/try.hpp"
#include "pledge/runtime/executor.hpp"
#include "pledge/sync/await.hpp"

namespace pledge {

template <typename T>
class DataflowVariable {
   public:
    explicit DataflowVariable(Executor& executor) : promise_(executor) {}

    // Returns false if the variable already had a value
    bool Assign(T value) const { return promise_.SetValue(std::move(value)); }

    // Complete this variable with source's eventual result
    void Follow(const Future<T>& source) const {
        source.OnComplete([promise = promise_](const Try<T>& result) { promise.Complete(result); });
    }

    void Follow(const DataflowVariable& source) const { Follow(source.GetFuture()); }

    [[nodiscard]] bool IsAssigned() const { return promise_.IsCompleted(); }

    Future<T> GetFuture() const { return promise_.GetFuture(); }

    // Block until assigned; rethrows if the followed future failed
    T Get() const { return pledge::Get(GetFuture()); }

    template <typename Rep, typename Period>
    T Get(const std::chrono::duration<Rep, Period>& timeout) const {
        return pledge::Get(GetFuture(), timeout);
    }

   private:
    Promise<T> promise_;
};

}  // namespace pledge
