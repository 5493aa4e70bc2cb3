// ============================================================================
// Example 03: Dataflow Variables and Deadlines
// ============================================================================
//
// Two units of work hand a value over through dataflow variables without
// knowing about each other. The main thread reads with a deadline.
//
// RUN:
//   cd build && ./03_dataflow
//
// ============================================================================

#include "pledge/pledge.hpp"

#include <chrono>
#include <iostream>
#include <thread>

using namespace pledge;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== Pledge Example 03: Dataflow ===" << std::endl;
    std::cout << std::endl;

    ThreadPoolExecutor executor(4);
    DataflowVariable<int> produced(executor);
    DataflowVariable<int> consumed(executor);

    // consumed follows produced; the consumer only knows consumed
    consumed.Follow(produced);

    auto consumer = Spawn(executor, [consumed] { return consumed.Get() * 10; });
    Spawn(executor, [produced] {
        std::this_thread::sleep_for(50ms);
        produced.Assign(5);
    });

    // A short deadline passes before the producer is done
    auto early = ValueWithin(consumer, 5ms);
    std::cout << "After 5ms: " << (early ? "completed" : "not yet completed") << std::endl;

    auto late = ValueWithin(consumer, 2000ms);
    if (late && late->IsSuccess()) {
        std::cout << "After waiting: " << late->Value() << std::endl;
    }

    executor.Shutdown();
    return 0;
}
