// ============================================================================
// Example 02: Aggregates
// ============================================================================
//
// This example combines many concurrently running futures with Fold,
// Reduce, Sequence and Traverse, then waits for the pool to go quiet.
//
// RUN:
//   cd build && ./02_aggregate
//
// ============================================================================

#include "pledge/pledge.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace pledge;
using namespace std::chrono_literals;

Future<int> SlowSquare(Executor& executor, int x) {
    return Spawn(executor, [x] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10 - x % 10));
        return x * x;
    });
}

int main() {
    std::cout << "=== Pledge Example 02: Aggregates ===" << std::endl;
    std::cout << std::endl;

    ThreadPoolExecutor executor(4);

    std::vector<Future<int>> squares;
    for (int i = 0; i < 10; ++i) {
        squares.push_back(SlowSquare(executor, i));
    }

    auto sum = Fold(executor, 0, squares, [](int acc, int x) { return acc + x; });
    auto max = Reduce(executor, squares, [](int a, int b) { return a > b ? a : b; });
    auto ordered = Sequence(executor, squares);

    std::cout << "Sum of squares: " << Get(sum) << std::endl;
    std::cout << "Largest square: " << Get(max) << std::endl;
    std::cout << "In order:";
    for (int value : Get(ordered)) {
        std::cout << " " << value;
    }
    std::cout << std::endl;

    std::vector<std::string> words{"promise", "future", "try"};
    auto lengths = Traverse(executor, words, [&executor](const std::string& w) {
        return Spawn(executor, [w] { return w.size(); });
    });
    std::cout << "Word lengths:";
    for (size_t n : Get(lengths)) {
        std::cout << " " << n;
    }
    std::cout << std::endl;

    auto empty = Await(Reduce(executor, std::vector<Future<int>>{}, [](int a, int b) { return a + b; }));
    std::cout << "Reduce over nothing: " << ErrorMessage(empty.Error()) << std::endl;

    bool quiet = executor.Quiescence().WaitForQuiescence(1000ms);
    std::cout << "Quiescent: " << std::boolalpha << quiet << std::endl;

    executor.Shutdown();
    return 0;
}
