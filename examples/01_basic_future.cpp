// ============================================================================
// Example 01: Basic Futures
// ============================================================================
//
// This example demonstrates promises, futures and the single-value
// combinators: Map, FlatMap, Recover and Collect.
//
// RUN:
//   cd build && ./01_basic_future
//
// ============================================================================

#include "pledge/pledge.hpp"

#include <cctype>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace pledge;

// A responder that answers "Hello" with "World"
Future<std::string> AskGreeter(Executor& executor, std::string message) {
    return Spawn(executor, [message] {
        if (message != "Hello") {
            throw std::invalid_argument("I only answer Hello");
        }
        return std::string("World");
    });
}

Future<std::string> AskShouter(Executor& executor, std::string message) {
    return Spawn(executor, [message]() mutable {
        for (char& c : message) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return message;
    });
}

int main() {
    std::cout << "=== Pledge Example 01: Basic Futures ===" << std::endl;
    std::cout << std::endl;

    ThreadPoolExecutor executor(4);

    // Example 1: Completing a promise by hand
    std::cout << "--- Example 1: Promise and Future ---" << std::endl;
    Promise<int> promise(executor);
    Future<int> future = promise.GetFuture();
    promise.SetValue(5);
    bool again = promise.SetValue(7);
    std::cout << "Value: " << Get(future) << " (second SetValue accepted: " << std::boolalpha << again << ")"
              << std::endl;
    std::cout << std::endl;

    // Example 2: Chaining replies
    std::cout << "--- Example 2: FlatMap Chain ---" << std::endl;
    auto shouted = FlatMap(AskGreeter(executor, "Hello"),
                           [&executor](const std::string& reply) { return AskShouter(executor, reply); });
    auto length = Map(shouted, [](const std::string& s) { return s.size(); });
    std::cout << "Reply: " << Get(shouted) << ", length " << Get(length) << std::endl;
    std::cout << std::endl;

    // Example 3: Failures and recovery
    std::cout << "--- Example 3: Recover ---" << std::endl;
    auto rude = AskGreeter(executor, "Oi");
    auto polite = Recover(rude, [](const std::exception_ptr& e) { return "(no reply: " + ErrorMessage(e) + ")"; });
    std::cout << "Reply: " << Get(polite) << std::endl;
    std::cout << std::endl;

    // Example 4: Collect
    std::cout << "--- Example 4: Collect ---" << std::endl;
    auto even = Collect(MakeSuccessful(executor, 3), [](int x) -> std::optional<int> {
        if (x % 2 == 0) return x;
        return std::nullopt;
    });
    auto result = Await(even);
    std::cout << "Collected: " << (result ? std::to_string(result.Value()) : ErrorMessage(result.Error()))
              << std::endl;

    return 0;
}
