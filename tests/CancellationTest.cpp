// =================================================================
// tests/CancellationTest.cpp
// =================================================================
// Unit tests for CancellationSource and CancellationToken.

#include "Ramify/Cancellation.hpp"
#include "Ramify/Errors.hpp"
#include <iostream>
#include <cassert>
#include <chrono>
#include <thread>

using namespace Ramify;

class CancellationTest {
public:
    void testDefaultTokenNeverCancels() {
        std::cout << "Testing default token..." << std::endl;

        CancellationToken token;
        assert(!token.canBeCancelled());
        assert(!token.isCancellationRequested());
        assert(!token.waitFor(std::chrono::milliseconds(5)));
        token.throwIfCancellationRequested();

        std::cout << "✓ Default token test passed" << std::endl;
    }

    void testCancel() {
        std::cout << "Testing direct cancellation..." << std::endl;

        CancellationSource source;
        CancellationToken token = source.token();
        assert(token.canBeCancelled());
        assert(!token.isCancellationRequested());

        source.cancel();
        source.cancel();  // idempotent
        assert(token.isCancellationRequested());
        assert(source.wasCancelledDirectly());
        assert(!source.hasTimedOut());

        bool threw = false;
        try {
            token.throwIfCancellationRequested("child session");
        } catch (const OperationCancelledError& e) {
            threw = true;
            assert(std::string(e.what()) == "The child session was cancelled");
        }
        assert(threw);

        std::cout << "✓ Direct cancellation test passed" << std::endl;
    }

    void testParentPropagation() {
        std::cout << "Testing parent propagation..." << std::endl;

        CancellationSource parent;
        CancellationSource child(parent.token());
        CancellationSource sibling(parent.token());

        child.cancel();
        assert(child.isCancellationRequested());
        assert(!parent.isCancellationRequested() && "Children never cancel their parent");
        assert(!sibling.isCancellationRequested());

        parent.cancel();
        assert(sibling.isCancellationRequested());
        assert(!sibling.wasCancelledDirectly());

        std::cout << "✓ Parent propagation test passed" << std::endl;
    }

    void testTimeout() {
        std::cout << "Testing timeout..." << std::endl;

        CancellationSource parent;
        CancellationSource timed(parent.token(), std::chrono::milliseconds(20));
        assert(!timed.isCancellationRequested());

        assert(timed.token().waitFor(std::chrono::milliseconds(2000)) && "Deadline should end the wait");
        assert(timed.hasTimedOut());
        assert(!timed.wasCancelledDirectly());
        assert(!parent.isCancellationRequested());

        std::cout << "✓ Timeout test passed" << std::endl;
    }

    void testWaitWakesOnCancel() {
        std::cout << "Testing wait wake-up..." << std::endl;

        CancellationSource source;
        std::thread canceller([&source]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            source.cancel();
        });

        auto start = std::chrono::steady_clock::now();
        bool cancelled = source.token().waitFor(std::chrono::seconds(5));
        auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();

        assert(cancelled);
        assert(elapsed < std::chrono::seconds(2));

        std::cout << "✓ Wait wake-up test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Cancellation unit tests..." << std::endl;

        testDefaultTokenNeverCancels();
        testCancel();
        testParentPropagation();
        testTimeout();
        testWaitWakesOnCancel();

        std::cout << "All Cancellation tests passed!" << std::endl;
    }
};

int main() {
    try {
        CancellationTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Cancellation component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
