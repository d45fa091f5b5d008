// =================================================================
// tests/CancellationTokenTest.cpp
// =================================================================
// Unit tests for cancellation and deadline propagation.

#include "Maestro/CancellationToken.hpp"
#include <iostream>
#include <cassert>
#include <thread>

using namespace Maestro;

class CancellationTokenTest {
private:
    using Clock = CancellationToken::Clock;

public:
    void testCancelPropagatesToChildren() {
        std::cout << "Testing cancellation reaches children..." << std::endl;

        CancellationToken root;
        CancellationToken child = root.child();
        CancellationToken grandchild = child.child();
        CancellationToken copy = grandchild;

        assert(!grandchild.isCancelled());
        root.cancel();
        assert(child.isCancelled());
        assert(grandchild.isCancelled());
        assert(copy.isCancelled() && "Copies share state");
        assert(grandchild.shouldStop());

        // Children made after cancellation start cancelled
        assert(root.child().isCancelled());

        std::cout << "✓ Cancellation propagation test passed" << std::endl;
    }

    void testChildCancelDoesNotAffectParent() {
        std::cout << "Testing child cancellation stays local..." << std::endl;

        CancellationToken root;
        CancellationToken first = root.child();
        CancellationToken second = root.child();

        first.cancel();
        assert(first.isCancelled());
        assert(!root.isCancelled());
        assert(!second.isCancelled());

        std::cout << "✓ Local cancellation test passed" << std::endl;
    }

    void testDeadlines() {
        std::cout << "Testing deadline clamping and expiry..." << std::endl;

        CancellationToken unbounded;
        assert(!unbounded.deadline().has_value());
        assert(!unbounded.isExpired());
        assert(unbounded.remaining(std::chrono::milliseconds(1234)) == std::chrono::milliseconds(1234));

        auto near = Clock::now() + std::chrono::milliseconds(100);
        auto far = Clock::now() + std::chrono::seconds(60);
        CancellationToken parent = CancellationToken::withDeadline(near);

        CancellationToken clamped = parent.child(far);
        assert(clamped.deadline() == near && "Children never outlive the parent deadline");

        CancellationToken tighter = CancellationToken::withDeadline(far).child(near);
        assert(tighter.deadline() == near);

        assert(parent.remaining() <= std::chrono::milliseconds(100));
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        assert(parent.isExpired());
        assert(clamped.isExpired());
        assert(clamped.shouldStop());
        assert(!clamped.isCancelled());
        assert(clamped.remaining() == std::chrono::milliseconds(0));

        std::cout << "✓ Deadline test passed" << std::endl;
    }

    void testSleepFor() {
        std::cout << "Testing interruptible sleeps..." << std::endl;

        CancellationToken plain;
        assert(plain.sleepFor(std::chrono::milliseconds(20)));

        // The deadline cuts the sleep short
        auto deadline_token = CancellationToken::withDeadline(Clock::now() + std::chrono::milliseconds(50));
        auto start = Clock::now();
        assert(!deadline_token.sleepFor(std::chrono::seconds(10)));
        assert(Clock::now() - start < std::chrono::seconds(2));

        // Cancelling wakes a sleeping thread immediately
        CancellationToken root;
        CancellationToken sleeper = root.child();
        bool completed = true;
        start = Clock::now();
        std::thread thread([&]() { completed = sleeper.sleepFor(std::chrono::seconds(10)); });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        root.cancel();
        thread.join();

        assert(!completed);
        assert(Clock::now() - start < std::chrono::seconds(2));

        std::cout << "✓ Sleep test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CancellationToken Tests..." << std::endl;
        std::cout << "=================================" << std::endl;

        testCancelPropagatesToChildren();
        std::cout << std::endl;

        testChildCancelDoesNotAffectParent();
        std::cout << std::endl;

        testDeadlines();
        std::cout << std::endl;

        testSleepFor();
        std::cout << std::endl;

        std::cout << "All CancellationToken tests passed!" << std::endl;
    }
};

int main() {
    try {
        CancellationTokenTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All CancellationToken component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
