// test_command_queue.cpp - Unit test for the session command queue
//
// Tests:
// 1. Closed queue rejects pushes
// 2. FIFO order
// 3. close() wakes a blocked pop and keeps accepted commands poppable
// 4. Concurrent producers keep per-producer order

#include "session/command_queue.hpp"
#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>

using namespace hubdrive;
using namespace hubdrive::session;

static int g_pass = 0, g_fail = 0;

static void expect(bool ok, const char* what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        g_pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        g_fail++;
    }
}

int main() {
    std::cout << "=== Command Queue Unit Test ===\n\n";

    // ========================================================================
    // TEST 1: Starts closed
    // ========================================================================
    std::cout << "TEST 1: Closed queue rejects pushes\n";
    {
        CommandQueue q;
        expect(!q.isOpen(), "new queue is closed");
        expect(!q.push(DriveCommand::Forward), "push to closed queue returns false");
        expect(q.size() == 0, "nothing stored");
        expect(!q.tryPop().has_value(), "tryPop on closed queue is empty");
    }

    // ========================================================================
    // TEST 2: FIFO
    // ========================================================================
    std::cout << "\nTEST 2: FIFO order\n";
    {
        CommandQueue q;
        q.open();
        const DriveCommand input[] = {
            DriveCommand::Forward, DriveCommand::Stop, DriveCommand::TurnLeft,
            DriveCommand::Center, DriveCommand::Turbo, DriveCommand::Backward,
        };
        for (DriveCommand c : input) {
            q.push(c);
        }
        expect(q.size() == 6, "six commands queued");

        bool in_order = true;
        for (DriveCommand c : input) {
            auto got = q.pop();
            if (!got || *got != c) {
                in_order = false;
            }
        }
        expect(in_order, "pop returns commands in push order");
        expect(!q.tryPop().has_value(), "queue drained");
    }

    // ========================================================================
    // TEST 3: close() and reset()
    // ========================================================================
    std::cout << "\nTEST 3: close wakes pop, accepted commands drain\n";
    {
        CommandQueue q;
        q.open();

        std::atomic<bool> woke{false};
        std::atomic<bool> got_value{false};
        std::thread consumer([&]() {
            auto c = q.pop();
            got_value = c.has_value();
            woke = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        expect(!woke, "pop blocks on empty open queue");
        q.close();
        consumer.join();
        expect(woke && !got_value, "close() wakes pop with nullopt");

        q.open();
        q.push(DriveCommand::Forward);
        q.push(DriveCommand::Backward);
        q.close();
        expect(!q.push(DriveCommand::Stop), "push after close rejected");
        auto first = q.pop();
        auto second = q.pop();
        expect(first && *first == DriveCommand::Forward && second && *second == DriveCommand::Backward,
               "accepted commands still pop in order after close");
        expect(!q.pop().has_value(), "pop on closed empty queue returns nullopt");

        q.open();
        q.push(DriveCommand::Turbo);
        q.push(DriveCommand::Center);
        q.close();
        expect(q.reset() == 2, "reset reports two discarded commands");
        expect(q.size() == 0, "queue empty after reset");

        q.open();
        expect(q.push(DriveCommand::Stop), "reopened queue accepts pushes");
        auto c = q.tryPop();
        expect(c && *c == DriveCommand::Stop, "no stale command after reopen");
    }

    // ========================================================================
    // TEST 4: Concurrent producers
    // ========================================================================
    std::cout << "\nTEST 4: Concurrent producers\n";
    {
        CommandQueue q;
        q.open();
        const int per_producer = 500;

        // Producer A pushes only Forward/Stop alternating, B only Left/Right
        std::thread a([&]() {
            for (int i = 0; i < per_producer; i++) {
                q.push(i % 2 == 0 ? DriveCommand::Forward : DriveCommand::Stop);
            }
        });
        std::thread b([&]() {
            for (int i = 0; i < per_producer; i++) {
                q.push(i % 2 == 0 ? DriveCommand::TurnLeft : DriveCommand::TurnRight);
            }
        });

        std::vector<DriveCommand> received;
        while (received.size() < static_cast<size_t>(per_producer * 2)) {
            auto c = q.pop();
            if (c) received.push_back(*c);
        }
        a.join();
        b.join();

        bool a_ordered = true, b_ordered = true;
        int a_index = 0, b_index = 0;
        for (DriveCommand c : received) {
            if (c == DriveCommand::Forward || c == DriveCommand::Stop) {
                DriveCommand expected = (a_index % 2 == 0) ? DriveCommand::Forward : DriveCommand::Stop;
                if (c != expected) a_ordered = false;
                a_index++;
            } else {
                DriveCommand expected = (b_index % 2 == 0) ? DriveCommand::TurnLeft : DriveCommand::TurnRight;
                if (c != expected) b_ordered = false;
                b_index++;
            }
        }
        expect(a_index == per_producer && b_index == per_producer, "all commands delivered");
        expect(a_ordered && b_ordered, "per-producer order preserved");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << g_pass << " passed, " << g_fail << " failed\n";
    std::cout << "========================================\n";

    return g_fail == 0 ? 0 : 1;
}
