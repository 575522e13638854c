#include <catch2/catch_test_macros.hpp>

#include "serial_gateway.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("SerialGateway", "[gateway]") {
    SerialGateway gateway;

    SECTION("SubmitReturnsValue") {
        auto r = gateway.submit([] { return 7 * 6; });
        REQUIRE(r);
        REQUIRE(*r == 42);
    }

    SECTION("SubmitVoid") {
        bool ran = false;
        auto r = gateway.submit([&] { ran = true; });
        REQUIRE(r);
        REQUIRE(ran);
    }

    SECTION("RunsOnWorkerThread") {
        auto caller = std::this_thread::get_id();
        auto r = gateway.submit([&] { return std::this_thread::get_id() != caller; });
        REQUIRE(r);
        REQUIRE(*r);
        REQUIRE_FALSE(gateway.on_worker_thread());
    }

    SECTION("FifoOrder") {
        std::mutex m;
        std::vector<int> order;
        std::promise<void> release;
        auto released = release.get_future().share();

        // Holds the worker so the posts below queue up.
        REQUIRE(gateway.post([released] { released.wait(); }));
        for (int i = 0; i < 5; i++) {
            REQUIRE(gateway.post([&, i] {
                std::lock_guard lock(m);
                order.push_back(i);
            }));
        }
        REQUIRE(gateway.pending() == 5);

        release.set_value();
        REQUIRE(gateway.submit([] {}));
        REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
        REQUIRE(gateway.pending() == 0);
    }

    SECTION("SubmitAfterShutdownIsRejected") {
        gateway.shutdown();
        REQUIRE(gateway.is_shut_down());

        bool ran = false;
        auto r = gateway.submit([&] { ran = true; });
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == ErrorKind::SessionClosed);
        REQUIRE_FALSE(gateway.post([&] { ran = true; }));
        gateway.join();
        REQUIRE_FALSE(ran);
    }

    SECTION("QueuedTasksDrainAfterShutdown") {
        std::promise<void> release;
        auto released = release.get_future().share();
        std::atomic<int> ran{0};

        REQUIRE(gateway.post([released] { released.wait(); }));
        REQUIRE(gateway.post([&] { ran++; }));
        REQUIRE(gateway.post([&] { ran++; }));

        gateway.shutdown();
        release.set_value();
        gateway.join();
        REQUIRE(ran == 2);
    }

    SECTION("NoWorkerAfterJoin") {
        gateway.shutdown();
        gateway.join();
        REQUIRE_FALSE(gateway.on_worker_thread());

        // Any later thread, whatever id it gets, is told the gateway is closed.
        std::optional<ErrorKind> kind;
        std::jthread([&] {
            auto r = gateway.submit([] { return 1; });
            if (!r) kind = r.error().kind;
        }).join();
        REQUIRE(kind == ErrorKind::SessionClosed);
    }

    SECTION("ReentrantSubmitIsRejected") {
        auto r = gateway.submit([&] {
            auto inner = gateway.submit([] { return 1; });
            return !inner && inner.error().kind == ErrorKind::EngineInvocation;
        });
        REQUIRE(r);
        REQUIRE(*r);
    }

    SECTION("JoinFromWorkerIsNoop") {
        auto r = gateway.submit([&] {
            gateway.join();
            return gateway.on_worker_thread();
        });
        REQUIRE(r);
        REQUIRE(*r);
    }

    SECTION("ExceptionPropagatesToCaller") {
        REQUIRE_THROWS_AS(gateway.submit([]() -> int { throw std::runtime_error("boom"); }),
                          std::runtime_error);
        // The worker survives.
        auto r = gateway.submit([] { return std::string("still running"); });
        REQUIRE(r);
        REQUIRE(*r == "still running");
    }

    SECTION("ConcurrentSubmittersNeverOverlap") {
        std::atomic<int> in_flight{0};
        std::atomic<int> max_in_flight{0};
        std::atomic<int> done{0};
        {
            std::vector<std::jthread> threads;
            for (int t = 0; t < 4; t++) {
                threads.emplace_back([&] {
                    for (int i = 0; i < 20; i++) {
                        auto r = gateway.submit([&] {
                            int now = ++in_flight;
                            int prev = max_in_flight.load();
                            while (now > prev && !max_in_flight.compare_exchange_weak(prev, now)) {}
                            std::this_thread::sleep_for(100us);
                            --in_flight;
                        });
                        if (r) done++;
                    }
                });
            }
        }
        REQUIRE(done == 80);
        REQUIRE(max_in_flight == 1);
    }
}
