#include "bridge/dispatcher.h"
#include "engine/engine.h"
#include "test_harness.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace SimShell;
using namespace std::chrono_literals;

static void test_value_and_hook(){
    Dispatcher d(2);
    std::atomic<int> hooks{0};
    auto f = d.submit([]{ return 6 * 7; }, [&]{ ++hooks; });
    EXPECT_EQ(f.get(), 42);
    EXPECT_TRUE(wait_until([&]{ return hooks.load() == 1; }));
    EXPECT_EQ(d.worker_count(), size_t{2});
}

static void test_exception_travels_to_future(){
    Dispatcher d(1);
    auto f = d.submit([]() -> int { throw EngineError("unmapped"); });
    bool caught = false;
    try {
        f.get();
    } catch(const EngineError& e) {
        caught = std::string(e.what()) == "unmapped";
    }
    EXPECT_TRUE(caught);
}

static void test_work_runs_concurrently(){
    Dispatcher d(3);
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;
    for(int i = 0; i < 3; ++i){
        futures.push_back(d.submit([&]{
            int now = ++inside;
            int seen = peak.load();
            while(now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(50ms);
            --inside;
        }));
    }
    for(auto& f : futures) f.get();
    EXPECT_TRUE(peak.load() > 1);
}

static void test_shutdown_drops_queue(){
    Dispatcher d(1);
    std::atomic<bool> go{false};
    auto blocker = d.submit([&]{ while(!go) std::this_thread::sleep_for(1ms); });
    auto queued = d.submit([]{ return 1; });
    EXPECT_TRUE(wait_until([&]{ return d.active() == 1; }));
    EXPECT_EQ(d.pending(), size_t{1});

    std::thread releaser([&]{ std::this_thread::sleep_for(20ms); go = true; });
    d.shutdown(2000ms);
    releaser.join();

    EXPECT_FALSE(d.accepting());
    bool broken = false;
    try {
        queued.get();
    } catch(const std::future_error&) {
        broken = true;
    }
    EXPECT_TRUE(broken);

    auto late = d.submit([]{ return 2; });
    EXPECT_TRUE(late.wait_for(0ms) == std::future_status::ready);
}

static void test_shutdown_detaches_stuck_worker(){
    auto gate = std::make_shared<std::atomic<bool>>(false);
    auto d = std::make_unique<Dispatcher>(1);
    auto f = d->submit([gate]{ while(!*gate) std::this_thread::sleep_for(1ms); return 5; });
    EXPECT_TRUE(wait_until([&]{ return d->active() == 1; }));

    auto begin = std::chrono::steady_clock::now();
    d->shutdown(50ms);
    auto waited = std::chrono::steady_clock::now() - begin;
    EXPECT_TRUE(waited < 1000ms);
    d.reset();

    *gate = true;
    EXPECT_EQ(f.get(), 5);
}

static void test_failing_hook_keeps_worker(){
    Dispatcher d(1);
    auto first = d.submit([]{ return 1; }, []{ throw 7; });
    EXPECT_EQ(first.get(), 1);
    auto second = d.submit([]{ return 2; }, []{ throw std::runtime_error("hook"); });
    EXPECT_EQ(second.get(), 2);
    auto third = d.submit([]{ return 3; });
    EXPECT_EQ(third.get(), 3);
    EXPECT_TRUE(wait_until([&]{ return d.completed() == 3; }));
}

int main(int argc, char** argv){
    QCoreApplication app(argc, argv);
    test_value_and_hook();
    test_exception_travels_to_future();
    test_work_runs_concurrently();
    test_shutdown_drops_queue();
    test_failing_hook_keeps_worker();
    test_shutdown_detaches_stuck_worker();
    return finish("dispatcher");
}
