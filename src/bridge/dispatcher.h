#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace SimShell {

// Fixed-size worker pool for blocking calls. Items submitted independently
// carry no ordering guarantee relative to each other.
class Dispatcher {
public:
    explicit Dispatcher(size_t num_workers = 1);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Runs work on a worker. The returned future receives its value or
    // exception; on_ready runs on the worker right after the future is ready.
    // Once shut down, work is dropped and the future reports a broken promise.
    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F work, std::function<void()> on_ready = {}) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(work));
        auto future = task->get_future();
        enqueue([task, on_ready = std::move(on_ready)] {
            (*task)();
            if (on_ready) on_ready();
        });
        return future;
    }

    // Stops accepting work and drops queued items. Running items get up to
    // grace to finish; workers still busy after that are detached.
    void shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    size_t worker_count() const { return worker_count_; }
    size_t pending() const;
    size_t active() const;
    bool accepting() const;
    uint64_t completed() const;

private:
    struct Shared {
        mutable std::mutex mtx;
        std::condition_variable work_cv;
        std::condition_variable idle_cv;
        std::deque<std::function<void()>> queue;
        size_t active{0};
        uint64_t completed{0};
        bool running{true};
    };

    static void worker_loop(std::shared_ptr<Shared> shared);
    void enqueue(std::function<void()> item);

    std::shared_ptr<Shared> shared_;
    std::vector<std::thread> workers_;
    size_t worker_count_;
};

} // namespace SimShell
