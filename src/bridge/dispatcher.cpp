#include "dispatcher.h"
#include "core/logger.h"
#include <algorithm>
#include <exception>

namespace SimShell {

Dispatcher::Dispatcher(size_t num_workers)
    : shared_(std::make_shared<Shared>())
    , worker_count_(std::max<size_t>(1, num_workers))
{
    workers_.reserve(worker_count_);
    for (size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&Dispatcher::worker_loop, shared_);
    }
}

Dispatcher::~Dispatcher() {
    shutdown();
}

void Dispatcher::enqueue(std::function<void()> item) {
    {
        std::lock_guard<std::mutex> lock(shared_->mtx);
        if (!shared_->running) return;
        shared_->queue.push_back(std::move(item));
    }
    shared_->work_cv.notify_one();
}

void Dispatcher::worker_loop(std::shared_ptr<Shared> shared) {
    while (true) {
        std::function<void()> item;
        {
            std::unique_lock<std::mutex> lock(shared->mtx);
            shared->work_cv.wait(lock, [&] { return !shared->running || !shared->queue.empty(); });
            if (!shared->running) break;
            item = std::move(shared->queue.front());
            shared->queue.pop_front();
            ++shared->active;
        }

        // packaged_task stores the work's exception in its future; anything
        // escaping here comes from the completion hook.
        try {
            item();
        } catch (const std::exception& e) {
            log::error(std::string("dispatcher completion hook failed: ") + e.what());
        } catch (...) {
            log::error("dispatcher completion hook failed with a non-standard exception");
        }

        {
            std::lock_guard<std::mutex> lock(shared->mtx);
            --shared->active;
            ++shared->completed;
        }
        shared->idle_cv.notify_all();
    }
}

void Dispatcher::shutdown(std::chrono::milliseconds grace) {
    std::deque<std::function<void()>> dropped;
    bool idle;
    {
        std::unique_lock<std::mutex> lock(shared_->mtx);
        if (!shared_->running && workers_.empty()) return;
        shared_->running = false;
        dropped.swap(shared_->queue);
        idle = shared_->idle_cv.wait_for(lock, grace, [&] { return shared_->active == 0; });
    }
    shared_->work_cv.notify_all();

    if (!dropped.empty()) log::debug("dispatcher dropped " + std::to_string(dropped.size()) + " queued call(s)");

    for (auto& worker : workers_) {
        if (idle) worker.join();
        else worker.detach();
    }
    if (!idle) log::warn("dispatcher shut down with engine calls still running");
    workers_.clear();
}

size_t Dispatcher::pending() const {
    std::lock_guard<std::mutex> lock(shared_->mtx);
    return shared_->queue.size();
}

size_t Dispatcher::active() const {
    std::lock_guard<std::mutex> lock(shared_->mtx);
    return shared_->active;
}

bool Dispatcher::accepting() const {
    std::lock_guard<std::mutex> lock(shared_->mtx);
    return shared_->running;
}

uint64_t Dispatcher::completed() const {
    std::lock_guard<std::mutex> lock(shared_->mtx);
    return shared_->completed;
}

} // namespace SimShell
