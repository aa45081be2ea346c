#pragma once
#include <vector>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <exception>
#include <future>
#include <functional>
#include <atomic>
#include <memory>
#include <algorithm>
#include <cstddef>

namespace fastblur {

class ThreadPool {
public:
    // nthreads == 0 picks the hardware concurrency.
    explicit ThreadPool(size_t nthreads) : stop_(false) {
        if (nthreads == 0) nthreads = hardware_threads();
        workers_.reserve(nthreads);
        for (size_t i = 0; i < nthreads; ++i) {
            workers_.emplace_back([this]() { this->worker_loop_(); });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    static size_t hardware_threads() {
        const unsigned n = std::thread::hardware_concurrency();
        return n ? n : 1u;
    }

    // Enqueue a raw void() task. Tasks queued here must not throw; parallel_for
    // wraps its chunks and forwards their exceptions instead.
    void enqueue(std::function<void()> fn) {
        {
            std::unique_lock<std::mutex> lock(m_);
            tasks_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    // Parallel for over [begin, end), chunked by 'block' items.
    // fn(i0, i1) processes a half-open range. Blocks until every chunk is done;
    // the first exception thrown by a chunk is rethrown here.
    void parallel_for(size_t begin, size_t end, size_t block, const std::function<void(size_t, size_t)>& fn) {
        if (end <= begin) return;
        if (block == 0) block = 1;

        size_t total = end - begin;
        size_t nchunks = (total + block - 1) / block;

        // Fast path single thread or very small job
        if (workers_.empty() || nchunks == 1) {
            fn(begin, end);
            return;
        }

        struct Join {
            std::atomic<size_t> remaining;
            std::mutex em;
            std::exception_ptr error;
            std::promise<void> done;
        };
        auto join = std::make_shared<Join>();
        join->remaining.store(nchunks);
        auto fut = join->done.get_future();

        for (size_t i = 0; i < nchunks; ++i) {
            size_t i0 = begin + i * block;
            size_t i1 = std::min(end, i0 + block);
            enqueue([join, &fn, i0, i1]() {
                try {
                    fn(i0, i1);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(join->em);
                    if (!join->error) join->error = std::current_exception();
                }
                if (join->remaining.fetch_sub(1) == 1) {
                    join->done.set_value();
                }
            });
        }

        fut.get(); // wait for all chunks
        if (join->error) std::rethrow_exception(join->error);
    }

    size_t size() const { return workers_.size(); }

private:
    void worker_loop_() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(m_);
                cv_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::mutex m_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> tasks_;
    bool stop_;
};

} // namespace fastblur
