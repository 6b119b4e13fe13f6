#pragma once

#include <cstddef>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

namespace lcr {
namespace system {

// ---------------------------------------------------------------------------
// worker_group - a fixed number of owned, short-lived worker threads
// ---------------------------------------------------------------------------
//
// Every started worker is joined by join() or, at the latest, by the
// destructor, including while the owner is unwinding.
//
// Nothing escapes a worker: an exception thrown by a body is captured and
// handed to the owner through error(w) once the group has joined. spawn()
// reports a worker that could not be started by returning false, leaving the
// already running workers untouched.
// ---------------------------------------------------------------------------
class worker_group {
public:
    explicit worker_group(std::size_t capacity)
        : errors_(capacity)
    {
        threads_.reserve(capacity);
    }

    worker_group(const worker_group&) = delete;
    worker_group& operator=(const worker_group&) = delete;

    ~worker_group() { join(); }

    // Starts body() as worker number size(). False if the group is full or
    // the thread could not be created (the body never runs in that case).
    template<typename Body>
    [[nodiscard]] bool spawn(Body&& body) {
        const std::size_t w = threads_.size();
        if (w == errors_.size()) {
            return false;
        }
        try {
            threads_.emplace_back([this, w, fn = std::forward<Body>(body)]() mutable noexcept {
                try {
                    fn();
                }
                catch (...) {
                    errors_[w] = std::current_exception();
                }
            });
        }
        catch (const std::exception&) {
            return false;
        }
        return true;
    }

    void join() noexcept {
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    // Workers started so far
    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

    // Exception that ended worker `w`, or null. Only valid after join().
    [[nodiscard]] std::exception_ptr error(std::size_t w) const noexcept {
        return w < errors_.size() ? errors_[w] : nullptr;
    }

private:
    std::vector<std::exception_ptr> errors_;
    std::vector<std::thread> threads_;
};

} // namespace system
} // namespace lcr
