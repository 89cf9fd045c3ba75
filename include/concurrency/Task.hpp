#pragma once

#include <exception>
#include <future>
#include <stdexcept>
#include <type_traits>

namespace tmr::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Task whose outcome (value or exception) travels back through a promise
template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;

    PromisedTask() = default;

    std::future<T> getFuture() { return promise.get_future(); }

    void operator()() override {
        try {
            if constexpr (std::is_void_v<T>) {
                run();
                promise.set_value();
            } else promise.set_value(run());
        } catch (const std::exception&) {
            promise.set_exception(std::current_exception());
        }
    }

protected:
    virtual T run() = 0;
};

}
