#pragma once

#include <future>
#include <stdexcept>

namespace skiff::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

struct PromisedTask : Task {
    std::promise<bool> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<bool> p) : promise(std::move(p)) {}

    void operator()() override { throw std::runtime_error("PromisedTask must implement operator()()"); }
};

}
