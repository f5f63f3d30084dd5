#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace lv::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Shown in the log when the task throws
    [[nodiscard]] virtual std::string name() const { return "task"; }
};

struct FnTask : Task {
    std::function<void()> fn;
    std::string label;

    explicit FnTask(std::function<void()> f, std::string l = "task") : fn(std::move(f)), label(std::move(l)) {}

    void operator()() override {
        if (!fn) throw std::runtime_error("FnTask has no function");
        fn();
    }

    [[nodiscard]] std::string name() const override { return label; }
};

}
