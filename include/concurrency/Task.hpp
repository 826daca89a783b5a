#pragma once

#include <string_view>

namespace sg::concurrency {

// Unit of work run once by a ThreadPool worker.
struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Shown in pool diagnostics
    [[nodiscard]] virtual std::string_view name() const noexcept { return "task"; }
};

}
