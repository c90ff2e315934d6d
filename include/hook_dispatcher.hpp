#pragma once

#include "exit_status.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <functional>

namespace pushgate {

struct StepResult {
    std::string name;
    ExitStatus status = ExitStatus::Clean;
    std::chrono::milliseconds elapsed{0};
    std::string error;  // set when the step threw
};

// Runs independent checks in order; a failing step never stops the next one
class HookDispatcher {
public:
    using Step = std::function<ExitStatus()>;

    void add_step(std::string name, Step step);
    size_t size() const { return steps_.size(); }

    ExitStatus run();
    const std::vector<StepResult>& results() const { return results_; }

    // Clean iff every step was clean
    static ExitStatus aggregate(const std::vector<StepResult>& results);

private:
    StepResult run_step(const std::string& name, const Step& step) const;
    static void print_summary(const std::vector<StepResult>& results);

    std::vector<std::pair<std::string, Step>> steps_;
    std::vector<StepResult> results_;
};

} // namespace pushgate
