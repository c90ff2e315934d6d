#include "hook_dispatcher.hpp"
#include "compact_log.hpp"
#include <exception>

namespace pushgate {

void HookDispatcher::add_step(std::string name, Step step) {
    steps_.emplace_back(std::move(name), std::move(step));
}

StepResult HookDispatcher::run_step(const std::string& name, const Step& step) const {
    StepResult result{name};
    auto start = std::chrono::steady_clock::now();
    try {
        result.status = step();
    } catch (const std::exception& e) {
        result.status = ExitStatus::ValidationError;
        result.error = e.what();
        Log::error("hook", name + " failed: " + result.error);
    } catch (...) {
        result.status = ExitStatus::ValidationError;
        result.error = "unknown exception";
        Log::error("hook", name + " failed: " + result.error);
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    return result;
}

ExitStatus HookDispatcher::aggregate(const std::vector<StepResult>& results) {
    for (const auto& r : results) {
        if (r.status != ExitStatus::Clean) return ExitStatus::Violations;
    }
    return ExitStatus::Clean;
}

void HookDispatcher::print_summary(const std::vector<StepResult>& results) {
    compact::Writer::nl();
    compact::Writer::line("Security checks:");
    for (const auto& r : results) {
        std::string line = r.status == ExitStatus::Clean ? "   ✅ " : "   ❌ ";
        line += r.name;
        line += " (";
        line += std::to_string(r.elapsed.count());
        line += " ms): ";
        line += r.error.empty() ? describe(r.status) : r.error;
        compact::Writer::line(line);
    }
}

ExitStatus HookDispatcher::run() {
    results_.clear();
    for (const auto& [name, step] : steps_) {
        Log::debug("hook", "running " + name);
        results_.push_back(run_step(name, step));
    }
    print_summary(results_);

    auto verdict = aggregate(results_);
    if (verdict == ExitStatus::Clean) {
        compact::Writer::status(compact::Color::Green, "✅ All security checks passed");
    } else {
        compact::Writer::status(compact::Color::Red, "❌ Push blocked by security checks");
    }
    return verdict;
}

} // namespace pushgate
