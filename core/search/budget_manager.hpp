#pragma once

#include <chrono>

namespace wrc {

/// Tracks the cost of one top-level search: trials run, relaxations
/// taken and wall-clock time. Enforces an optional relaxation ceiling.
class BudgetManager {
public:
    /// max_relaxations == 0 means unlimited.
    explicit BudgetManager(int max_relaxations = 0)
        : max_relaxations_(max_relaxations) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        trials_ = 0;
        relaxations_ = 0;
    }

    void recordTrial() { trials_++; }
    void recordRelaxation() { relaxations_++; }

    bool canRelax() const {
        return max_relaxations_ == 0 || relaxations_ < max_relaxations_;
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int trials() const { return trials_; }
    int relaxations() const { return relaxations_; }
    int maxRelaxations() const { return max_relaxations_; }

private:
    int max_relaxations_;
    int trials_ = 0;
    int relaxations_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace wrc
