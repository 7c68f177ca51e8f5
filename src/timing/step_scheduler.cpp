/// @file step_scheduler.cpp
/// @brief Implements fixed-interval stepping

#include "timing/step_scheduler.hpp"

#include "util/log.hpp"

namespace logicsim {

StepScheduler::StepScheduler(SimulationContext* context, float interval)
    : context_(context), interval_(interval > 0.0f ? interval : 0.1f) {}

void StepScheduler::set_context(SimulationContext* context) {
    context_ = context;
    accumulated_ = 0.0f;
    step_requested_ = false;
}

int StepScheduler::tick(float delta_time) {
    if (context_ == nullptr) {
        return 0;
    }

    int steps = 0;
    if (step_requested_) {
        context_->step();
        step_requested_ = false;
        steps++;
    }

    if (!context_->is_running()) {
        accumulated_ = 0.0f;
        return steps;
    }

    accumulated_ += delta_time;
    const float period = effective_interval();
    while (accumulated_ >= period && steps < MAX_STEPS_PER_TICK) {
        context_->step();
        accumulated_ -= period;
        steps++;
    }

    // Drop the backlog instead of catching up over later frames
    if (accumulated_ >= period) {
        log_debug("step scheduler behind by {:.3f}s, dropping backlog", accumulated_);
        accumulated_ = 0.0f;
    }
    return steps;
}

void StepScheduler::toggle_running() {
    if (context_ == nullptr) {
        return;
    }
    if (context_->is_running()) {
        context_->stop();
    } else {
        accumulated_ = 0.0f;
        context_->start();
    }
}

bool StepScheduler::is_running() const {
    return context_ != nullptr && context_->is_running();
}

void StepScheduler::reset() {
    accumulated_ = 0.0f;
    step_requested_ = false;
    if (context_ != nullptr) {
        context_->reset();
    }
}

void StepScheduler::set_speed(float speed) {
    if (speed > 0.0f) {
        speed_ = speed;
    }
}

void StepScheduler::set_interval(float interval) {
    if (interval > 0.0f) {
        interval_ = interval;
    }
}

} // namespace logicsim
