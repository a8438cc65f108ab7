/// @file gauge_animator.cpp
/// @brief Implements gauge registration, transition scheduling and teardown

#include "animation/gauge_animator.hpp"

#include "animation/pulse_overseer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>
#include <utility>

namespace statgauge {

namespace {

constexpr float DEFAULT_MAX_VALUE = 100.0f;
constexpr float MIN_MAX_VALUE = 1.0f;

/// Eases one gauge from its value at spawn time to its target. Holds a raw
/// pointer into the animator's map: the animator always cancels this task
/// before erasing or replacing the state, and a cancelled task is never
/// ticked again.
class TransitionTask : public FrameTask {
  public:
    TransitionTask(GaugeAnimationState* state, const AnimatorSettings& settings)
        : state_(state), start_value_(state->current_value), duration_(settings.duration),
          curve_(settings.curve), write_color_(settings.enable_color_transitions) {}

    bool tick(const FrameClock& clock) override {
        elapsed_ += clock.delta();
        float progress = duration_ > 0.0f ? clamp01(elapsed_ / duration_) : 1.0f;

        // Already at target: a single terminal write keeps the binding in sync
        if (progress >= 1.0f || start_value_ == state_->target_value) {
            finish();
            return false;
        }

        float eased = curve_ ? curve_(progress) : progress;
        state_->current_value = lerp(start_value_, state_->target_value, eased);
        write_frame();
        return true;
    }

  private:
    void finish() {
        state_->current_value = state_->target_value;
        write_frame();
        state_->transition.reset();
    }

    void write_frame() {
        VisualBinding* binding = state_->binding;
        if (binding == nullptr) {
            return;
        }
        binding->set_max(state_->max_value);
        binding->set_value(state_->current_value);
        if (write_color_) {
            binding->set_fill_color(style_color(state_->style, state_->fraction()));
        }
    }

    GaugeAnimationState* state_;
    float start_value_;
    float elapsed_ = 0.0f;
    float duration_;
    EasingCurve curve_;
    bool write_color_;
};

/// Style used for gauges created by set_target before registration
GaugeStyle fallback_style() {
    GaugeStyle style;
    style.normal_color = {1.0f, 1.0f, 1.0f, 1.0f};
    style.low_color = style.normal_color;
    style.high_color = style.normal_color;
    style.critical = never_critical();
    return style;
}

} // namespace

GaugeAnimator::GaugeAnimator(TaskScheduler& scheduler, AnimatorSettings settings)
    : scheduler_(scheduler), settings_(std::move(settings)) {
    if (!std::isfinite(settings_.duration) || settings_.duration < 0.0f) {
        settings_.duration = 0.0f;
    }
}

GaugeAnimator::~GaugeAnimator() {
    shutdown_all();
}

void GaugeAnimator::register_gauge(const std::string& key, VisualBinding* binding,
                                   const GaugeStyle& style) {
    if (key.empty()) {
        std::fprintf(stderr, "[statgauge] Ignoring gauge registration with an empty key.\n");
        return;
    }
    if (binding == nullptr) {
        std::fprintf(stderr, "[statgauge] Ignoring gauge '%s': no binding.\n", key.c_str());
        return;
    }

    GaugeAnimationState& state = gauges_[key];
    state.transition.cancel();

    state = GaugeAnimationState{};
    state.binding = binding;
    state.style = style;
    state.style.thresholds = normalize_thresholds(style.thresholds);
    state.max_value = DEFAULT_MAX_VALUE;

    float shown = binding->displayed_value().value_or(0.0f);
    if (!std::isfinite(shown)) {
        shown = 0.0f;
    }
    state.current_value = std::clamp(shown, 0.0f, state.max_value);
    state.target_value = state.current_value;

    binding->set_fill_color(state.style.normal_color);
    binding->set_opacity(1.0f);

    ensure_pulse();

    if (settings_.verbose_logging) {
        std::fprintf(stderr, "[statgauge] Registered gauge '%s' (%zu total)\n", key.c_str(),
                     gauges_.size());
    }
}

void GaugeAnimator::set_target(const std::string& key, float value, float max_value) {
    if (key.empty()) {
        return;
    }

    if (!std::isfinite(max_value) || max_value < MIN_MAX_VALUE) {
        max_value = MIN_MAX_VALUE;
    }
    if (!std::isfinite(value)) {
        value = 0.0f;
    }
    value = std::clamp(value, 0.0f, max_value);

    auto it = gauges_.find(key);
    if (it == gauges_.end()) {
        GaugeAnimationState fresh;
        fresh.style = fallback_style();
        fresh.current_value = value;
        it = gauges_.emplace(key, std::move(fresh)).first;
        if (settings_.verbose_logging) {
            std::fprintf(stderr, "[statgauge] set_target on unregistered gauge '%s'\n",
                         key.c_str());
        }
    }

    GaugeAnimationState& state = it->second;
    state.target_value = value;
    state.max_value = max_value;
    start_transition(state);
    ensure_pulse();
}

void GaugeAnimator::start_transition(GaugeAnimationState& state) {
    // Cancel first: the old task must never write after this point
    state.transition.cancel();
    state.transition = scheduler_.spawn(std::make_unique<TransitionTask>(&state, settings_));
}

void GaugeAnimator::ensure_pulse() {
    if (!settings_.enable_pulse || pulse_.is_running()) {
        return;
    }
    pulse_ = scheduler_.spawn(std::make_unique<PulseOverseer>(&gauges_));
}

void GaugeAnimator::unregister_gauge(const std::string& key) {
    auto it = gauges_.find(key);
    if (it == gauges_.end()) {
        return;
    }
    it->second.transition.cancel();
    gauges_.erase(it);
}

void GaugeAnimator::shutdown_all() {
    pulse_.cancel();
    pulse_.reset();
    for (auto& [key, state] : gauges_) {
        (void)key;
        state.transition.cancel();
    }
    if (settings_.verbose_logging && !gauges_.empty()) {
        std::fprintf(stderr, "[statgauge] Shut down %zu gauges\n", gauges_.size());
    }
    gauges_.clear();
}

const GaugeAnimationState* GaugeAnimator::find(const std::string& key) const {
    auto it = gauges_.find(key);
    if (it != gauges_.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace statgauge
