#include "interaction_animator.h"

namespace catface {

InteractionAnimator::InteractionAnimator(const AnimationConfig& config) : config_(config) {
    CATFACE_ASSERT(config_.ripple_duration.count() > 0, "Ripple duration must be positive.");
}

void InteractionAnimator::OnTap(const Point2D& origin, TimePoint now) {
    tap_time_ = now;

    TapRipple ripple;
    ripple.origin = origin;
    ripple.elapsed_fraction = 0.0f;
    ripple.max_radius = config_.ripple_max_radius;
    ripple_ = ripple;
    ripple_state_ = RippleState::kRunning;

    // Last tap wins: earlier fade phases are simply forgotten
    sprite_opacity_ = 1.0f;
    opacity_phase_ = OpacityPhase::kVisible;
}

void InteractionAnimator::Tick(TimePoint now) {
    if (ripple_state_ == RippleState::kIdle && opacity_phase_ == OpacityPhase::kRest) {
        return;
    }
    const auto since_tap = now > tap_time_ ? now - tap_time_ : Clock::duration::zero();
    TickRipple(since_tap);
    TickOpacity(since_tap);
}

void InteractionAnimator::Reset() {
    ripple_.reset();
    ripple_state_ = RippleState::kIdle;
    sprite_opacity_ = 1.0f;
    opacity_phase_ = OpacityPhase::kRest;
    tap_time_ = TimePoint{};
}

void InteractionAnimator::TickRipple(Clock::duration since_tap) {
    if (ripple_state_ != RippleState::kRunning || !ripple_) {
        return;
    }
    const auto elapsed = std::chrono::duration<double>(since_tap) /
                         std::chrono::duration<double>(config_.ripple_duration);
    if (elapsed >= 1.0) {
        ripple_->elapsed_fraction = 1.0f;
        ripple_state_ = RippleState::kIdle;
        return;
    }
    ripple_->elapsed_fraction = static_cast<float>(elapsed);
}

void InteractionAnimator::TickOpacity(Clock::duration since_tap) {
    if (opacity_phase_ == OpacityPhase::kRest) {
        return;
    }
    if (since_tap >= config_.fade_out_delay + config_.fade_in_delay) {
        sprite_opacity_ = 1.0f;
        opacity_phase_ = OpacityPhase::kRest;
    } else if (since_tap >= config_.fade_out_delay) {
        sprite_opacity_ = 0.0f;
        opacity_phase_ = OpacityPhase::kHidden;
    } else {
        sprite_opacity_ = 1.0f;
        opacity_phase_ = OpacityPhase::kVisible;
    }
}

} // namespace catface
