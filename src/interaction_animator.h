#pragma once

#include <optional>
#include "common_defines.h"
#include "config_manager.h"

namespace catface {

// Drives the tap ripple and the sprite fade. Both timers restart on every tap
// and compute progress from wall-clock time, so tick spacing does not matter.
// Main loop only.
class InteractionAnimator {
public:
    enum class RippleState { kIdle, kRunning };
    enum class OpacityPhase { kRest, kVisible, kHidden };

    explicit InteractionAnimator(const AnimationConfig& config = AnimationConfig());

    void OnTap(const Point2D& origin, TimePoint now);
    void Tick(TimePoint now);
    void Reset();

    std::optional<TapRipple> GetRipple() const { return ripple_; }
    RippleState GetRippleState() const { return ripple_state_; }
    bool IsRippleRunning() const { return ripple_state_ == RippleState::kRunning; }

    float GetSpriteOpacity() const { return sprite_opacity_; }
    OpacityPhase GetOpacityPhase() const { return opacity_phase_; }

    const AnimationConfig& GetConfig() const { return config_; }

private:
    void TickRipple(Clock::duration since_tap);
    void TickOpacity(Clock::duration since_tap);

    AnimationConfig config_;
    TimePoint tap_time_{};
    std::optional<TapRipple> ripple_; // Empty until the first tap
    RippleState ripple_state_{ RippleState::kIdle };
    float sprite_opacity_{ 1.0f };
    OpacityPhase opacity_phase_{ OpacityPhase::kRest };
};

} // namespace catface
