#pragma once

#include "animation/Easing.h"

#include <string>
#include <unordered_map>

namespace ringchart {

enum class TransitionKind {
    Add,
    Remove,
    UpdateValue
};

// Scale factor used in place of 0 at the vanishing end of Add and Remove
// transitions, so geometry never collapses to a zero-size segment.
inline constexpr double VANISHED_SCALE = 0.01;

// ============================================================================
// Transition - one timed scale-factor tween for a single item
//
// Progress is polled with an explicit time stamp; there is no live timer.
// ============================================================================

class Transition {
public:
    Transition(TransitionKind kind, double startValue, double endValue,
               double tStart, double duration, EasingType easing);

    // Standard transitions for each kind.
    static Transition add(double tStart, double duration, EasingType easing);
    static Transition remove(double tStart, double duration, EasingType easing);
    // Starts at oldValue / newValue so the rendered value (newValue * scale)
    // begins at oldValue, and converges to 1.
    static Transition updateValue(double oldValue, double newValue,
                                  double tStart, double duration, EasingType easing);

    TransitionKind kind() const { return kind_; }
    double startValue() const { return startValue_; }
    double endValue() const { return endValue_; }

    // Linear progress in [0, 1].
    double progress(double tNow) const;
    // Eased scale factor at tNow.
    double valueAt(double tNow) const;
    bool isComplete(double tNow) const { return tNow >= tEnd_; }

private:
    TransitionKind kind_;
    double startValue_;
    double endValue_;
    double tStart_;
    double tEnd_;
    EasingType easing_;
};

// State of one in-flight transition as seen by a single frame.
struct TransitionSample {
    TransitionKind kind = TransitionKind::Add;
    double value = 1.0;
};

// Read-only per-frame view of every live transition, keyed by item id.
using AnimationSnapshot = std::unordered_map<std::string, TransitionSample>;

} // namespace ringchart
