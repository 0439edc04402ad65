#include "animation/Transition.h"
#include "core/Types.h"

#include <algorithm>

namespace ringchart {

Transition::Transition(TransitionKind kind, double startValue, double endValue,
                       double tStart, double duration, EasingType easing)
    : kind_(kind),
      startValue_(startValue),
      endValue_(endValue),
      tStart_(tStart),
      tEnd_(tStart + std::max(duration, 0.0)),
      easing_(easing) {
}

Transition Transition::add(double tStart, double duration, EasingType easing) {
    return Transition(TransitionKind::Add, VANISHED_SCALE, 1.0, tStart, duration, easing);
}

Transition Transition::remove(double tStart, double duration, EasingType easing) {
    return Transition(TransitionKind::Remove, 1.0, VANISHED_SCALE, tStart, duration, easing);
}

Transition Transition::updateValue(double oldValue, double newValue,
                                   double tStart, double duration, EasingType easing) {
    return Transition(TransitionKind::UpdateValue, oldValue / newValue, 1.0,
                      tStart, duration, easing);
}

double Transition::progress(double tNow) const {
    if (tNow >= tEnd_) {
        return 1.0;
    }
    if (tNow <= tStart_) {
        return 0.0;
    }
    return (tNow - tStart_) / (tEnd_ - tStart_);
}

double Transition::valueAt(double tNow) const {
    double percent = Easing::apply(easing_, progress(tNow));
    return interpolate(startValue_, endValue_, percent);
}

} // namespace ringchart
