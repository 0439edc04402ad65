#pragma once

#include "animation/Easing.h"
#include "animation/Transition.h"
#include "core/ChartItem.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace ringchart {

// ============================================================================
// ChartAnimator - diffs successive item lists and drives per-item transitions
//
// Per item id: Absent -(Add)-> Present -(UpdateValue)*-> Present -(Remove)-> Absent.
// At most one transition is live per id; starting a new one for an id drops
// the previous record immediately. All time stamps are supplied by the
// caller (seconds, monotonic), so the animator never reads a clock itself.
// ============================================================================

class ChartAnimator {
public:
    explicit ChartAnimator(ChartItemList initialItems = {},
                           double duration = 0.15,
                           EasingType easing = EasingType::EaseIn);

    // Timing used for transitions started from now on.
    void setTiming(double duration, EasingType easing);

    // Diff newItems against the last list seen and start the transitions it
    // implies. Returns true if at least one transition started; otherwise
    // the new list is adopted as is. When an id appears more than once in
    // newItems only its last occurrence is kept.
    bool update(const ChartItemList& newItems, double tNow);

    // Advance to tNow, dropping finished transitions (and the reinserted
    // copies of fully removed items). Returns true while any remain live.
    bool tick(double tNow);

    // Release every transition immediately. Items mid-removal disappear.
    void dispose();

    bool isAnimating() const { return !transitions_.empty(); }
    size_t activeTransitionCount() const { return transitions_.size(); }

    // Live transition for id, or null.
    const Transition* transitionFor(const std::string& id) const;

    // Latest list passed to update() (or the initial list).
    const ChartItemList& items() const { return items_; }

    // Items to draw this frame: items() plus items mid-removal, each kept
    // between the same neighbours it had before removal. Values are not scaled.
    const ChartItemList& renderItems() const { return renderItems_; }

    // Scale factor of every live transition as of the last update()/tick().
    const AnimationSnapshot& snapshot() const { return snapshot_; }

private:
    struct RemovingEntry {
        size_t index;  // position in renderItems_
        ChartItem item;
    };

    void startTransition(const std::string& id, Transition transition);
    void releaseTransition(const std::string& id);
    void rebuildSnapshot(double tNow);
    void placeRemovingItems(const ChartItemList& previousRender,
                            const ChartItemList& newItems);

    static ChartItemList withoutDuplicates(const ChartItemList& items);

    ChartItemList items_;
    std::unordered_map<std::string, Transition> transitions_;
    std::vector<RemovingEntry> removing_;  // ascending by index

    ChartItemList renderItems_;
    AnimationSnapshot snapshot_;

    double duration_;
    EasingType easing_;
};

} // namespace ringchart
