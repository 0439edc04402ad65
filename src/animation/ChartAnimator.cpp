#include "animation/ChartAnimator.h"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <unordered_set>
#include <utility>

namespace ringchart {

ChartAnimator::ChartAnimator(ChartItemList initialItems, double duration, EasingType easing)
    : items_(withoutDuplicates(initialItems)),
      duration_(duration),
      easing_(easing) {
    renderItems_ = items_;
}

void ChartAnimator::setTiming(double duration, EasingType easing) {
    duration_ = duration;
    easing_ = easing;
}

// ============================================================================
// withoutDuplicates - last occurrence of each id wins
// ============================================================================

ChartItemList ChartAnimator::withoutDuplicates(const ChartItemList& items) {
    std::unordered_map<std::string, size_t> lastIndex;
    for (size_t i = 0; i < items.size(); ++i) {
        lastIndex[items[i].id()] = i;
    }
    if (lastIndex.size() == items.size()) {
        return items;
    }

    ChartItemList unique;
    unique.reserve(lastIndex.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (lastIndex[items[i].id()] == i) {
            unique.push_back(items[i]);
        } else {
            std::cerr << "ringchart: duplicate item id '" << items[i].id()
                      << "', keeping its last occurrence" << std::endl;
        }
    }
    return unique;
}

// ============================================================================
// Transition bookkeeping
// ============================================================================

void ChartAnimator::releaseTransition(const std::string& id) {
    transitions_.erase(id);

    auto it = std::find_if(removing_.begin(), removing_.end(),
                           [&id](const RemovingEntry& e) { return e.item.id() == id; });
    if (it == removing_.end()) {
        return;
    }
    size_t released = it->index;
    removing_.erase(it);
    // Later entries move up into the freed slot
    for (auto& entry : removing_) {
        if (entry.index > released) {
            --entry.index;
        }
    }
}

void ChartAnimator::startTransition(const std::string& id, Transition transition) {
    // Most recent wins: drop whatever was in flight for this id first
    releaseTransition(id);
    transitions_.emplace(id, std::move(transition));
}

const Transition* ChartAnimator::transitionFor(const std::string& id) const {
    auto it = transitions_.find(id);
    return it == transitions_.end() ? nullptr : &it->second;
}

// ============================================================================
// update - classify the change from the previous list to newItems
// ============================================================================

bool ChartAnimator::update(const ChartItemList& newList, double tNow) {
    ChartItemList newItems = withoutDuplicates(newList);
    const ChartItemList& oldItems = items_;

    std::unordered_map<std::string, int> oldIndex;
    for (size_t i = 0; i < oldItems.size(); ++i) {
        oldIndex[oldItems[i].id()] = static_cast<int>(i);
    }
    std::unordered_map<std::string, int> newIndex;
    for (size_t i = 0; i < newItems.size(); ++i) {
        newIndex[newItems[i].id()] = static_cast<int>(i);
    }

    bool animated = false;

    // Removed items: keep drawing them where they were while they shrink
    for (size_t i = 0; i < oldItems.size(); ++i) {
        const ChartItem& item = oldItems[i];
        if (newIndex.count(item.id()) == 0) {
            startTransition(item.id(), Transition::remove(tNow, duration_, easing_));
            removing_.push_back(RemovingEntry{i, item});
            animated = true;
        }
    }

    // Added items
    for (const auto& item : newItems) {
        if (oldIndex.count(item.id()) == 0) {
            startTransition(item.id(), Transition::add(tNow, duration_, easing_));
            animated = true;
        }
    }

    // Value changes
    for (const auto& item : newItems) {
        auto it = oldIndex.find(item.id());
        if (it == oldIndex.end()) {
            continue;
        }
        const ChartItem& previous = oldItems[static_cast<size_t>(it->second)];
        if (previous.value() != item.value()) {
            startTransition(item.id(),
                            Transition::updateValue(previous.value(), item.value(),
                                                    tNow, duration_, easing_));
            animated = true;
        }
    }

    placeRemovingItems(renderItems_, newItems);
    items_ = std::move(newItems);
    rebuildSnapshot(tNow);
    return animated;
}

// ============================================================================
// placeRemovingItems - render positions of the items mid-removal
//
// Each one goes right after the nearest item before it in the previous render
// list that is still present, or first if there is none. Items sharing that
// neighbour keep their previous relative order.
// ============================================================================

void ChartAnimator::placeRemovingItems(const ChartItemList& previousRender,
                                       const ChartItemList& newItems) {
    std::unordered_set<std::string> present;
    for (const auto& item : newItems) {
        present.insert(item.id());
    }
    std::unordered_map<std::string, const ChartItem*> removingById;
    for (const auto& entry : removing_) {
        removingById[entry.item.id()] = &entry.item;
    }

    std::vector<ChartItem> leading;
    std::unordered_map<std::string, std::vector<ChartItem>> following;
    const std::string* anchor = nullptr;
    for (const auto& item : previousRender) {
        if (present.count(item.id()) != 0) {
            anchor = &item.id();
            continue;
        }
        auto it = removingById.find(item.id());
        if (it == removingById.end()) {
            continue;
        }
        if (anchor) {
            following[*anchor].push_back(*it->second);
        } else {
            leading.push_back(*it->second);
        }
        removingById.erase(it);
    }

    std::vector<RemovingEntry> placed;
    size_t position = 0;
    auto placeRun = [&placed, &position](const std::vector<ChartItem>& run) {
        for (const auto& item : run) {
            placed.push_back(RemovingEntry{position++, item});
        }
    };

    placeRun(leading);
    for (const auto& item : newItems) {
        ++position;
        auto it = following.find(item.id());
        if (it != following.end()) {
            placeRun(it->second);
        }
    }
    // Not in the previous render list: keep them at the end
    for (const auto& entry : removing_) {
        if (removingById.count(entry.item.id()) != 0) {
            placed.push_back(RemovingEntry{position++, entry.item});
        }
    }

    removing_ = std::move(placed);
}

// ============================================================================
// tick
// ============================================================================

bool ChartAnimator::tick(double tNow) {
    if (transitions_.empty()) {
        // Idle: the last snapshot stays valid
        return false;
    }

    std::vector<std::string> finished;
    for (const auto& entry : transitions_) {
        if (entry.second.isComplete(tNow)) {
            finished.push_back(entry.first);
        }
    }
    for (const auto& id : finished) {
        releaseTransition(id);
    }

    rebuildSnapshot(tNow);
    return !transitions_.empty();
}

void ChartAnimator::dispose() {
    transitions_.clear();
    removing_.clear();
    snapshot_.clear();
    renderItems_ = items_;
}

// ============================================================================
// rebuildSnapshot - render list and scale factors as of tNow
// ============================================================================

void ChartAnimator::rebuildSnapshot(double tNow) {
    snapshot_.clear();
    for (const auto& entry : transitions_) {
        snapshot_[entry.first] = TransitionSample{entry.second.kind(), entry.second.valueAt(tNow)};
    }

    // removing_ is ascending by position, so earlier inserts never shift later ones
    renderItems_ = items_;
    for (const auto& entry : removing_) {
        size_t index = std::min(entry.index, renderItems_.size());
        renderItems_.insert(renderItems_.begin() + static_cast<std::ptrdiff_t>(index), entry.item);
    }
}

} // namespace ringchart
