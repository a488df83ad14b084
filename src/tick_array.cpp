// =============================================================================
// tick_array.cpp - Initialized tick lookup across a tick array sequence
// =============================================================================

#include "fusion/tick_array.hpp"
#include "fusion/tick_math.hpp"

#include <algorithm>

namespace fusion {

namespace {

inline int32_t array_span(uint16_t tick_spacing) {
    return static_cast<int32_t>(TICK_ARRAY_SIZE) * tick_spacing;
}

} // anonymous namespace

Result<TickArraySequence> TickArraySequence::create(std::vector<TickArrayFacade> tick_arrays,
                                                    uint16_t tick_spacing) {
    if (tick_arrays.empty()) {
        return Error::TICK_SEQUENCE_EMPTY;
    }
    if (tick_spacing == 0) {
        return Error::TICK_ARRAY_NOT_EVENLY_SPACED;
    }

    std::sort(tick_arrays.begin(), tick_arrays.end(),
              [](const TickArrayFacade& a, const TickArrayFacade& b) {
                  return a.start_tick_index < b.start_tick_index;
              });

    const int32_t span = array_span(tick_spacing);
    for (size_t i = 1; i < tick_arrays.size(); ++i) {
        if (tick_arrays[i].start_tick_index - tick_arrays[i - 1].start_tick_index != span) {
            return Error::TICK_ARRAY_NOT_EVENLY_SPACED;
        }
    }

    return TickArraySequence(std::move(tick_arrays), tick_spacing);
}

int32_t TickArraySequence::start_index() const {
    return tick_arrays_.front().start_tick_index;
}

int32_t TickArraySequence::end_index() const {
    return tick_arrays_.back().start_tick_index + array_span(tick_spacing_) - 1;
}

Result<const TickFacade*> TickArraySequence::tick(int32_t tick_index) const {
    if (tick_index < start_index() || tick_index > end_index()) {
        return Error::TICK_INDEX_OUT_OF_BOUNDS;
    }
    if (!tick_math::is_tick_initializable(tick_index, tick_spacing_)) {
        return Error::INVALID_TICK_INDEX;
    }

    const int32_t span = array_span(tick_spacing_);
    const size_t array_index = static_cast<size_t>((tick_index - start_index()) / span);
    const TickArrayFacade& array = tick_arrays_[array_index];

    auto slot = tick_math::get_tick_index_in_array(tick_index, array.start_tick_index, tick_spacing_);
    if (!slot) {
        return slot.error();
    }
    return &array.ticks[*slot];
}

Result<InitializedTick> TickArraySequence::next_initialized_tick(int32_t tick_index) const {
    const int32_t end = end_index();
    int32_t next_index = tick_index;
    for (;;) {
        next_index = tick_math::get_next_initializable_tick_index(next_index, tick_spacing_);
        if (next_index > end) {
            // Past the last array: only the protocol bound itself is a valid stop
            if (end >= MAX_TICK_INDEX) {
                return InitializedTick{nullptr, MAX_TICK_INDEX};
            }
            return Error::INVALID_TICK_ARRAY_SEQUENCE;
        }

        auto found = tick(next_index);
        if (!found) {
            return found.error();
        }
        if ((*found)->initialized) {
            return InitializedTick{*found, next_index};
        }
    }
}

Result<InitializedTick> TickArraySequence::prev_initialized_tick(int32_t tick_index) const {
    const int32_t start = start_index();
    int32_t prev_index = tick_math::get_initializable_tick_index(tick_index, tick_spacing_, false);
    for (;;) {
        if (prev_index < start) {
            if (start <= MIN_TICK_INDEX) {
                return InitializedTick{nullptr, MIN_TICK_INDEX};
            }
            return Error::INVALID_TICK_ARRAY_SEQUENCE;
        }

        auto found = tick(prev_index);
        if (!found) {
            return found.error();
        }
        if ((*found)->initialized) {
            return InitializedTick{*found, prev_index};
        }
        prev_index = tick_math::get_prev_initializable_tick_index(prev_index, tick_spacing_);
    }
}

} // namespace fusion
