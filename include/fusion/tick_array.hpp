#ifndef FUSION_TICK_ARRAY_HPP
#define FUSION_TICK_ARRAY_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace fusion {

// Tick returned by an initialized-tick scan. tick is null when the scan reached
// the protocol bound (MIN/MAX_TICK_INDEX) without tick data.
struct InitializedTick {
    const TickFacade* tick;
    int32_t tick_index;
};

// =============================================================================
// TickArraySequence - contiguous logical view over evenly spaced tick arrays
// =============================================================================

class TickArraySequence {
public:
    // Sorts the arrays by start index and checks they are 88 * tick_spacing apart
    static Result<TickArraySequence> create(std::vector<TickArrayFacade> tick_arrays, uint16_t tick_spacing);

    // First and last tick index covered by the sequence
    int32_t start_index() const;
    int32_t end_index() const;

    uint16_t tick_spacing() const { return tick_spacing_; }
    const std::vector<TickArrayFacade>& tick_arrays() const { return tick_arrays_; }

    Result<const TickFacade*> tick(int32_t tick_index) const;

    // First initialized tick strictly above tick_index
    Result<InitializedTick> next_initialized_tick(int32_t tick_index) const;
    // First initialized tick at or below tick_index
    Result<InitializedTick> prev_initialized_tick(int32_t tick_index) const;

private:
    TickArraySequence(std::vector<TickArrayFacade> tick_arrays, uint16_t tick_spacing)
        : tick_arrays_(std::move(tick_arrays)), tick_spacing_(tick_spacing) {}

    std::vector<TickArrayFacade> tick_arrays_;
    uint16_t tick_spacing_;
};

} // namespace fusion

#endif // FUSION_TICK_ARRAY_HPP
