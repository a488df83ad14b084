#ifndef FUSION_ERROR_HPP
#define FUSION_ERROR_HPP

#include <cstdint>
#include <optional>
#include <utility>

namespace fusion {

// =============================================================================
// Error Codes
// =============================================================================

enum class Error : uint8_t {
    TICK_ARRAY_NOT_EVENLY_SPACED,
    TICK_INDEX_OUT_OF_BOUNDS,
    INVALID_TICK_INDEX,
    ARITHMETIC_OVERFLOW,
    AMOUNT_EXCEEDS_MAX_U64,
    AMOUNT_EXCEEDS_LIMIT_ORDER_INPUT_AMOUNT,
    SQRT_PRICE_OUT_OF_BOUNDS,
    TICK_SEQUENCE_EMPTY,
    SQRT_PRICE_LIMIT_OUT_OF_BOUNDS,
    INVALID_SQRT_PRICE_LIMIT_DIRECTION,
    ZERO_TRADABLE_AMOUNT,
    INVALID_TIMESTAMP,
    INVALID_TRANSFER_FEE,
    INVALID_SLIPPAGE_TOLERANCE,
    TICK_INDEX_NOT_IN_ARRAY,
    INVALID_TICK_ARRAY_SEQUENCE,
    LIMIT_ORDER_AND_POOL_ARE_OUT_OF_SYNC
};

const char* to_string(Error error);
// Enumerator name, e.g. "ARITHMETIC_OVERFLOW"
const char* error_code(Error error);

// =============================================================================
// Result<T> - value or error, returned by every fallible operation
// =============================================================================

template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(error) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    // Throws std::bad_optional_access when called on an error
    const T& value() const& { return value_.value(); }
    T& value() & { return value_.value(); }
    T&& value() && { return std::move(value_).value(); }

    const T& operator*() const& { return *value_; }
    T& operator*() & { return *value_; }
    const T* operator->() const { return &*value_; }
    T* operator->() { return &*value_; }

    Error error() const { return *error_; }

    T value_or(T fallback) const { return value_ ? *value_ : fallback; }

private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

} // namespace fusion

#endif // FUSION_ERROR_HPP
