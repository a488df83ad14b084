// =============================================================================
// error.cpp - Error code descriptions
// =============================================================================

#include "fusion/error.hpp"

namespace fusion {

const char* to_string(Error error) {
    switch (error) {
        case Error::TICK_ARRAY_NOT_EVENLY_SPACED: return "Tick array not evenly spaced";
        case Error::TICK_INDEX_OUT_OF_BOUNDS: return "Tick index out of bounds";
        case Error::INVALID_TICK_INDEX: return "Invalid tick index";
        case Error::ARITHMETIC_OVERFLOW: return "Arithmetic over- or underflow";
        case Error::AMOUNT_EXCEEDS_MAX_U64: return "Amount exceeds max u64";
        case Error::AMOUNT_EXCEEDS_LIMIT_ORDER_INPUT_AMOUNT: return "Amount exceeds limit order input amount";
        case Error::SQRT_PRICE_OUT_OF_BOUNDS: return "Sqrt price out of bounds";
        case Error::TICK_SEQUENCE_EMPTY: return "Tick sequence empty";
        case Error::SQRT_PRICE_LIMIT_OUT_OF_BOUNDS: return "Sqrt price limit out of bounds";
        case Error::INVALID_SQRT_PRICE_LIMIT_DIRECTION: return "Invalid sqrt price limit direction";
        case Error::ZERO_TRADABLE_AMOUNT: return "Zero tradable amount";
        case Error::INVALID_TIMESTAMP: return "Invalid timestamp";
        case Error::INVALID_TRANSFER_FEE: return "Invalid transfer fee";
        case Error::INVALID_SLIPPAGE_TOLERANCE: return "Invalid slippage tolerance";
        case Error::TICK_INDEX_NOT_IN_ARRAY: return "Tick index not in array";
        case Error::INVALID_TICK_ARRAY_SEQUENCE: return "Invalid tick array sequence";
        case Error::LIMIT_ORDER_AND_POOL_ARE_OUT_OF_SYNC: return "Limit order and pool are out of sync";
    }
    return "Unknown error";
}

const char* error_code(Error error) {
    switch (error) {
        case Error::TICK_ARRAY_NOT_EVENLY_SPACED: return "TICK_ARRAY_NOT_EVENLY_SPACED";
        case Error::TICK_INDEX_OUT_OF_BOUNDS: return "TICK_INDEX_OUT_OF_BOUNDS";
        case Error::INVALID_TICK_INDEX: return "INVALID_TICK_INDEX";
        case Error::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case Error::AMOUNT_EXCEEDS_MAX_U64: return "AMOUNT_EXCEEDS_MAX_U64";
        case Error::AMOUNT_EXCEEDS_LIMIT_ORDER_INPUT_AMOUNT: return "AMOUNT_EXCEEDS_LIMIT_ORDER_INPUT_AMOUNT";
        case Error::SQRT_PRICE_OUT_OF_BOUNDS: return "SQRT_PRICE_OUT_OF_BOUNDS";
        case Error::TICK_SEQUENCE_EMPTY: return "TICK_SEQUENCE_EMPTY";
        case Error::SQRT_PRICE_LIMIT_OUT_OF_BOUNDS: return "SQRT_PRICE_LIMIT_OUT_OF_BOUNDS";
        case Error::INVALID_SQRT_PRICE_LIMIT_DIRECTION: return "INVALID_SQRT_PRICE_LIMIT_DIRECTION";
        case Error::ZERO_TRADABLE_AMOUNT: return "ZERO_TRADABLE_AMOUNT";
        case Error::INVALID_TIMESTAMP: return "INVALID_TIMESTAMP";
        case Error::INVALID_TRANSFER_FEE: return "INVALID_TRANSFER_FEE";
        case Error::INVALID_SLIPPAGE_TOLERANCE: return "INVALID_SLIPPAGE_TOLERANCE";
        case Error::TICK_INDEX_NOT_IN_ARRAY: return "TICK_INDEX_NOT_IN_ARRAY";
        case Error::INVALID_TICK_ARRAY_SEQUENCE: return "INVALID_TICK_ARRAY_SEQUENCE";
        case Error::LIMIT_ORDER_AND_POOL_ARE_OUT_OF_SYNC: return "LIMIT_ORDER_AND_POOL_ARE_OUT_OF_SYNC";
    }
    return "UNKNOWN";
}

} // namespace fusion
