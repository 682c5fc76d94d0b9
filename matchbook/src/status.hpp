#pragma once

#include "trade.hpp"
#include "types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace matchbook {

// Outcome of an engine operation. Anything other than Ok left the book untouched.
enum class Status : uint8_t {
    Ok = 0,
    InvalidOrder,       // Zero quantity, missing/invalid price, off tick or lot
    DuplicateOrderId,   // Id already resting in the book
    NotFound,           // Unknown or already removed order id
    RejectedFillOrKill, // FOK could not be fully satisfied
};

[[nodiscard]] inline const char* toString(Status status)
{
    switch (status) {
    case Status::Ok:
        return "OK";
    case Status::InvalidOrder:
        return "INVALID_ORDER";
    case Status::DuplicateOrderId:
        return "DUPLICATE_ORDER_ID";
    case Status::NotFound:
        return "NOT_FOUND";
    case Status::RejectedFillOrKill:
        return "REJECTED_FILL_OR_KILL";
    }
    return "UNKNOWN";
}

// Result of submit/modify
struct ExecutionReport {
    Status status = Status::Ok;
    OrderId orderId = 0;       // Id the order was processed under
    std::vector<Trade> trades; // In generation order
    Qty filledQty = 0;         // Sum of trade quantities
    Qty restingQty = 0;        // Quantity left in the book after processing

    [[nodiscard]] bool ok() const { return status == Status::Ok; }
};

// Internal consistency failure. Indicates a bug in the book, never an input error.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error("Invariant violation: " + what) {}
};

} // namespace matchbook
