#pragma once

#include "booklevel.hpp"
#include "matchingengine.hpp"
#include "types.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace matchbook {

// Feed message codes
enum class MessageType : uint8_t { NewOrder = 1, CancelOrder = 2, ModifyOrder = 3, Trade = 4, BookSnapshot = 5 };

struct MarketDataMessage {
    MessageType type;
    uint64_t sequence;

    // NewOrder / CancelOrder / ModifyOrder / Trade
    OrderId orderId = 0;
    Side side = Side::Buy;
    OrderType orderType = OrderType::Limit;
    Price price = 0;
    Qty qty = 0;

    // BookSnapshot, best level first
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;
};

[[nodiscard]] inline MarketDataMessage newOrderMessage(uint64_t sequence, Side side, OrderType type, Price price,
                                                      Qty qty)
{
    MarketDataMessage message{MessageType::NewOrder, sequence};
    message.side = side;
    message.orderType = type;
    message.price = price;
    message.qty = qty;
    return message;
}

[[nodiscard]] inline MarketDataMessage cancelMessage(uint64_t sequence, OrderId id)
{
    MarketDataMessage message{MessageType::CancelOrder, sequence};
    message.orderId = id;
    return message;
}

[[nodiscard]] inline MarketDataMessage modifyMessage(uint64_t sequence, OrderId id, Price price, Qty qty)
{
    MarketDataMessage message{MessageType::ModifyOrder, sequence};
    message.orderId = id;
    message.price = price;
    message.qty = qty;
    return message;
}

[[nodiscard]] inline MarketDataMessage snapshotMessage(uint64_t sequence, std::vector<BookLevel> bids,
                                                       std::vector<BookLevel> asks)
{
    MarketDataMessage message{MessageType::BookSnapshot, sequence};
    message.bids = std::move(bids);
    message.asks = std::move(asks);
    return message;
}

enum class FeedResult : uint8_t { Applied = 0, SequenceGap, Rejected };

[[nodiscard]] const char* toString(FeedResult result);

struct FeedStats {
    uint64_t messagesProcessed = 0;
    uint64_t newOrders = 0;
    uint64_t cancellations = 0;
    uint64_t modifications = 0;
    uint64_t trades = 0;
    uint64_t snapshots = 0;
    uint64_t errors = 0;
    uint64_t sequenceGaps = 0;
    uint64_t totalProcessingNs = 0;
    uint64_t minLatencyNs = 0;
    uint64_t maxLatencyNs = 0;

    [[nodiscard]] double averageLatencyMicros() const
    {
        return messagesProcessed > 0 ? static_cast<double>(totalProcessingNs) / 1000.0 /
                                           static_cast<double>(messagesProcessed)
                                     : 0.0;
    }
};

// Applies a sequenced feed to the engine through its public operations.
// Not thread-safe; use one processor per feed.
class MarketDataProcessor {
public:
    explicit MarketDataProcessor(MatchingEngine& engine);

    // Messages must arrive with strictly increasing sequence numbers
    FeedResult process(const MarketDataMessage& message);

    // Apply a batch, logging failures. Returns the number applied.
    size_t processBatch(const std::vector<MarketDataMessage>& messages);

    [[nodiscard]] const FeedStats& stats() const { return m_stats; }
    void resetStats() { m_stats = FeedStats{}; }

    [[nodiscard]] uint64_t lastSequence() const { return m_lastSequence; }

private:
    FeedResult apply(const MarketDataMessage& message);

    // Replace the book contents with the snapshot rows. Invalid or crossed
    // rows reject the snapshot and leave the book untouched.
    FeedResult rebuild(const MarketDataMessage& message);

    void recordLatency(uint64_t latencyNs);

    MatchingEngine& m_engine;
    uint64_t m_lastSequence = 0;
    FeedStats m_stats;
};

} // namespace matchbook
