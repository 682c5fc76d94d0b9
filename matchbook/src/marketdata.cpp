#include "marketdata.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>

namespace matchbook {

const char* toString(FeedResult result)
{
    switch (result) {
    case FeedResult::Applied:
        return "APPLIED";
    case FeedResult::SequenceGap:
        return "SEQUENCE_GAP";
    case FeedResult::Rejected:
        return "REJECTED";
    }
    return "UNKNOWN";
}

MarketDataProcessor::MarketDataProcessor(MatchingEngine& engine) : m_engine(engine) {}

FeedResult MarketDataProcessor::process(const MarketDataMessage& message)
{
    auto start = std::chrono::steady_clock::now();

    if (message.sequence <= m_lastSequence) {
        ++m_stats.sequenceGaps;
        return FeedResult::SequenceGap;
    }
    m_lastSequence = message.sequence;

    FeedResult result = apply(message);
    if (result != FeedResult::Applied) {
        return result;
    }

    auto duration = std::chrono::steady_clock::now() - start;
    recordLatency(static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count()));
    ++m_stats.messagesProcessed;
    return result;
}

size_t MarketDataProcessor::processBatch(const std::vector<MarketDataMessage>& messages)
{
    size_t processed = 0;
    for (const auto& message : messages) {
        FeedResult result = process(message);
        if (result == FeedResult::Applied) {
            ++processed;
        } else {
            ++m_stats.errors;
            std::cerr << "Error processing market data seq " << message.sequence << ": " << toString(result)
                      << std::endl;
        }
    }
    return processed;
}

FeedResult MarketDataProcessor::apply(const MarketDataMessage& message)
{
    switch (message.type) {
    case MessageType::NewOrder: {
        auto report = m_engine.submit(makeOrder(message.orderId, message.side, message.orderType, message.price,
                                                message.qty));
        // A killed FOK is a normal outcome of the order, not a feed failure
        if (!report.ok() && report.status != Status::RejectedFillOrKill) {
            return FeedResult::Rejected;
        }
        ++m_stats.newOrders;
        return FeedResult::Applied;
    }
    case MessageType::CancelOrder:
        if (m_engine.cancel(message.orderId) != Status::Ok) {
            return FeedResult::Rejected;
        }
        ++m_stats.cancellations;
        return FeedResult::Applied;
    case MessageType::ModifyOrder:
        if (!m_engine.modify(message.orderId, message.price, message.qty).ok()) {
            return FeedResult::Rejected;
        }
        ++m_stats.modifications;
        return FeedResult::Applied;
    case MessageType::Trade:
        // Informational: external prints do not touch the book
        ++m_stats.trades;
        return FeedResult::Applied;
    case MessageType::BookSnapshot:
        return rebuild(message);
    }
    return FeedResult::Rejected;
}

FeedResult MarketDataProcessor::rebuild(const MarketDataMessage& message)
{
    // Check every row before the book is replaced
    const Instrument& instrument = m_engine.instrument();
    auto validRow = [&instrument](const BookLevel& level) {
        return level.price > 0 && level.totalQty > 0 && instrument.isValidPrice(level.price) &&
               instrument.isValidQty(level.totalQty);
    };
    if (!std::all_of(message.bids.begin(), message.bids.end(), validRow) ||
        !std::all_of(message.asks.begin(), message.asks.end(), validRow)) {
        return FeedResult::Rejected;
    }

    // A crossed snapshot would trade against itself while rebuilding
    if (!message.bids.empty() && !message.asks.empty()) {
        auto bestBid = std::max_element(message.bids.begin(), message.bids.end(),
                                         [](const BookLevel& a, const BookLevel& b) { return a.price < b.price; });
        auto bestAsk = std::min_element(message.asks.begin(), message.asks.end(),
                                        [](const BookLevel& a, const BookLevel& b) { return a.price < b.price; });
        if (bestBid->price >= bestAsk->price) {
            return FeedResult::Rejected;
        }
    }

    m_engine.clear();

    bool complete = true;
    for (size_t i = 0; i < message.bids.size(); ++i) {
        const auto& level = message.bids[i];
        auto report = m_engine.submit(
            makeOrder(0, Side::Buy, OrderType::Limit, level.price, level.totalQty, "market_bid_" + std::to_string(i)));
        complete = complete && report.ok();
    }
    for (size_t i = 0; i < message.asks.size(); ++i) {
        const auto& level = message.asks[i];
        auto report = m_engine.submit(
            makeOrder(0, Side::Sell, OrderType::Limit, level.price, level.totalQty, "market_ask_" + std::to_string(i)));
        complete = complete && report.ok();
    }

    if (!complete) {
        return FeedResult::Rejected;
    }
    ++m_stats.snapshots;
    return FeedResult::Applied;
}

void MarketDataProcessor::recordLatency(uint64_t latencyNs)
{
    m_stats.totalProcessingNs += latencyNs;
    m_stats.maxLatencyNs = std::max(m_stats.maxLatencyNs, latencyNs);
    if (m_stats.messagesProcessed == 0) {
        m_stats.minLatencyNs = latencyNs;
    } else {
        m_stats.minLatencyNs = std::min(m_stats.minLatencyNs, latencyNs);
    }
}

} // namespace matchbook
