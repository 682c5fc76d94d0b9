#include "../src/orderbook.hpp"
#include <gtest/gtest.h>

#include <stdexcept>

using namespace matchbook;

class OrderBookTest : public ::testing::Test {
protected:
    OrderBook book;
    Timestamp now = 1000;

    ExecutionReport add(OrderId id, Side side, Price price, Qty qty, OrderType type = OrderType::Limit)
    {
        auto report = book.submit(makeOrder(id, side, type, price, qty), ++now);
        book.verifyInvariants();
        return report;
    }
};

TEST_F(OrderBookTest, AddLimitOrder)
{
    auto report = add(1, Side::Buy, 100000000, 10);

    EXPECT_EQ(Status::Ok, report.status);
    EXPECT_TRUE(report.trades.empty());
    EXPECT_EQ(10u, report.restingQty);
    EXPECT_EQ(1u, book.bidLevelCount());
    EXPECT_EQ(100000000, book.bestBid().value());
    EXPECT_FALSE(book.bestAsk().has_value());
    EXPECT_EQ(1u, book.orderCount());
}

TEST_F(OrderBookTest, AssignsIdWhenZero)
{
    auto first = add(0, Side::Buy, 100000000, 10);
    auto second = add(0, Side::Buy, 100000000, 10);

    EXPECT_NE(0u, first.orderId);
    EXPECT_NE(first.orderId, second.orderId);
    EXPECT_TRUE(book.contains(first.orderId));
    EXPECT_TRUE(book.contains(second.orderId));
}

TEST_F(OrderBookTest, AssignedIdSkipsRestingIds)
{
    add(1, Side::Buy, 100000000, 10);
    auto report = add(0, Side::Buy, 100000000, 10);

    EXPECT_EQ(2u, report.orderId);
}

TEST_F(OrderBookTest, RejectsDuplicateRestingId)
{
    add(1, Side::Buy, 100000000, 10);
    auto report = add(1, Side::Sell, 101000000, 10);

    EXPECT_EQ(Status::DuplicateOrderId, report.status);
    EXPECT_FALSE(book.bestAsk().has_value());
    EXPECT_EQ(1u, book.orderCount());
}

TEST_F(OrderBookTest, RejectsInvalidOrders)
{
    EXPECT_EQ(Status::InvalidOrder, add(1, Side::Buy, 100000000, 0).status);
    EXPECT_EQ(Status::InvalidOrder, add(2, Side::Buy, 0, 10).status);
    EXPECT_EQ(Status::InvalidOrder, add(3, Side::Sell, -5, 10).status);
    EXPECT_EQ(Status::InvalidOrder, add(4, Side::Buy, 0, 10, OrderType::FillOrKill).status);
    EXPECT_EQ(Status::InvalidOrder, add(5, Side::Buy, 0, 0, OrderType::Market).status);

    EXPECT_EQ(0u, book.orderCount());
}

TEST_F(OrderBookTest, RejectsOffTickAndOffLot)
{
    OrderBook strict(Instrument{"TEST", "Test", 10000, 10, 1000000});

    auto offTick = strict.submit(makeOrder(1, Side::Buy, OrderType::Limit, 100005000, 10), 1);
    auto offLot = strict.submit(makeOrder(2, Side::Buy, OrderType::Limit, 100000000, 15), 2);
    auto onGrid = strict.submit(makeOrder(3, Side::Buy, OrderType::Limit, 100010000, 20), 3);

    EXPECT_EQ(Status::InvalidOrder, offTick.status);
    EXPECT_EQ(Status::InvalidOrder, offLot.status);
    EXPECT_EQ(Status::Ok, onGrid.status);
    EXPECT_EQ(1u, strict.orderCount());
}

TEST_F(OrderBookTest, MarketOrderIgnoresPrice)
{
    add(1, Side::Sell, 100000000, 10);
    auto report = add(2, Side::Buy, 0, 4, OrderType::Market);

    EXPECT_EQ(Status::Ok, report.status);
    EXPECT_EQ(4u, report.filledQty);
}

TEST_F(OrderBookTest, CancelOrder)
{
    add(1, Side::Buy, 100000000, 10);
    EXPECT_EQ(1u, book.orderCount());

    EXPECT_EQ(Status::Ok, book.cancel(1));
    book.verifyInvariants();
    EXPECT_EQ(0u, book.orderCount());
    EXPECT_FALSE(book.bestBid().has_value());

    // Cancel non-existent
    EXPECT_EQ(Status::NotFound, book.cancel(999));
}

TEST_F(OrderBookTest, CancelIsIdempotent)
{
    add(1, Side::Buy, 100000000, 10);
    add(2, Side::Buy, 100000000, 5);

    EXPECT_EQ(Status::Ok, book.cancel(1));
    EXPECT_EQ(Status::NotFound, book.cancel(1));
    EXPECT_EQ(Status::NotFound, book.cancel(1));
    book.verifyInvariants();

    // Second cancel changed nothing
    EXPECT_EQ(1u, book.orderCount());
    EXPECT_EQ(5u, book.bidDepth(1)[0].totalQty);
}

TEST_F(OrderBookTest, CancelFromMiddleOfQueue)
{
    add(1, Side::Sell, 100000000, 10);
    add(2, Side::Sell, 100000000, 20);
    add(3, Side::Sell, 100000000, 30);

    EXPECT_EQ(Status::Ok, book.cancel(2));
    book.verifyInvariants();

    auto depth = book.askDepth(1);
    EXPECT_EQ(40u, depth[0].totalQty);
    EXPECT_EQ(2, depth[0].orderCount);

    // FIFO of the survivors is intact
    auto report = add(4, Side::Buy, 100000000, 15);
    ASSERT_EQ(2u, report.trades.size());
    EXPECT_EQ(1u, report.trades[0].makerOrderId);
    EXPECT_EQ(3u, report.trades[1].makerOrderId);
}

TEST_F(OrderBookTest, FilledOrderCannotBeCancelled)
{
    add(1, Side::Sell, 100000000, 10);
    add(2, Side::Buy, 100000000, 10);

    EXPECT_EQ(Status::NotFound, book.cancel(1));
    EXPECT_EQ(Status::NotFound, book.cancel(2));
}

TEST_F(OrderBookTest, BestBidAskSpread)
{
    add(1, Side::Buy, 100000000, 10);
    add(2, Side::Sell, 100100000, 10);

    EXPECT_EQ(100000000, book.bestBid().value());
    EXPECT_EQ(100100000, book.bestAsk().value());
    EXPECT_EQ(100000, book.spread().value());
}

TEST_F(OrderBookTest, DepthQuery)
{
    // Add 3 buy orders at different prices
    add(1, Side::Buy, 100000000, 10);
    add(2, Side::Buy, 99000000, 20);
    add(3, Side::Buy, 98000000, 30);

    // Add 1 more at top price
    add(4, Side::Buy, 100000000, 5);

    auto depth = book.bidDepth(2);
    ASSERT_EQ(2u, depth.size());

    // Level 1: 100.00 (qty 15, count 2)
    EXPECT_EQ(100000000, depth[0].price);
    EXPECT_EQ(15u, depth[0].totalQty);
    EXPECT_EQ(2, depth[0].orderCount);

    // Level 2: 99.00 (qty 20, count 1)
    EXPECT_EQ(99000000, depth[1].price);
    EXPECT_EQ(20u, depth[1].totalQty);
    EXPECT_EQ(1, depth[1].orderCount);
}

TEST_F(OrderBookTest, FindOrder)
{
    book.submit(makeOrder(1, Side::Buy, OrderType::GoodTillCancel, 100000000, 10, "alice"), 42);

    const Order& order = book.findOrder(1);
    EXPECT_EQ(OrderType::GoodTillCancel, order.type);
    EXPECT_EQ("alice", order.owner);
    EXPECT_EQ(42u, order.timestamp);
    EXPECT_EQ(10u, order.qty);
    EXPECT_EQ(10u, order.remaining);

    // Test non-existent order throws
    EXPECT_THROW((void)book.findOrder(999), std::out_of_range);
}

TEST_F(OrderBookTest, ModifyDecreaseKeepsPriority)
{
    add(1, Side::Buy, 100000000, 10);
    add(2, Side::Buy, 100000000, 10);

    auto report = book.modify(1, 100000000, 4, ++now);
    book.verifyInvariants();
    EXPECT_EQ(Status::Ok, report.status);
    EXPECT_EQ(4u, report.restingQty);
    EXPECT_EQ(4u, book.findOrder(1).remaining);
    EXPECT_EQ(10u, book.findOrder(1).qty);
    EXPECT_EQ(14u, book.bidDepth(1)[0].totalQty);

    // Order 1 is still at the front
    auto fill = add(3, Side::Sell, 100000000, 4);
    ASSERT_EQ(1u, fill.trades.size());
    EXPECT_EQ(1u, fill.trades[0].makerOrderId);
}

TEST_F(OrderBookTest, ModifyIncreaseLosesPriority)
{
    add(1, Side::Buy, 100000000, 10);
    add(2, Side::Buy, 100000000, 10);

    auto report = book.modify(1, 100000000, 20, ++now);
    book.verifyInvariants();
    EXPECT_EQ(Status::Ok, report.status);
    EXPECT_EQ(20u, book.findOrder(1).remaining);
    EXPECT_EQ(20u, book.findOrder(1).qty);
    EXPECT_EQ(30u, book.bidDepth(1)[0].totalQty);

    // Order 2 now has priority
    auto fill = add(3, Side::Sell, 100000000, 12);
    ASSERT_EQ(2u, fill.trades.size());
    EXPECT_EQ(2u, fill.trades[0].makerOrderId);
    EXPECT_EQ(10u, fill.trades[0].qty);
    EXPECT_EQ(1u, fill.trades[1].makerOrderId);
    EXPECT_EQ(2u, fill.trades[1].qty);
}

TEST_F(OrderBookTest, ModifyPriceMovesLevel)
{
    add(1, Side::Buy, 100000000, 10);
    add(2, Side::Buy, 99000000, 10);

    auto report = book.modify(1, 99000000, 10, ++now);
    book.verifyInvariants();
    EXPECT_EQ(Status::Ok, report.status);
    EXPECT_EQ(1u, book.bidLevelCount());
    EXPECT_EQ(99000000, book.bestBid().value());

    // Joined the back of the 99.00 queue
    auto fill = add(3, Side::Sell, 99000000, 10);
    ASSERT_EQ(1u, fill.trades.size());
    EXPECT_EQ(2u, fill.trades[0].makerOrderId);
}

TEST_F(OrderBookTest, ModifyCanCross)
{
    add(1, Side::Buy, 99000000, 10);
    add(2, Side::Sell, 100000000, 6);

    auto report = book.modify(1, 100000000, 10, ++now);
    book.verifyInvariants();

    EXPECT_EQ(Status::Ok, report.status);
    ASSERT_EQ(1u, report.trades.size());
    EXPECT_EQ(100000000, report.trades[0].price);
    EXPECT_EQ(6u, report.trades[0].qty);
    EXPECT_EQ(1u, report.trades[0].takerOrderId);
    EXPECT_EQ(4u, report.restingQty);
    EXPECT_FALSE(book.bestAsk().has_value());
    EXPECT_EQ(4u, book.findOrder(1).remaining);
}

TEST_F(OrderBookTest, ModifyUnknownOrInvalid)
{
    EXPECT_EQ(Status::NotFound, book.modify(999, 100000000, 10, ++now).status);

    add(1, Side::Buy, 100000000, 10);
    EXPECT_EQ(Status::InvalidOrder, book.modify(1, 100000000, 0, ++now).status);
    EXPECT_EQ(Status::InvalidOrder, book.modify(1, 0, 10, ++now).status);

    // Rejected modify leaves the order untouched
    EXPECT_EQ(10u, book.findOrder(1).remaining);
    EXPECT_EQ(100000000, book.findOrder(1).price);
}

TEST_F(OrderBookTest, PurgeExpiredGoodForDay)
{
    Order gfd = makeOrder(1, Side::Buy, OrderType::GoodForDay, 100000000, 10);
    gfd.expiry = 5000;
    book.submit(gfd, ++now);

    Order later = makeOrder(2, Side::Buy, OrderType::GoodForDay, 99000000, 10);
    later.expiry = 9000;
    book.submit(later, ++now);

    add(3, Side::Buy, 98000000, 10, OrderType::GoodTillCancel);

    EXPECT_EQ(0u, book.purgeExpired(4999));
    EXPECT_EQ(1u, book.purgeExpired(5000));
    book.verifyInvariants();
    EXPECT_FALSE(book.contains(1));
    EXPECT_TRUE(book.contains(2));

    EXPECT_EQ(1u, book.purgeGoodForDay());
    book.verifyInvariants();
    EXPECT_EQ(1u, book.orderCount());
    EXPECT_TRUE(book.contains(3));
}

TEST_F(OrderBookTest, ExpiryOnlyKeptForGoodForDay)
{
    Order gtc = makeOrder(1, Side::Buy, OrderType::GoodTillCancel, 100000000, 10);
    gtc.expiry = 5000;
    book.submit(gtc, ++now);

    EXPECT_EQ(0u, book.findOrder(1).expiry);
    EXPECT_EQ(0u, book.purgeExpired(10000));
}

TEST_F(OrderBookTest, Clear)
{
    add(1, Side::Buy, 100000000, 10);
    add(2, Side::Sell, 101000000, 10);

    book.clear();
    book.verifyInvariants();
    EXPECT_EQ(0u, book.orderCount());
    EXPECT_EQ(0u, book.bidLevelCount());
    EXPECT_EQ(0u, book.askLevelCount());

    // Usable after clear
    add(3, Side::Buy, 100000000, 10);
    EXPECT_EQ(1u, book.orderCount());
}

TEST_F(OrderBookTest, SimpleMatch)
{
    // Sell 10 @ 100.00
    add(1, Side::Sell, 100000000, 10);

    // Buy 10 @ 100.00
    auto report = add(2, Side::Buy, 100000000, 10);

    ASSERT_EQ(1u, report.trades.size());
    EXPECT_EQ(10u, report.trades[0].qty);
    EXPECT_EQ(100000000, report.trades[0].price);
    EXPECT_EQ(2u, report.trades[0].buyOrderId);
    EXPECT_EQ(1u, report.trades[0].sellOrderId);
    EXPECT_EQ(10u, report.filledQty);
    EXPECT_EQ(0u, report.restingQty);

    EXPECT_EQ(0u, book.orderCount()); // Both fully filled
}
