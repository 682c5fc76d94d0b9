#include "bookprinter.hpp"
#include "engineconfig.hpp"
#include "matchingengine.hpp"

#include <exception>
#include <iostream>
#include <string>

using namespace matchbook;

namespace {

void printTrades(const ExecutionReport& report, Price priceScale)
{
    std::cout << "  status " << toString(report.status) << ", " << report.trades.size() << " trade(s)" << std::endl;
    for (const auto& trade : report.trades) {
        std::cout << "    trade #" << trade.id << ": " << trade.qty << " @ " << formatPrice(trade.price, priceScale)
                  << " (buy " << trade.buyOrderId << ", sell " << trade.sellOrderId << ")" << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        EngineConfig config;

        // Parse args (minimal)
        if (argc > 1) {
            std::cout << "Loading config from " << argv[1] << "..." << std::endl;
            config = EngineConfig::loadFromFile(argv[1]);
        }

        std::cout << "Matchbook Matching Engine" << std::endl;
        std::cout << "Instrument " << config.instrument.symbol << ", day reset at " << toString(config.dayReset)
                  << " UTC" << std::endl;

        MatchingEngine engine(config);
        const Price scale = config.instrument.priceScale;

        // Seed both sides
        std::cout << "Adding buy 1000 @ " << formatPrice(100 * scale, scale) << std::endl;
        printTrades(engine.submit(makeOrder(0, Side::Buy, OrderType::Limit, 100 * scale, 1000, "user1")), scale);

        std::cout << "Adding sell 400 @ " << formatPrice(101 * scale, scale) << std::endl;
        printTrades(engine.submit(makeOrder(0, Side::Sell, OrderType::GoodForDay, 101 * scale, 400, "user2")), scale);

        // Crossing sell trades at the resting bid's price
        std::cout << "Adding sell 500 @ " << formatPrice(99 * scale, scale) << std::endl;
        printTrades(engine.submit(makeOrder(0, Side::Sell, OrderType::Limit, 99 * scale, 500, "user3")), scale);

        std::cout << "Adding FOK buy 600 @ " << formatPrice(101 * scale, scale) << std::endl;
        printTrades(engine.submit(makeOrder(0, Side::Buy, OrderType::FillOrKill, 101 * scale, 600, "user4")), scale);

        if (engine.runMaintenance()) {
            std::cout << "Day reset boundary passed, GFD orders purged" << std::endl;
        }

        printBook(std::cout, engine.snapshot(), engine.instrument(), config.snapshotDepth);

        auto stats = engine.stats();
        std::cout << "Statistics:" << std::endl;
        std::cout << "  orders submitted: " << stats.ordersSubmitted << std::endl;
        std::cout << "  trades executed: " << stats.tradesExecuted << std::endl;
        std::cout << "  average latency: " << stats.averageLatencyMicros() << " us" << std::endl;
        std::cout << "  max latency: " << stats.maxLatencyNs / 1000 << " us" << std::endl;

        engine.verifyInvariants();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
