#include "bookprinter.hpp"

#include <iomanip>
#include <sstream>

namespace matchbook {

namespace {

constexpr int kColumnWidth = 12;
constexpr int kRuleWidth = 80;

void printCell(std::ostream& out, const std::string& text) { out << std::left << std::setw(kColumnWidth) << text; }

} // namespace

std::string formatPrice(Price price, Price priceScale)
{
    std::ostringstream out;
    out << "$" << std::fixed << std::setprecision(2) << static_cast<double>(price) / static_cast<double>(priceScale);
    return out.str();
}

void printBook(std::ostream& out, const BookSnapshot& snapshot, const Instrument& instrument, size_t levels)
{
    const std::string rule(kRuleWidth, '=');

    out << rule << "\n";
    out << "ORDERBOOK: " << instrument.symbol << "  (seq " << snapshot.sequence << ")\n";
    out << rule << "\n";

    printCell(out, "BID QTY");
    out << " | ";
    printCell(out, "BID PRICE");
    out << " | ";
    printCell(out, "ASK PRICE");
    out << " | ";
    printCell(out, "ASK QTY");
    out << "\n" << std::string(kRuleWidth, '-') << "\n";

    for (size_t i = 0; i < levels; ++i) {
        bool hasBid = i < snapshot.bids.size();
        bool hasAsk = i < snapshot.asks.size();
        if (!hasBid && !hasAsk) {
            break;
        }

        printCell(out, hasBid ? std::to_string(snapshot.bids[i].totalQty) : "");
        out << " | ";
        printCell(out, hasBid ? formatPrice(snapshot.bids[i].price, instrument.priceScale) : "");
        out << " | ";
        printCell(out, hasAsk ? formatPrice(snapshot.asks[i].price, instrument.priceScale) : "");
        out << " | ";
        printCell(out, hasAsk ? std::to_string(snapshot.asks[i].totalQty) : "");
        out << "\n";
    }

    out << rule << "\n";
    if (snapshot.bids.empty() && snapshot.asks.empty()) {
        out << "Best Bid: None | Best Ask: None\n";
    } else if (snapshot.asks.empty()) {
        out << "Best Bid: " << formatPrice(snapshot.bids.front().price, instrument.priceScale)
            << " | Best Ask: None\n";
    } else if (snapshot.bids.empty()) {
        out << "Best Bid: None | Best Ask: " << formatPrice(snapshot.asks.front().price, instrument.priceScale)
            << "\n";
    } else {
        Price bid = snapshot.bids.front().price;
        Price ask = snapshot.asks.front().price;
        Price spread = ask - bid;
        double spreadBps = static_cast<double>(spread) / static_cast<double>(bid) * 10000.0;
        out << "Best Bid: " << formatPrice(bid, instrument.priceScale)
            << " | Best Ask: " << formatPrice(ask, instrument.priceScale)
            << " | Spread: " << formatPrice(spread, instrument.priceScale) << " (" << std::fixed
            << std::setprecision(1) << spreadBps << " bps)\n";
    }
    out << rule << std::endl;
}

} // namespace matchbook
