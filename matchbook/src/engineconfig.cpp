#include "engineconfig.hpp"
#include "jsonutils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace matchbook {

using namespace json;

EngineConfig EngineConfig::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

EngineConfig EngineConfig::parse(const std::string& json)
{
    EngineConfig config;
    Instrument& instrument = config.instrument;

    if (hasKey(json, "symbol")) {
        instrument.symbol = extractString(json, "symbol");
    }
    instrument.description = extractString(json, "description");
    instrument.priceScale = extractInt(json, "price_scale", instrument.priceScale);

    // tick_size is a decimal price, scaled like every other price (0.01 -> 10000)
    instrument.tickSize = extractFixedPoint(json, "tick_size", instrument.priceScale, instrument.tickSize);

    int64_t lotSize = extractInt(json, "lot_size", static_cast<int64_t>(instrument.lotSize));
    if (lotSize <= 0) {
        throw std::invalid_argument("lot_size must be positive");
    }
    instrument.lotSize = static_cast<Qty>(lotSize);

    config.dayReset.hour = static_cast<int>(extractInt(json, "day_reset_hour", config.dayReset.hour));
    config.dayReset.minute = static_cast<int>(extractInt(json, "day_reset_minute", config.dayReset.minute));

    int64_t depth = extractInt(json, "snapshot_depth", static_cast<int64_t>(config.snapshotDepth));
    if (depth <= 0) {
        throw std::invalid_argument("snapshot_depth must be positive");
    }
    config.snapshotDepth = static_cast<size_t>(depth);

    config.checkInvariants = extractBool(json, "check_invariants", config.checkInvariants);

    config.validate();
    return config;
}

void EngineConfig::validate() const
{
    if (instrument.symbol.empty()) {
        throw std::invalid_argument("symbol must not be empty");
    }
    if (instrument.priceScale <= 0) {
        throw std::invalid_argument("price_scale must be positive");
    }
    if (instrument.tickSize <= 0) {
        throw std::invalid_argument("tick_size must be positive");
    }
    if (instrument.lotSize == 0) {
        throw std::invalid_argument("lot_size must be positive");
    }
    if (snapshotDepth == 0) {
        throw std::invalid_argument("snapshot_depth must be positive");
    }
    dayReset.validate();
}

} // namespace matchbook
