#pragma once

#include "dayreset.hpp"
#include "instrument.hpp"

#include <cstddef>
#include <string>

namespace matchbook {

struct EngineConfig {
    Instrument instrument = defaultInstrument();
    DayResetSchedule dayReset{};
    size_t snapshotDepth = 10;    // Default depth for snapshot()
    bool checkInvariants = false; // Verify the whole book after every mutation

    // Load from a flat JSON object file. Missing keys keep their defaults.
    [[nodiscard]] static EngineConfig loadFromFile(const std::string& path);

    // Parse from JSON text
    [[nodiscard]] static EngineConfig parse(const std::string& json);

    // Throws std::invalid_argument on out-of-range values
    void validate() const;
};

} // namespace matchbook
