#pragma once

#include <cstdint>
#include <string>

namespace tickflow {

/// Engine configuration parameters.
struct EngineConfig {
    uint64_t max_ticks = 1000;          // runToCompletion budget when none is given
    std::string log_level = "warn";     // spdlog level name
    bool report_ambiguous = true;       // diagnose pending nodes no entry matches
    bool drop_transient_signals = true; // unconsumed transient signals last one tick
    bool validate_on_load = true;       // run TopologyValidator in loadTopology
};

} // namespace tickflow
