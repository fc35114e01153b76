#pragma once

#include "arbitrage_engine.hpp"
#include "utils/config_manager.hpp"
#include "venue/simulated_market.hpp"

namespace arbx {

// Wires a loaded configuration to the collaborators of a simulated market
EngineSetup make_engine_setup(utils::ConfigManager& config, const venue::SimulatedMarket& market);

} // namespace arbx
