#include "engine_setup.hpp"

namespace arbx {

EngineSetup make_engine_setup(utils::ConfigManager& config, const venue::SimulatedMarket& market) {
    const auto& deployment = config.get_deployment_config();
    const auto& execution = config.get_execution_config();

    EngineSetup setup;
    setup.owner = deployment.owner;
    setup.self = deployment.self;
    setup.router = market.router;
    setup.price_oracles = market.price_oracles();
    setup.gas_oracle = market.gas_oracle;
    setup.lending_pool = market.lending_pool;
    setup.monitored_tokens = deployment.monitored_tokens;
    setup.base_token = deployment.base_token;
    setup.stable_token = deployment.stable_token;
    setup.execution.max_slippage = execution.max_slippage;
    setup.execution.gas_units_per_swap = execution.gas_units_per_swap;
    setup.price_feed.max_staleness_sec = execution.max_staleness_sec;
    setup.price_feed.max_future_skew_sec = execution.max_future_skew_sec;
    setup.price_feed.max_deviation = execution.max_price_deviation;
    setup.risk = config.get_risk_config();
    return setup;
}

} // namespace arbx
