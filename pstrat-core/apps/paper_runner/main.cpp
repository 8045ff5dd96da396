#include "paper_gateway.hpp"

#include "pstrat/core/config.hpp"
#include "pstrat/core/errors.hpp"
#include "pstrat/core/event_dispatcher.hpp"
#include "pstrat/core/history/bar_merge.hpp"
#include "pstrat/core/history/dbn_bar_store.hpp"
#include "pstrat/core/logging.hpp"
#include "pstrat/core/settings_store.hpp"
#include "pstrat/core/strategy_engine.hpp"
#include "pstrat/core/strategy_factory.hpp"
#include "pstrat/strategies/builtin_strategies.hpp"

#include <yaml-cpp/yaml.h>

#include <exception>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace pc = pstrat::core;
namespace ph = pstrat::core::history;

namespace {

struct RunnerConfig {
    std::string barDir{"."};
    pc::Interval replayInterval{pc::Interval::Minute};
    bool autoStart{true};
    std::vector<pc::ContractData> contracts{};
};

RunnerConfig runnerConfigFromYaml(const YAML::Node& node) {
    RunnerConfig cfg{};
    if (!node || node.IsNull()) return cfg;
    try {
        cfg.barDir = node["bar_dir"].as<std::string>(cfg.barDir);
        cfg.autoStart = node["auto_start"].as<bool>(cfg.autoStart);
        const auto interval = node["replay_interval"].as<std::string>("1m");
        if (!pc::parseInterval(interval, cfg.replayInterval)) {
            throw pc::ConfigError("unknown replay_interval: " + interval);
        }
        for (const auto& c : node["contracts"]) {
            pc::ContractData contract{};
            contract.instrument = c["instrument"].as<std::string>();
            contract.symbol = c["symbol"].as<std::string>(contract.instrument);
            contract.venue = c["venue"].as<std::string>("");
            contract.tickSize = c["tick_size"].as<double>(0.01);
            contract.lotSize = c["lot_size"].as<int>(1);
            contract.size = c["size"].as<int>(1);
            cfg.contracts.push_back(std::move(contract));
        }
    } catch (const YAML::Exception& e) {
        throw pc::ConfigError(std::string("runner config: ") + e.what());
    }
    return cfg;
}

// Posts buffered gateway events until the paper broker has nothing left
void pumpGateway(pstrat::apps::PaperGateway& gateway, pc::EventDispatcher& dispatcher) {
    std::vector<pc::EngineEvent> events;
    while (gateway.drainEvents(events) > 0) {
        for (auto& ev : events) {
            while (!dispatcher.post(ev)) dispatcher.waitIdle();
        }
        events.clear();
        dispatcher.waitIdle();
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            std::cerr << "Usage: paper_runner <config.yaml>\n";
            return 2;
        }
        const std::string path = argv[1];
        const pc::EngineConfig engineCfg = pc::loadEngineConfig(path);
        const YAML::Node root = YAML::LoadFile(path);
        const RunnerConfig runnerCfg = runnerConfigFromYaml(root["runner"]);
        auto logger = pc::makeLogger(engineCfg, "paper_runner");

        pstrat::apps::PaperGateway gateway(logger);
        for (const auto& contract : runnerCfg.contracts) gateway.addContract(contract);

        pc::YamlSettingsStore store(engineCfg.settingsPath, engineCfg.dataPath);
        pc::StrategyFactory factory;
        if (!pstrat::strategies::registerBuiltinStrategies(factory)) {
            logger->error("strategy class registration failed");
            return 1;
        }

        ph::DbnBarStore bars(runnerCfg.barDir, logger);
        pc::StrategyEngine engine(gateway, store, factory, engineCfg, logger);
        engine.setDatabase(&bars);
        engine.init();

        engine.initAllStrategies();
        engine.waitForInit();
        if (runnerCfg.autoStart) engine.startAllStrategies();

        pc::EventDispatcher dispatcher(engine, engineCfg.eventQueueCapacity);
        dispatcher.start();

        // Replay every contract's bar file as a stream of last-price ticks
        std::vector<std::string> instruments;
        std::map<std::string, std::vector<pc::BarData>> series;
        pc::HistoryRequest req{};
        req.interval = runnerCfg.replayInterval;
        req.startNs = 0;
        req.endNs = std::numeric_limits<std::uint64_t>::max();
        for (const auto& contract : runnerCfg.contracts) {
            req.instrument = contract.instrument;
            instruments.push_back(contract.instrument);
            series[contract.instrument] = bars.queryBars(req);
            logger->info("loaded {} bars for {}", series[contract.instrument].size(), contract.instrument);
        }

        std::size_t ticks = 0;
        for (const auto& slice : ph::mergeBars(instruments, series)) {
            for (const auto& [instrument, bar] : slice) {
                gateway.setClock(bar.tsNs);
                pc::TickData tick{};
                tick.instrument = instrument;
                tick.gateway = pstrat::apps::PaperGateway::kGatewayName;
                tick.tsNs = bar.tsNs;
                tick.lastPrice = bar.close;
                tick.volume = static_cast<int>(bar.volume);
                tick.bidPrice = bar.close;
                tick.askPrice = bar.close;
                while (!dispatcher.post(tick)) dispatcher.waitIdle();
                ++ticks;
            }
            dispatcher.waitIdle();
            pumpGateway(gateway, dispatcher);
        }

        dispatcher.stop();
        engine.close();

        for (const auto& name : engine.strategyNames()) {
            const auto snap = engine.strategySnapshot(name);
            if (!snap) continue;
            for (const auto& [instrument, position] : snap->positions) {
                logger->info("{} {} position {}", name, instrument, position);
            }
        }
        logger->info("replay done: ticks={} dispatched={} dropped={} orders={} trades={}",
                     ticks, dispatcher.processed(), dispatcher.dropped(),
                     gateway.orderCount(), gateway.tradeCount());
        spdlog::shutdown();
        return 0;
    } catch (const pc::ConfigError& ex) {
        std::cerr << "Config error: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
