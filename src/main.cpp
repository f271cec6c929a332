#include "common/Logger.h"
#include "common/Config.h"
#include "analytics/TechnicalIndicators.h"
#include "backtest/DataHistory.h"
#include "backtest/BacktestEngine.h"
#include "backtest/ReportSerializer.h"
#include "strategy/SignalGenerator.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace signalbench;

static void printUsage(const char* program) {
    std::cout << "Usage: " << program << " --backtest <candles.csv|candles.json> [options]\n"
              << "  --config <path>            config file (default: config/config.json)\n"
              << "  --strategy <type>          ema_cross | rsi_oversold | macd_cross | multi\n"
              << "  --timeframe <tf>           all | 1m | 3m | 6m\n"
              << "  --volume <threshold>       enable volume surge filter\n"
              << "  --initial-capital <x>      starting capital\n"
              << "  --json                     print JSON report to stdout\n";
}

static void printSummary(const std::string& strategy_name,
                         const std::vector<Signal>& signals,
                         const StrategyComparison& comparison) {
    const auto& stats = comparison.stats;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "---------------------------------------------\n";
    std::cout << " Strategy        : " << strategy_name << "\n";
    std::cout << " Signals         : " << signals.size() << "\n";
    std::cout << " Trades          : " << stats.total_trades
              << " (win " << stats.winning_trades << ", loss " << comparison.losing_trades << ")\n";
    std::cout << " Win rate        : " << stats.win_rate << "%\n";
    std::cout << " Final capital   : " << stats.final_capital
              << " (" << stats.profit_percentage << "%)\n";
    std::cout << " Max drawdown    : " << stats.max_drawdown << "%\n";
    std::cout << " Buy & hold      : " << stats.hold_final_capital
              << " (" << stats.hold_profit_percentage << "%)\n";
    std::cout << " Outperforms hold: " << (comparison.outperforms_hold ? "yes" : "no") << "\n";
    std::cout << "---------------------------------------------\n";
}

int main(int argc, char* argv[]) {
    std::string data_path;
    std::string config_path = "config/config.json";
    std::string cli_strategy;
    std::string cli_timeframe;
    double cli_initial_capital = 0.0;
    double cli_volume_threshold = 0.0;
    bool json_output = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--backtest" && i + 1 < argc) {
            data_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--strategy" && i + 1 < argc) {
            cli_strategy = argv[++i];
        } else if (arg == "--timeframe" && i + 1 < argc) {
            cli_timeframe = argv[++i];
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg == "--initial-capital" && i + 1 < argc) {
            try {
                cli_initial_capital = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --initial-capital value. Ignored.\n";
            }
        } else if (arg == "--volume" && i + 1 < argc) {
            try {
                cli_volume_threshold = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --volume value. Ignored.\n";
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
        }
    }

    if (data_path.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    Config& config = Config::getInstance();
    config.load(config_path);

    if (!cli_strategy.empty() && !config.setStrategyType(cli_strategy)) {
        std::cerr << "Unknown --strategy value: " << cli_strategy << ". Ignored.\n";
    }
    if (!cli_timeframe.empty() && !config.setTimeframe(cli_timeframe)) {
        std::cerr << "Unknown --timeframe value: " << cli_timeframe << ". Ignored.\n";
    }
    if (cli_initial_capital > 0.0) {
        config.setInitialCapital(cli_initial_capital);
    }
    if (cli_volume_threshold > 0.0) {
        config.setVolumeFilter(true, cli_volume_threshold);
    }

    try {
        // JSON 리포트는 stdout을 쓰므로 콘솔 로그는 error만
        Logger::getInstance().initialize(config.getLogDir(), json_output ? "error" : config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    const auto candles = backtest::DataHistory::load(data_path);
    if (candles.empty()) {
        LOG_ERROR("No candles loaded from {}", data_path);
        return 1;
    }

    const auto strategy_config = config.getStrategyConfig();
    const std::string strategy_name = strategy::strategyTypeName(strategy_config.params);
    LOG_INFO("Running {} over {} candles (timeframe {}, volume filter {})",
             strategy_name, candles.size(),
             strategy::timeframeToString(strategy_config.window.timeframe),
             strategy_config.volume.enabled ? "on" : "off");

    const auto signals = strategy::SignalGenerator::generateSignals(candles, strategy_config);
    const auto window = strategy::SignalGenerator::filterByTimeframe(candles, strategy_config.window);
    const auto comparison = backtest::BacktestEngine::compareWithHold(
        window, signals, config.getInitialCapital());

    LOG_INFO("Backtest completed: {} signals, {} trades, final capital {:.2f}",
             signals.size(), comparison.stats.total_trades, comparison.stats.final_capital);

    if (json_output) {
        using analytics::TechnicalIndicators;
        const auto ema = config.getEmaCrossParams();

        nlohmann::json report;
        report["strategy"] = strategy_name;
        report["candles"] = window.size();
        report["signals"] = backtest::ReportSerializer::signalsToJson(signals);
        report["stats"] = backtest::ReportSerializer::toJson(comparison);
        report["indicators"]["ema_fast"] = backtest::ReportSerializer::indicatorToJson(
            TechnicalIndicators::calculateEMA(window, ema.fast_period));
        report["indicators"]["ema_slow"] = backtest::ReportSerializer::indicatorToJson(
            TechnicalIndicators::calculateEMA(window, ema.slow_period));
        report["indicators"]["rsi"] = backtest::ReportSerializer::indicatorToJson(
            TechnicalIndicators::calculateRSI(window, config.getRsiParams().period));
        report["indicators"]["macd"] = backtest::ReportSerializer::macdToJson(
            TechnicalIndicators::calculateMACD(window));
        std::cout << report.dump(2) << std::endl;
    } else {
        printSummary(strategy_name, signals, comparison);
    }

    return 0;
}
