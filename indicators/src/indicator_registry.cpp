#include "indicator_registry.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_functions.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <utility>

namespace indicators {

    using core::PriceColumn;

    namespace {

        std::string registryKey(const std::string& name) {
            return core::utils::toUpper(core::utils::trim(name));
        }

        std::set<PriceColumn> closeOnly() { return {PriceColumn::Close}; }
        std::set<PriceColumn> highLowClose() { return {PriceColumn::High, PriceColumn::Low, PriceColumn::Close}; }

        IndicatorDefinition singleOutput(const std::string& name, IndicatorKind kind, IndicatorType type,
                                         json defaults, std::set<PriceColumn> columns, ComputeFunction compute)
        {
            IndicatorDefinition definition;
            definition.name = name;
            definition.kind = kind;
            definition.type = type;
            definition.plot_type = PlotType::Line;
            definition.default_params = std::move(defaults);
            definition.required_columns = std::move(columns);
            definition.outputs = {OutputSpec{"value", "", PlotType::Line, ""}};
            definition.compute = std::move(compute);
            return definition;
        }

        IndicatorDefinition movingAverage(const std::string& name) {
            return singleOutput(name, IndicatorKind::SimpleMovingAverage, IndicatorType::Overlay,
                                {{"period", 20}}, closeOnly(),
                [](const core::PriceSeries& prices, const IndicatorParams& params) {
                    const auto& p = std::get<PeriodParams>(params);
                    return std::vector<std::vector<double>>{ta::sma(prices.column(PriceColumn::Close), p.period)};
                });
        }

        IndicatorDefinition exponentialMovingAverage() {
            return singleOutput("EMA", IndicatorKind::ExponentialMovingAverage, IndicatorType::Overlay,
                                {{"period", 12}}, closeOnly(),
                [](const core::PriceSeries& prices, const IndicatorParams& params) {
                    const auto& p = std::get<PeriodParams>(params);
                    return std::vector<std::vector<double>>{ta::ema(prices.column(PriceColumn::Close), p.period)};
                });
        }

        IndicatorDefinition macd() {
            IndicatorDefinition definition;
            definition.name = "MACD";
            definition.kind = IndicatorKind::Macd;
            definition.type = IndicatorType::Subplot;
            definition.plot_type = PlotType::Line;
            definition.default_params = {{"fast", 12}, {"slow", 26}, {"signal", 9}};
            definition.required_columns = closeOnly();
            definition.outputs = {
                OutputSpec{"macd", "", PlotType::Line, ""},
                OutputSpec{"signal", "_signal", PlotType::Line, ""},
                OutputSpec{"hist", "_hist", PlotType::Bar, ""}
            };
            definition.style.line_colors = {{"macd", "#FF6B6B"}, {"signal", "#4ECDC4"}, {"hist", "#45B7D1"}};
            definition.compute = [](const core::PriceSeries& prices, const IndicatorParams& params) {
                const auto& p = std::get<MacdParams>(params);
                auto result = ta::macd(prices.column(PriceColumn::Close), p.fast, p.slow, p.signal);
                return std::vector<std::vector<double>>{std::move(result.macd),
                                                        std::move(result.signal),
                                                        std::move(result.histogram)};
            };
            return definition;
        }

        IndicatorDefinition rsi() {
            auto definition = singleOutput("RSI", IndicatorKind::Rsi, IndicatorType::Subplot,
                                           {{"period", 14}}, closeOnly(),
                [](const core::PriceSeries& prices, const IndicatorParams& params) {
                    const auto& p = std::get<PeriodParams>(params);
                    return std::vector<std::vector<double>>{ta::rsi(prices.column(PriceColumn::Close), p.period)};
                });
            definition.style.color = "#FF6B6B";
            definition.style.width = 2.0;
            return definition;
        }

        IndicatorDefinition bollinger() {
            IndicatorDefinition definition;
            definition.name = "BOLL";
            definition.kind = IndicatorKind::BollingerBands;
            definition.type = IndicatorType::Overlay;
            definition.plot_type = PlotType::Band;
            definition.default_params = {{"period", 20}, {"std", 2.0}};
            definition.required_columns = closeOnly();
            definition.outputs = {
                OutputSpec{"upper", "_upper", PlotType::Line, ""},
                OutputSpec{"middle", "_middle", PlotType::Line, ""},
                OutputSpec{"lower", "_lower", PlotType::Line, ""}
            };
            definition.style.line_colors = {{"upper", "#DDA0DD"}, {"middle", "#98D8C8"}, {"lower", "#DDA0DD"}};
            definition.style.fill_opacity = 0.1;
            definition.compute = [](const core::PriceSeries& prices, const IndicatorParams& params) {
                const auto& p = std::get<BollingerParams>(params);
                auto bands = ta::bollinger(prices.column(PriceColumn::Close), p.period, p.std_dev);
                return std::vector<std::vector<double>>{std::move(bands.upper),
                                                        std::move(bands.middle),
                                                        std::move(bands.lower)};
            };
            return definition;
        }

        IndicatorDefinition kdj() {
            IndicatorDefinition definition;
            definition.name = "KDJ";
            definition.kind = IndicatorKind::Kdj;
            definition.type = IndicatorType::Subplot;
            definition.plot_type = PlotType::Line;
            definition.default_params = {{"n", 9}, {"m1", 3}, {"m2", 3}};
            definition.required_columns = highLowClose();
            definition.outputs = {
                OutputSpec{"k", "_K", PlotType::Line, ""},
                OutputSpec{"d", "_D", PlotType::Line, ""},
                OutputSpec{"j", "_J", PlotType::Line, ""}
            };
            definition.style.line_colors = {{"k", "#FF6B6B"}, {"d", "#4ECDC4"}, {"j", "#45B7D1"}};
            definition.compute = [](const core::PriceSeries& prices, const IndicatorParams& params) {
                const auto& p = std::get<KdjParams>(params);
                auto stoch = ta::stochastic(prices.column(PriceColumn::High),
                                            prices.column(PriceColumn::Low),
                                            prices.column(PriceColumn::Close),
                                            p.n, p.m1, p.m2);
                // J = 3K - 2D; NaN in either input stays NaN
                std::vector<double> j(stoch.k.size());
                for (std::size_t i = 0; i < j.size(); ++i) {
                    j[i] = 3.0 * stoch.k[i] - 2.0 * stoch.d[i];
                }
                return std::vector<std::vector<double>>{std::move(stoch.k), std::move(stoch.d), std::move(j)};
            };
            return definition;
        }

        IndicatorDefinition stochastic() {
            IndicatorDefinition definition;
            definition.name = "STOCH";
            definition.kind = IndicatorKind::Stochastic;
            definition.type = IndicatorType::Subplot;
            definition.plot_type = PlotType::Line;
            definition.default_params = {{"k_period", 14}, {"d_period", 3}};
            definition.required_columns = highLowClose();
            definition.outputs = {
                OutputSpec{"k", "_K", PlotType::Line, ""},
                OutputSpec{"d", "_D", PlotType::Line, ""}
            };
            definition.style.line_colors = {{"k", "#FF6B6B"}, {"d", "#4ECDC4"}};
            definition.compute = [](const core::PriceSeries& prices, const IndicatorParams& params) {
                const auto& p = std::get<StochasticParams>(params);
                // Slow %K and %D are both d_period SMAs
                auto stoch = ta::stochastic(prices.column(PriceColumn::High),
                                            prices.column(PriceColumn::Low),
                                            prices.column(PriceColumn::Close),
                                            p.k_period, p.d_period, p.d_period);
                return std::vector<std::vector<double>>{std::move(stoch.k), std::move(stoch.d)};
            };
            return definition;
        }

        IndicatorDefinition atr() {
            return singleOutput("ATR", IndicatorKind::Atr, IndicatorType::Subplot,
                                {{"period", 14}}, highLowClose(),
                [](const core::PriceSeries& prices, const IndicatorParams& params) {
                    const auto& p = std::get<PeriodParams>(params);
                    return std::vector<std::vector<double>>{ta::atr(prices.column(PriceColumn::High),
                                                                    prices.column(PriceColumn::Low),
                                                                    prices.column(PriceColumn::Close),
                                                                    p.period)};
                });
        }

        IndicatorDefinition williamsR() {
            return singleOutput("WILLR", IndicatorKind::WilliamsR, IndicatorType::Subplot,
                                {{"period", 14}}, highLowClose(),
                [](const core::PriceSeries& prices, const IndicatorParams& params) {
                    const auto& p = std::get<PeriodParams>(params);
                    return std::vector<std::vector<double>>{ta::williamsR(prices.column(PriceColumn::High),
                                                                          prices.column(PriceColumn::Low),
                                                                          prices.column(PriceColumn::Close),
                                                                          p.period)};
                });
        }

        IndicatorDefinition volume() {
            IndicatorDefinition definition;
            definition.name = "VOL";
            definition.kind = IndicatorKind::Volume;
            definition.type = IndicatorType::Subplot;
            definition.plot_type = PlotType::Bar;
            definition.required_columns = {PriceColumn::Volume};
            definition.outputs = {OutputSpec{"volume", "", PlotType::Bar, "Volume"}};
            definition.compute = [](const core::PriceSeries& prices, const IndicatorParams&) {
                return std::vector<std::vector<double>>{prices.column(PriceColumn::Volume)};
            };
            return definition;
        }

    } // end anonymous namespace

    IndicatorRegistry IndicatorRegistry::withBuiltins() {
        IndicatorRegistry registry;
        registerBuiltinIndicators(registry);
        return registry;
    }

    void IndicatorRegistry::registerIndicator(IndicatorDefinition definition) {
        const std::string key = registryKey(definition.name);
        if (key.empty()) {
            throw core::InvalidParameter(definition.name, "name", "indicator name must not be empty");
        }
        if (definition.compute && definition.outputs.empty()) {
            throw core::InvalidParameter(definition.name, "outputs", "a computed indicator must declare at least one output");
        }
        if (!definition.default_params.is_object()) {
            throw core::InvalidParameter(definition.name, "default_params", "default parameters must be a JSON object");
        }
        std::set<std::string> keys;
        for (const auto& output : definition.outputs) {
            if (!keys.insert(output.key).second) {
                throw core::InvalidParameter(definition.name, "outputs",
                                             fmt::format("duplicate output key '{}'", output.key));
            }
        }

        auto logger = core::logging::getLogger();
        auto it = definitions_.find(key);
        if (it != definitions_.end()) {
            logger->debug("Replacing indicator definition '{}'", key);
            it->second = std::move(definition);
        } else {
            logger->debug("Registering indicator '{}' ({}, {} outputs)", key, toString(definition.type), definition.outputs.size());
            definitions_.emplace(key, std::move(definition));
        }
    }

    const IndicatorDefinition& IndicatorRegistry::lookup(const std::string& name) const {
        const IndicatorDefinition* definition = find(name);
        if (!definition) {
            throw core::UnknownIndicator(name);
        }
        return *definition;
    }

    const IndicatorDefinition* IndicatorRegistry::find(const std::string& name) const {
        auto it = definitions_.find(registryKey(name));
        return it == definitions_.end() ? nullptr : &it->second;
    }

    bool IndicatorRegistry::contains(const std::string& name) const {
        return find(name) != nullptr;
    }

    std::set<std::string> IndicatorRegistry::listNames() const {
        std::set<std::string> names;
        for (const auto& entry : definitions_) {
            names.insert(entry.first);
        }
        return names;
    }

    void registerBuiltinIndicators(IndicatorRegistry& registry) {
        registry.registerIndicator(movingAverage("MA"));
        registry.registerIndicator(movingAverage("SMA"));
        registry.registerIndicator(exponentialMovingAverage());
        registry.registerIndicator(macd());
        registry.registerIndicator(rsi());
        registry.registerIndicator(bollinger());
        registry.registerIndicator(kdj());
        registry.registerIndicator(stochastic());
        registry.registerIndicator(atr());
        registry.registerIndicator(williamsR());
        registry.registerIndicator(volume());
        core::logging::getLogger()->debug("Registered {} built-in indicators", registry.size());
    }

} // namespace indicators
