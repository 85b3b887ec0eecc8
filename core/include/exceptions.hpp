#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace core {

    class StrategyChartsException : public std::runtime_error {
    public:
        explicit StrategyChartsException(const std::string& message)
            : std::runtime_error(message) {}

        explicit StrategyChartsException(const char* message)
            : std::runtime_error(message) {}
    };

    class ConfigException : public StrategyChartsException {
    public: using StrategyChartsException::StrategyChartsException; };

    class DataLoadException : public StrategyChartsException {
    public: using StrategyChartsException::StrategyChartsException; };

    class IndicatorCalculationException : public StrategyChartsException {
    public: using StrategyChartsException::StrategyChartsException; };

    class RenderException : public StrategyChartsException {
    public: using StrategyChartsException::StrategyChartsException; };

    class BacktestException : public StrategyChartsException {
    public: using StrategyChartsException::StrategyChartsException; };

    // Base for errors that concern a named entity (indicator, theme, plot request).
    // name() returns the offending name so callers can report it without parsing what().
    class NamedEntityException : public StrategyChartsException {
    public:
        NamedEntityException(std::string name, const std::string& message)
            : StrategyChartsException(message), name_(std::move(name)) {}

        const std::string& name() const noexcept { return name_; }

    private:
        std::string name_;
    };

    class UnknownIndicator : public NamedEntityException {
    public:
        explicit UnknownIndicator(const std::string& name)
            : NamedEntityException(name, "Unknown indicator '" + name + "': not present in the indicator registry") {}
    };

    class UnknownTheme : public NamedEntityException {
    public:
        explicit UnknownTheme(const std::string& name)
            : NamedEntityException(name, "Unknown theme '" + name + "': supported themes are 'light' and 'dark'") {}
    };

    class UnknownRequest : public NamedEntityException {
    public:
        explicit UnknownRequest(const std::string& name)
            : NamedEntityException(name, "Indicator '" + name + "' was never added to the plot configuration") {}
    };

    class MissingInputColumn : public NamedEntityException {
    public:
        MissingInputColumn(const std::string& indicator, const std::string& column)
            : NamedEntityException(indicator, "Indicator '" + indicator + "' requires column '" + column +
                                              "' which the price data does not provide"),
              column_(column) {}

        const std::string& column() const noexcept { return column_; }

    private:
        std::string column_;
    };

    class InvalidParameter : public NamedEntityException {
    public:
        InvalidParameter(const std::string& indicator, const std::string& parameter, const std::string& reason)
            : NamedEntityException(indicator, "Invalid parameter '" + parameter + "' for indicator '" + indicator +
                                              "': " + reason),
              parameter_(parameter) {}

        const std::string& parameter() const noexcept { return parameter_; }

    private:
        std::string parameter_;
    };

} // namespace core
