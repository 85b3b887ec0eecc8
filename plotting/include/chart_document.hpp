#pragma once

#include "datatypes.hpp"
#include "indicator_types.hpp"
#include "themes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace plotting {

    enum class PaneKind {
        Main,
        Indicator,
        Volume,
        Equity
    };

    // One drawable series in a pane, aligned 1:1 with ChartDocument::x_labels
    struct SeriesLayer {
        std::string label;
        indicators::PlotType plot_type = indicators::PlotType::Line;
        std::string color;
        double width = 1.0;
        std::string band_group;                 // Lines of one band share a group (BOLL upper/middle/lower)
        std::optional<double> fill_opacity;     // Band fill between the group's first and last line
        std::vector<double> values;             // NaN = undefined
        std::vector<std::string> point_colors;  // Optional per-bar colors (volume)
    };

    struct TradeMarker {
        std::size_t bar_index = 0;
        double price = 0.0;
        bool is_buy = true;
        std::string color;
        std::string symbol;
    };

    struct PaneAnnotation {
        std::string text;
        std::size_t bar_index = 0;
        double value = 0.0;
        std::string color;
    };

    struct Pane {
        std::string title;
        PaneKind kind = PaneKind::Indicator;
        std::vector<SeriesLayer> series;
        std::vector<PaneAnnotation> annotations;
        double top_pct = 0.0;       // Share of the canvas height
        double height_pct = 0.0;
    };

    // Composed chart, built fresh per render. Panes stack top to bottom as
    // main, sub_panes (request order), volume, equity.
    struct ChartDocument {
        std::string title;
        PlotTheme theme;
        std::vector<std::string> x_labels;      // "YYYY-MM-DD HH:MM:SS" per bar
        core::TimeSeries<core::Candle> candles;
        Pane main_pane;                         // Candles + overlays, drawn in series order
        std::vector<TradeMarker> markers;
        std::vector<Pane> sub_panes;
        std::optional<Pane> volume_pane;
        std::optional<Pane> equity_pane;

        // All panes in stacking order
        std::vector<const Pane*> panes() const {
            std::vector<const Pane*> ordered{&main_pane};
            for (const auto& pane : sub_panes) ordered.push_back(&pane);
            if (volume_pane) ordered.push_back(&*volume_pane);
            if (equity_pane) ordered.push_back(&*equity_pane);
            return ordered;
        }
    };

} // namespace plotting
