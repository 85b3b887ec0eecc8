#pragma once

#include "chart_document.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace plotting {

    using json = nlohmann::json;

    // Turns a ChartDocument into a self-contained HTML page driven by an ECharts option.
    class HtmlChartWriter {
    public:
        // One grid/xAxis/yAxis per pane; candlestick, overlay, indicator, volume and
        // equity series; NaN points become null.
        json buildOption(const ChartDocument& document) const;

        std::string renderHtml(const ChartDocument& document) const;

        // Throws core::RenderException; never leaves a partial file at `path`
        void write(const ChartDocument& document, const std::string& path) const;
    };

    // HTML page hosting a single ECharts instance with `option`
    std::string wrapHtml(const std::string& title,
                         const std::string& width,
                         const std::string& height,
                         const std::string& background_color,
                         const json& option);

    // Opens `path` with the desktop's default viewer. Failures are logged, not thrown.
    void openInViewer(const std::string& path);

} // namespace plotting
