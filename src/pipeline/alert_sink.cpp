/// @file src/pipeline/alert_sink.cpp
/// @brief StreamAlertSink and report notification.

#include "fras/alert_sink.hpp"
#include "fras/pipeline.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fras::pipeline {

void StreamAlertSink::publish(std::span<const risk::RiskVerdict> alerts) {
    for (const auto& a : alerts) {
        fmt::print(out_, "ALERT [{}] {} score={} {}\n",
                   to_string(a.risk_level), a.transaction_id, a.risk_score,
                   fmt::join(a.reasoning, "; "));
    }
    std::fflush(out_);
}

void notify(const AnalysisReport& report, AlertSink& sink) {
    if (report.top_alerts.empty()) return;
    sink.publish(report.top_alerts);
}

} // namespace fras::pipeline
