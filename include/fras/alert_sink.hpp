#pragma once

/// @file include/fras/alert_sink.hpp
/// @brief Receiver for the HIGH/CRITICAL alerts of a report.

#include "fras/risk.hpp"

#include <cstdio>
#include <span>

namespace fras::pipeline {

struct AnalysisReport;

class AlertSink {
public:
    virtual ~AlertSink() = default;

    virtual void publish(std::span<const risk::RiskVerdict> alerts) = 0;
};

/// Writes one line per alert to a C stream.
class StreamAlertSink final : public AlertSink {
public:
    explicit StreamAlertSink(std::FILE* out = stderr) noexcept : out_(out) {}

    void publish(std::span<const risk::RiskVerdict> alerts) override;

private:
    std::FILE* out_;
};

/// Hand a report's top alerts to `sink`. Nothing is published when there
/// are none.
void notify(const AnalysisReport& report, AlertSink& sink);

} // namespace fras::pipeline
