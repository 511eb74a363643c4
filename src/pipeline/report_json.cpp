/// @file src/pipeline/report_json.cpp
/// @brief Report and profile serialisation via jsoncpp.
///
/// jsoncpp keeps object members in key order, so the same report always
/// serialises to the same bytes.

#include "fras/pipeline.hpp"

#include <json/json.h>

namespace fras::pipeline {

namespace {

Json::Value u64(std::size_t v) {
    return Json::Value(static_cast<Json::UInt64>(v));
}

Json::Value benford_value(const profile::BenfordAnalysis& b) {
    Json::Value v(Json::objectValue);
    v["chiSquare"]      = b.chi_square;
    v["compliance"]     = std::string(profile::to_string(b.compliance));
    v["deviationScore"] = b.deviation_score;
    v["lowConfidence"]  = b.low_confidence;
    v["sampleSize"]     = u64(b.sample_size);

    Json::Value observed(Json::arrayValue);
    Json::Value expected(Json::arrayValue);
    Json::Value counts(Json::arrayValue);
    for (std::size_t i = 0; i < 9; ++i) {
        observed.append(b.observed[i]);
        expected.append(b.expected[i]);
        counts.append(u64(b.observed_counts[i]));
    }
    v["observed"]       = std::move(observed);
    v["expected"]       = std::move(expected);
    v["observedCounts"] = std::move(counts);
    return v;
}

Json::Value profile_value(const profile::BatchProfile& p) {
    Json::Value v(Json::objectValue);
    v["count"]    = u64(p.count);
    v["mean"]     = p.mean;
    v["median"]   = p.median;
    v["variance"] = p.variance;
    v["stddev"]   = p.stddev;
    v["min"]      = p.min;
    v["max"]      = p.max;
    v["coefficientOfVariation"] = p.coefficient_of_variation;
    v["skewness"] = p.skewness;
    v["kurtosis"] = p.kurtosis;
    v["sampleSizeInsufficient"] = p.sample_size_insufficient;
    v["momentsLowConfidence"]   = p.moments_low_confidence;
    v["absQ1"] = p.abs_q1;
    v["absQ3"] = p.abs_q3;

    Json::Value pct(Json::arrayValue);
    for (const auto& e : p.percentiles) {
        Json::Value entry(Json::objectValue);
        entry["rank"]  = e.rank;
        entry["value"] = e.value;
        pct.append(std::move(entry));
    }
    v["percentiles"] = std::move(pct);
    v["benford"] = p.benford ? benford_value(*p.benford) : Json::Value(Json::nullValue);
    return v;
}

Json::Value verdict_value(const risk::RiskVerdict& r) {
    Json::Value v(Json::objectValue);
    v["transactionId"] = r.transaction_id;
    v["riskScore"]     = r.risk_score;
    v["riskLevel"]     = std::string(to_string(r.risk_level));

    Json::Value s(Json::objectValue);
    s["amountRisk"]   = r.signals.amount_risk;
    s["timingRisk"]   = r.signals.timing_risk;
    s["patternRisk"]  = r.signals.pattern_risk;
    s["outlierScore"] = r.signals.outlier_score;
    s["outlierFlag"]  = r.signals.outlier_flag;
    s["classifierProbability"] = r.signals.classifier_probability
                               ? Json::Value(*r.signals.classifier_probability)
                               : Json::Value(Json::nullValue);
    v["signals"] = std::move(s);

    Json::Value reasons(Json::arrayValue);
    for (const auto& text : r.reasoning) reasons.append(text);
    v["reasoning"] = std::move(reasons);
    return v;
}

std::string write(const Json::Value& root) {
    Json::StreamWriterBuilder wb;
    wb["indentation"]   = "  ";
    wb["precision"]     = 17;
    wb["precisionType"] = "significant";
    return Json::writeString(wb, root);
}

} // anonymous namespace

std::string to_json(const profile::BatchProfile& profile) {
    return write(profile_value(profile));
}

std::string to_json(const AnalysisReport& report) {
    Json::Value root(Json::objectValue);
    root["status"]     = report.status;
    root["inputCount"] = u64(report.input_count);
    root["batchSize"]  = u64(report.batch_size);

    Json::Value skipped(Json::arrayValue);
    for (const auto& s : report.skipped) {
        Json::Value e(Json::objectValue);
        e["index"]  = u64(s.index);
        e["id"]     = s.id;
        e["reason"] = s.reason;
        skipped.append(std::move(e));
    }
    root["skippedRecords"] = std::move(skipped);

    Json::Value verdicts(Json::arrayValue);
    for (const auto& v : report.verdicts) verdicts.append(verdict_value(v));
    root["verdicts"] = std::move(verdicts);

    Json::Value summary(Json::objectValue);
    summary["benfordsAnalysis"] = report.profile && report.profile->benford
                                ? benford_value(*report.profile->benford)
                                : Json::Value(Json::nullValue);
    summary["outlierCount"] = u64(report.outlier_count);

    Json::Value counts(Json::objectValue);
    for (const auto level : ALL_RISK_LEVELS) {
        counts[std::string(to_string(level))] = u64(report.count(level));
    }
    summary["severityCounts"] = std::move(counts);

    Json::Value alerts(Json::arrayValue);
    for (const auto& v : report.top_alerts) alerts.append(verdict_value(v));
    summary["topAlerts"] = std::move(alerts);

    Json::Value micro(Json::objectValue);
    micro["count"]    = u64(report.micro_skimming.count);
    micro["total"]    = report.micro_skimming.total;
    micro["mean"]     = report.micro_skimming.mean;
    micro["share"]    = report.micro_skimming.share;
    micro["detected"] = report.micro_skimming.detected;
    summary["microSkimming"] = std::move(micro);

    Json::Value recs(Json::arrayValue);
    for (const auto& r : report.recommendations) recs.append(r);
    summary["recommendations"] = std::move(recs);
    root["summary"] = std::move(summary);

    root["profile"] = report.profile ? profile_value(*report.profile)
                                     : Json::Value(Json::nullValue);

    if (report.classifier_error) {
        root["classifierError"] = *report.classifier_error;
    }

    if (!report.features.empty()) {
        Json::Value rows(Json::arrayValue);
        for (const auto& f : report.features) {
            Json::Value row(Json::objectValue);
            row["transactionId"] = f.transaction_id;
            Json::Value values(Json::arrayValue);
            for (Eigen::Index i = 0; i < f.values.size(); ++i) values.append(f.values(i));
            row["values"] = std::move(values);
            rows.append(std::move(row));
        }
        root["features"] = std::move(rows);
    }

    return write(root);
}

} // namespace fras::pipeline
