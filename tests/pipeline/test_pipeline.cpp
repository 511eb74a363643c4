/// @file tests/pipeline/test_pipeline.cpp
/// @brief Unit tests for FraudAnalysisPipeline validation, scoring and
///        report assembly.
///
/// Test categories:
///   - Record validation reasons
///   - Configuration rejection
///   - Empty and all-invalid batches
///   - Severity counts, ordering and top alerts
///   - Classifier fallback with an error name
///   - Worker-count independence
///   - featurize / labelled_examples
///   - Recommendations and JSON report shape

#include <gtest/gtest.h>
#include "fras/pipeline.hpp"
#include "fras/alert_sink.hpp"

#include <fmt/core.h>
#include <json/json.h>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <span>
#include <string>
#include <vector>

using namespace fras;
using namespace fras::pipeline;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static RawRecord record(std::string id, std::optional<std::string> amount,
                        std::optional<std::string> ts, std::string account = "",
                        std::string description = "") {
    RawRecord r;
    r.id          = std::move(id);
    r.amount      = std::move(amount);
    r.timestamp   = std::move(ts);
    r.account     = std::move(account);
    r.vendor      = "VENDOR";
    r.description = std::move(description);
    return r;
}

/// 20 weekday business-hours payments to distinct accounts, plus one large
/// night-time "cash advance" that every signal picks up.
static std::vector<RawRecord> batch_with_one_anomaly() {
    std::vector<RawRecord> rs;
    for (int i = 0; i < 20; ++i) {
        const double amount = 101.37 + 7.13 * i;
        rs.push_back(record("n" + std::to_string(i), fmt::format("{:.2f}", amount),
                            fmt::format("2025-01-{:02d}T10:00:00Z", 6 + i % 5),
                            "ACC-" + std::to_string(i), "office supplies"));
    }
    rs.push_back(record("big", "250000.005", "2025-01-08T03:00:00Z", "ACC-X",
                        "cash advance"));
    return rs;
}

static Json::Value parse_json(const std::string& text) {
    Json::CharReaderBuilder rb;
    const std::unique_ptr<Json::CharReader> reader(rb.newCharReader());
    Json::Value root;
    std::string errors;
    EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
    return root;
}

// ─── Record validation ───────────────────────────────────────────────────────

TEST(Pipeline_Validation, AcceptsWellFormedRecord) {
    const auto c = validate_record(record("ok", " 12.50 ", "2025-01-02T10:00:00Z", "A"));
    ASSERT_TRUE(c.transaction.has_value());
    EXPECT_DOUBLE_EQ(c.transaction->amount, 12.5);
    EXPECT_EQ(c.transaction->account, "A");
    EXPECT_TRUE(c.reason.empty());
}

TEST(Pipeline_Validation, RejectionReasons) {
    EXPECT_EQ(validate_record(record("a", std::nullopt, "2025-01-02")).reason, "missing amount");
    EXPECT_EQ(validate_record(record("b", "  ", "2025-01-02")).reason, "missing amount");
    EXPECT_EQ(validate_record(record("c", "12abc", "2025-01-02")).reason,
              "non-numeric amount '12abc'");
    EXPECT_EQ(validate_record(record("d", "ten", "2025-01-02")).reason,
              "non-numeric amount 'ten'");
    EXPECT_EQ(validate_record(record("e", "1e999", "2025-01-02")).reason,
              "amount out of range '1e999'");
    EXPECT_EQ(validate_record(record("f", "nan", "2025-01-02")).reason,
              "non-finite amount 'nan'");
    EXPECT_EQ(validate_record(record("g", "5", std::nullopt)).reason, "missing timestamp");
    EXPECT_EQ(validate_record(record("h", "5", "2025-02-30")).reason,
              "unparseable timestamp '2025-02-30'");
}

// ─── Configuration ───────────────────────────────────────────────────────────

TEST(Pipeline_Config, DefaultsAreValid) {
    EXPECT_TRUE(PipelineConfig{}.validate().empty());
}

TEST(Pipeline_Config, InvalidConfigurationRejectedBeforeWork) {
    PipelineConfig bad_weights;
    bad_weights.weights.classifier = 0.9;
    EXPECT_FALSE(bad_weights.validate().empty());
    EXPECT_FALSE(FraudAnalysisPipeline(bad_weights).run(batch_with_one_anomaly()).has_value());

    PipelineConfig no_workers;
    no_workers.worker_threads = 0;
    EXPECT_FALSE(FraudAnalysisPipeline(no_workers).run(batch_with_one_anomaly()).has_value());

    PipelineConfig bad_holiday;
    bad_holiday.features.holidays = {{13, 1}};
    EXPECT_FALSE(bad_holiday.validate().empty());

    PipelineConfig bad_threshold;
    bad_threshold.thresholds.pattern = 1.5;
    EXPECT_FALSE(bad_threshold.validate().empty());
    EXPECT_FALSE(FraudAnalysisPipeline(bad_threshold).featurize(batch_with_one_anomaly()).has_value());
}

// ─── Empty batches ───────────────────────────────────────────────────────────

TEST(Pipeline_Run, EmptyInputIsNotAnError) {
    const auto report = FraudAnalysisPipeline().run({});
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, "no_valid_records");
    EXPECT_EQ(report->input_count, 0u);
    EXPECT_TRUE(report->verdicts.empty());
    EXPECT_FALSE(report->profile.has_value());
    ASSERT_EQ(report->recommendations.size(), 1u);
    EXPECT_EQ(report->recommendations[0],
              "No valid records to analyse; check the skipped-record reasons");
}

TEST(Pipeline_Run, AllInvalidRecordsAreListed) {
    const std::vector<RawRecord> rs = {
        record("x", std::nullopt, "2025-01-01"),
        record("y", "abc", "2025-01-01"),
    };
    const auto report = FraudAnalysisPipeline().run(rs);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, "no_valid_records");
    EXPECT_EQ(report->input_count, 2u);
    EXPECT_EQ(report->batch_size, 0u);
    ASSERT_EQ(report->skipped.size(), 2u);
    EXPECT_EQ(report->skipped[1].index, 1u);
    EXPECT_EQ(report->skipped[1].id, "y");
}

// ─── Scoring and aggregation ─────────────────────────────────────────────────

TEST(Pipeline_Run, AnomalyRisesToTheTop) {
    const auto report = FraudAnalysisPipeline().run(batch_with_one_anomaly());
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->status, "ok");
    EXPECT_EQ(report->batch_size, 21u);
    ASSERT_EQ(report->verdicts.size(), 21u);

    const auto& top = report->verdicts.front();
    EXPECT_EQ(top.transaction_id, "big");
    EXPECT_EQ(top.risk_level, RiskLevel::Critical);
    EXPECT_TRUE(top.signals.outlier_flag);
    EXPECT_FALSE(top.signals.classifier_probability.has_value());

    for (std::size_t i = 1; i < report->verdicts.size(); ++i) {
        EXPECT_GE(report->verdicts[i - 1].risk_score, report->verdicts[i].risk_score);
        EXPECT_LT(report->verdicts[i].risk_score, constants::RISK_LOW_FLOOR)
            << report->verdicts[i].transaction_id;
    }

    std::size_t total = 0;
    for (const auto level : ALL_RISK_LEVELS) total += report->count(level);
    EXPECT_EQ(total, report->batch_size);
    EXPECT_EQ(report->count(RiskLevel::Critical), 1u);
    EXPECT_EQ(report->outlier_count, 1u);

    ASSERT_EQ(report->top_alerts.size(), 1u);
    EXPECT_EQ(report->top_alerts[0].transaction_id, "big");
    EXPECT_FALSE(report->classifier_error.has_value());
}

TEST(Pipeline_Run, SkippedRecordsKeepInputPositions) {
    auto rs = batch_with_one_anomaly();
    rs.insert(rs.begin() + 3, record("broken", "n/a", "2025-01-06T10:00:00Z"));
    const auto report = FraudAnalysisPipeline().run(rs);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->input_count, 22u);
    EXPECT_EQ(report->batch_size, 21u);
    ASSERT_EQ(report->skipped.size(), 1u);
    EXPECT_EQ(report->skipped[0].index, 3u);
    EXPECT_EQ(report->skipped[0].reason, "non-numeric amount 'n/a'");
}

TEST(Pipeline_Run, TopAlertLimitHonoured) {
    PipelineConfig cfg;
    cfg.top_alerts = 0;
    const auto report = FraudAnalysisPipeline(cfg).run(batch_with_one_anomaly());
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->top_alerts.empty());
    EXPECT_EQ(report->count(RiskLevel::Critical), 1u);
}

TEST(Pipeline_Run, KeepFeaturesCopiesRows) {
    PipelineConfig cfg;
    cfg.keep_features = true;
    const auto report = FraudAnalysisPipeline(cfg).run(batch_with_one_anomaly());
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->features.size(), 21u);
    EXPECT_EQ(report->features.back().transaction_id, "big");
    EXPECT_EQ(report->features.back().values.size(), constants::FEATURE_DIM);

    EXPECT_TRUE(FraudAnalysisPipeline().run(batch_with_one_anomaly())->features.empty());
}

TEST(Pipeline_Run, WorkerCountDoesNotChangeReport) {
    PipelineConfig one;
    PipelineConfig many;
    many.worker_threads = 4;
    const auto records = batch_with_one_anomaly();
    const auto a = FraudAnalysisPipeline(one).run(records);
    const auto b = FraudAnalysisPipeline(many).run(records);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(to_json(*a), to_json(*b));
}

// ─── Classifier fallback ─────────────────────────────────────────────────────

TEST(Pipeline_Classifier, UncompiledModelFallsBackToRules) {
    const classifier::Classifier untrained;
    const auto report = FraudAnalysisPipeline().run(batch_with_one_anomaly(), untrained);
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report->classifier_error.has_value());
    EXPECT_EQ(*report->classifier_error, "ModelNotCompiled");
    EXPECT_EQ(report->verdicts.front().reasoning.back(),
              "classifier unavailable; rule-only score");

    const auto rule_only = FraudAnalysisPipeline().run(batch_with_one_anomaly());
    EXPECT_EQ(report->verdicts.front().risk_score, rule_only->verdicts.front().risk_score);
}

TEST(Pipeline_Classifier, WrongInputWidthIsConfigurationError) {
    classifier::Classifier narrow(classifier::ClassifierConfig{
        3, {{3, classifier::Activation::Softmax}}});
    ASSERT_TRUE(narrow.compile(1));
    const auto report = FraudAnalysisPipeline().run(batch_with_one_anomaly(), narrow);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->classifier_error.value_or(""), "ConfigurationError");
}

TEST(Pipeline_Classifier, CompiledModelContributesProbability) {
    classifier::Classifier model;
    ASSERT_TRUE(model.compile(42));
    const auto report = FraudAnalysisPipeline().run(batch_with_one_anomaly(), model);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->classifier_error.has_value());
    for (const auto& v : report->verdicts) {
        ASSERT_TRUE(v.signals.classifier_probability.has_value());
        EXPECT_GE(*v.signals.classifier_probability, 0.0);
        EXPECT_LE(*v.signals.classifier_probability, 1.0);
    }
}

// ─── featurize / labelled_examples ───────────────────────────────────────────

TEST(Pipeline_Featurize, ProfilesAndEncodesValidRecords) {
    auto rs = batch_with_one_anomaly();
    rs.push_back(record("bad", std::nullopt, "2025-01-06"));
    const auto batch = FraudAnalysisPipeline().featurize(rs);
    ASSERT_TRUE(batch.has_value());
    EXPECT_EQ(batch->transactions.size(), 21u);
    EXPECT_EQ(batch->features.size(), 21u);
    EXPECT_EQ(batch->skipped.size(), 1u);
    ASSERT_TRUE(batch->profile.has_value());
    EXPECT_EQ(batch->profile->count, 21u);
    EXPECT_EQ(batch->source_index.back(), 20u);
}

TEST(Pipeline_Featurize, LabelledExamplesSkipUnlabelled) {
    auto rs = batch_with_one_anomaly();
    rs[0].label  = "legitimate";
    rs[1].label  = "unknown";
    rs.back().label = "fraudulent";
    const auto batch = FraudAnalysisPipeline().featurize(rs);
    ASSERT_TRUE(batch.has_value());

    const auto three = labelled_examples(rs, *batch, 3);
    ASSERT_EQ(three.size(), 2u);
    EXPECT_EQ(three[0].label.size(), 3);
    EXPECT_DOUBLE_EQ(three[1].label(2), 1.0);
    EXPECT_EQ(three[0].features.size(), constants::FEATURE_DIM);

    const auto binary = labelled_examples(rs, *batch, 1);
    ASSERT_EQ(binary.size(), 2u);
    EXPECT_DOUBLE_EQ(binary[0].label(0), 0.0);
    EXPECT_DOUBLE_EQ(binary[1].label(0), 1.0);
}

// ─── Recommendations ─────────────────────────────────────────────────────────

TEST(Pipeline_Recommendations, QuietReport) {
    AnalysisReport r;
    r.batch_size = 5;
    const auto recs = recommendations_for(r);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0], "No batch-level anomalies detected");
}

TEST(Pipeline_Recommendations, EscalationAndOutliers) {
    const auto report = FraudAnalysisPipeline().run(batch_with_one_anomaly());
    ASSERT_TRUE(report.has_value());
    const auto& recs = report->recommendations;
    const auto has = [&](const std::string& s) {
        return std::find(recs.begin(), recs.end(), s) != recs.end();
    };
    EXPECT_TRUE(has("Escalate 1 CRITICAL transaction(s) for immediate review"));
    EXPECT_TRUE(has("Check 1 statistical outlier(s) against source documents"));
    EXPECT_FALSE(has("No batch-level anomalies detected"));
}

TEST(Pipeline_Recommendations, MicroSkimmingAndClassifierNotes) {
    AnalysisReport r;
    r.batch_size = 10;
    r.micro_skimming = {4, 0.1, 0.025, 0.4, true};
    r.classifier_error = "ModelNotCompiled";
    r.skipped.push_back({2, "z", "missing amount"});
    const auto recs = recommendations_for(r);
    ASSERT_EQ(recs.size(), 4u);
    EXPECT_EQ(recs[0], "Investigate possible micro-skimming: 4 micro-amount transaction(s) "
                       "totalling 0.1000");
    EXPECT_EQ(recs[1], "High share of micro-amount transactions (40.0%): confirm their "
                       "business purpose");
    EXPECT_EQ(recs[2], "Classifier unavailable (ModelNotCompiled): scores are rule-only");
    EXPECT_EQ(recs[3], "Correct 1 skipped record(s) and re-run the analysis");
}

// ─── JSON ────────────────────────────────────────────────────────────────────

TEST(Pipeline_Json, ReportShape) {
    const auto report = FraudAnalysisPipeline().run(batch_with_one_anomaly());
    ASSERT_TRUE(report.has_value());
    const auto root = parse_json(to_json(*report));

    EXPECT_EQ(root["status"].asString(), "ok");
    EXPECT_EQ(root["batchSize"].asUInt64(), 21u);
    ASSERT_TRUE(root["verdicts"].isArray());
    EXPECT_EQ(root["verdicts"].size(), 21u);
    EXPECT_EQ(root["verdicts"][0]["transactionId"].asString(), "big");
    EXPECT_EQ(root["verdicts"][0]["riskLevel"].asString(), "CRITICAL");
    EXPECT_TRUE(root["verdicts"][0]["signals"]["classifierProbability"].isNull());

    const auto& summary = root["summary"];
    EXPECT_EQ(summary["severityCounts"]["CRITICAL"].asUInt64(), 1u);
    EXPECT_EQ(summary["outlierCount"].asUInt64(), 1u);
    EXPECT_TRUE(summary["benfordsAnalysis"].isObject());
    EXPECT_TRUE(summary["recommendations"].isArray());
    EXPECT_TRUE(root["profile"]["percentiles"].isArray());
    EXPECT_FALSE(root.isMember("classifierError"));
    EXPECT_FALSE(root.isMember("features"));
}

TEST(Pipeline_Json, ProfileOnly) {
    const auto batch = FraudAnalysisPipeline().featurize(batch_with_one_anomaly());
    ASSERT_TRUE(batch && batch->profile);
    const auto root = parse_json(to_json(*batch->profile));
    EXPECT_EQ(root["count"].asUInt64(), 21u);
    EXPECT_DOUBLE_EQ(root["max"].asDouble(), 250000.005);
    EXPECT_EQ(root["percentiles"].size(), profile::PERCENTILE_RANKS.size());
}

// ─── Alerts ──────────────────────────────────────────────────────────────────

namespace {

class RecordingSink final : public AlertSink {
public:
    void publish(std::span<const risk::RiskVerdict> alerts) override {
        ++calls;
        for (const auto& a : alerts) ids.push_back(a.transaction_id);
    }
    int calls = 0;
    std::vector<std::string> ids;
};

} // namespace

TEST(Pipeline_Alerts, NotifyPublishesTopAlertsOnly) {
    const auto report = FraudAnalysisPipeline().run(batch_with_one_anomaly());
    ASSERT_TRUE(report.has_value());
    RecordingSink sink;
    notify(*report, sink);
    EXPECT_EQ(sink.calls, 1);
    ASSERT_EQ(sink.ids.size(), 1u);
    EXPECT_EQ(sink.ids[0], "big");

    RecordingSink quiet;
    notify(AnalysisReport{}, quiet);
    EXPECT_EQ(quiet.calls, 0);
}

TEST(Pipeline_Alerts, StreamSinkWritesOneLinePerAlert) {
    std::FILE* tmp = std::tmpfile();
    ASSERT_NE(tmp, nullptr);
    risk::RiskVerdict v;
    v.transaction_id = "t9";
    v.risk_score     = 85;
    v.risk_level     = RiskLevel::Critical;
    v.reasoning      = {"a", "b"};
    const std::vector<risk::RiskVerdict> alerts = {v};

    StreamAlertSink(tmp).publish(alerts);
    std::rewind(tmp);
    char line[256] = {};
    ASSERT_NE(std::fgets(line, sizeof line, tmp), nullptr);
    EXPECT_EQ(std::string(line), "ALERT [CRITICAL] t9 score=85 a; b\n");
    std::fclose(tmp);
}
