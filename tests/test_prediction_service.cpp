#include <gtest/gtest.h>

#include "CSVUtils.h"
#include "CommonUtils.h"
#include "JsonValue.h"
#include "PredictionService.h"
#include "TestArtifacts.h"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using testsupport::TempDir;

namespace {
std::string predictBody(double ghi, double powerT1) {
    return "{\"temperature\":25.5,\"humidity\":45,\"ghi\":" + CommonUtils::formatDouble(ghi) +
           ",\"hour_sin\":-0.5,\"hour_cos\":-0.866,\"power_t_1\":" + CommonUtils::formatDouble(powerT1) +
           ",\"power_t_2\":140}";
}

std::vector<std::vector<std::string>> readAuditRows(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::vector<std::string>> rows;
    while (in.peek() != EOF) {
        auto row = CSVUtils::parseCSVLine(in, ',');
        if (!row.empty()) rows.push_back(std::move(row));
    }
    return rows;
}
} // namespace

class PredictionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        audit = std::make_unique<AuditLogger>(dir.file("audit.csv"));
        service = std::make_unique<PredictionService>(registry, *audit, monitor);
        service->setQuiet(true);
    }

    void loadSample(const std::string& version = "v2") {
        testsupport::writeSampleArtifacts(artifactDir(), version);
        ASSERT_TRUE(registry.load(version));
    }

    std::string artifactDir() const { return dir.file("artifacts"); }

    TempDir dir;
    ModelRegistry registry{ArtifactStore(dir.file("artifacts"))};
    RequestMonitor monitor;
    std::unique_ptr<AuditLogger> audit;
    std::unique_ptr<PredictionService> service;
};

TEST_F(PredictionServiceTest, RootWarnsWhileNoModelIsLoaded) {
    const JsonValue before = JsonValue::parse(service->handleRoot().body);
    EXPECT_EQ(before.find("status")->stringValue, "warning");
    EXPECT_EQ(before.find("documentation_url")->stringValue, "/docs");

    loadSample();
    const JsonValue after = JsonValue::parse(service->handleRoot().body);
    EXPECT_EQ(after.find("status")->stringValue, "ok");
}

TEST_F(PredictionServiceTest, HealthReportsActiveVersion) {
    const ServiceResponse empty = service->handleHealth();
    EXPECT_EQ(empty.status, 200);
    EXPECT_EQ(JsonValue::parse(empty.body).find("model_version")->stringValue, "none");

    loadSample("v2");
    const JsonValue loaded = JsonValue::parse(service->handleHealth().body);
    EXPECT_EQ(loaded.find("status")->stringValue, "ok");
    EXPECT_EQ(loaded.find("model_version")->stringValue, "v2");
}

TEST_F(PredictionServiceTest, UnavailableTakesPrecedenceOverValidation) {
    for (const std::string body : {std::string(testsupport::exampleBody()), std::string("{\"temperature\":900}"),
                                   std::string("not json")}) {
        const ServiceResponse response = service->handlePredict(body);
        EXPECT_EQ(response.status, 503) << body;
        EXPECT_EQ(JsonValue::parse(response.body).find("detail")->stringValue,
                  PredictionService::kUnavailableDetail);
    }
    EXPECT_EQ(monitor.snapshot().unavailableRequests, 3u);
}

TEST_F(PredictionServiceTest, PredictsAndAuditsExample) {
    loadSample();
    const ServiceResponse response = service->handlePredict(testsupport::exampleBody());
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_EQ(response.contentType, "application/json");

    const JsonValue json = JsonValue::parse(response.body);
    EXPECT_DOUBLE_EQ(json.find("predicted_power")->numberValue, testsupport::kExamplePrediction);
    EXPECT_EQ(json.find("unit")->stringValue, "Watts");
    EXPECT_EQ(json.find("model_version")->stringValue, "v2");

    audit->flush();
    const auto rows = readAuditRows(audit->path());
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1][1], "25.5");
    EXPECT_EQ(rows[1][3], "600.5");
    EXPECT_EQ(rows[1][6], "400");

    const MonitoringSnapshot snapshot = monitor.snapshot();
    EXPECT_EQ(snapshot.predictRequests, 1u);
    EXPECT_EQ(snapshot.predictions.count, 1u);
    EXPECT_DOUBLE_EQ(snapshot.predictions.mean, 400.0);
}

TEST_F(PredictionServiceTest, InvalidInputReturnsFieldDetails) {
    loadSample();
    const ServiceResponse response =
        service->handlePredict(R"({"temperature":75,"humidity":45,"ghi":-1,"hour_sin":0,"hour_cos":1,"power_t_1":1})");
    ASSERT_EQ(response.status, 422);

    const JsonValue json = JsonValue::parse(response.body);
    const JsonValue* detail = json.find("detail");
    ASSERT_NE(detail, nullptr);
    ASSERT_TRUE(detail->isArray());
    ASSERT_EQ(detail->arrayValue.size(), 3u);

    std::map<std::string, std::string> typeByField;
    for (const auto& entry : detail->arrayValue) {
        const JsonValue* loc = entry.find("loc");
        ASSERT_NE(loc, nullptr);
        ASSERT_EQ(loc->arrayValue.size(), 2u);
        EXPECT_EQ(loc->arrayValue[0].stringValue, "body");
        typeByField[loc->arrayValue[1].stringValue] = entry.find("type")->stringValue;
        EXPECT_NE(entry.find("msg"), nullptr);
    }
    EXPECT_EQ(typeByField["temperature"], "less_than_equal");
    EXPECT_EQ(typeByField["ghi"], "greater_than_equal");
    EXPECT_EQ(typeByField["power_t_2"], "missing");

    audit->flush();
    EXPECT_EQ(audit->writtenRecords(), 0u);
    EXPECT_EQ(monitor.snapshot().rejectedRequests, 1u);
}

TEST_F(PredictionServiceTest, MalformedJsonIsUnprocessable) {
    loadSample();
    const ServiceResponse response = service->handlePredict("{\"temperature\": 25.5,");
    ASSERT_EQ(response.status, 422);
    const JsonValue json = JsonValue::parse(response.body);
    EXPECT_EQ(json.find("detail")->arrayValue.at(0).find("type")->stringValue, "json_invalid");
}

TEST_F(PredictionServiceTest, InferenceFailureIsInternalErrorWithoutAudit) {
    ArtifactStore(artifactDir()).save(testsupport::identityScaler(), testsupport::overflowingForest(), "bad");
    ASSERT_TRUE(registry.load("bad"));

    const ServiceResponse response = service->handlePredict(testsupport::exampleBody());
    ASSERT_EQ(response.status, 500);
    EXPECT_EQ(JsonValue::parse(response.body).find("detail")->stringValue, PredictionService::kInternalErrorDetail);

    audit->flush();
    EXPECT_EQ(audit->writtenRecords(), 0u);
    EXPECT_EQ(monitor.snapshot().errorRequests, 1u);
}

TEST_F(PredictionServiceTest, UnloadReturnsServiceToUnavailable) {
    loadSample();
    ASSERT_EQ(service->handlePredict(testsupport::exampleBody()).status, 200);
    registry.unload();
    EXPECT_EQ(service->handlePredict(testsupport::exampleBody()).status, 503);
}

TEST_F(PredictionServiceTest, ConcurrentPredictionsAuditMatchingRows) {
    loadSample();
    constexpr int kThreads = 6;
    constexpr int kPerThread = 40;

    std::vector<std::vector<std::pair<std::string, std::string>>> served(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, t, &served] {
            for (int i = 0; i < kPerThread; ++i) {
                const double ghi = 50.0 + t * 40 + i;
                const double powerT1 = (i % 2 == 0) ? 90.0 : 150.0;
                const ServiceResponse response = service->handlePredict(predictBody(ghi, powerT1));
                if (response.status != 200) continue;
                const JsonValue json = JsonValue::parse(response.body);
                served[t].emplace_back(CommonUtils::formatDouble(ghi),
                                       CommonUtils::formatDouble(json.find("predicted_power")->numberValue));
            }
        });
    }
    for (auto& w : workers) w.join();
    audit->flush();

    std::vector<std::pair<std::string, std::string>> expected;
    for (const auto& perThread : served) expected.insert(expected.end(), perThread.begin(), perThread.end());
    ASSERT_EQ(expected.size(), static_cast<size_t>(kThreads * kPerThread));

    const auto rows = readAuditRows(audit->path());
    ASSERT_EQ(rows.size(), expected.size() + 1);
    std::vector<std::pair<std::string, std::string>> logged;
    for (size_t i = 1; i < rows.size(); ++i) {
        ASSERT_EQ(rows[i].size(), 7u);
        logged.emplace_back(rows[i][3], rows[i][6]);
    }
    std::sort(expected.begin(), expected.end());
    std::sort(logged.begin(), logged.end());
    EXPECT_EQ(logged, expected);
}

TEST_F(PredictionServiceTest, DocsDescribeEveryField) {
    const ServiceResponse docs = service->handleDocs();
    EXPECT_EQ(docs.status, 200);
    EXPECT_NE(docs.contentType.find("text/html"), std::string::npos);
    for (const auto& field : featureLayout()) {
        EXPECT_NE(docs.body.find(field.wireName), std::string::npos) << field.wireName;
    }
}

TEST_F(PredictionServiceTest, ServesOverHttp) {
    loadSample();

    PredictionService::Config config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.threadCount = 2;
    config.quiet = true;

    int exitCode = -1;
    std::thread serverThread([&] { exitCode = service->start(config); });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((!service->isRunning() || service->boundPort() == 0) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!service->isRunning()) {
        service->stop();
        serverThread.join();
        FAIL() << "server did not start, exit code " << exitCode;
    }

    httplib::Client client("127.0.0.1", service->boundPort());

    auto health = client.Get("/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    EXPECT_EQ(JsonValue::parse(health->body).find("model_version")->stringValue, "v2");

    auto predict = client.Post("/predict", std::string(testsupport::exampleBody()), "application/json");
    ASSERT_TRUE(predict);
    EXPECT_EQ(predict->status, 200);
    EXPECT_DOUBLE_EQ(JsonValue::parse(predict->body).find("predicted_power")->numberValue,
                     testsupport::kExamplePrediction);

    auto rejected = client.Post("/predict", std::string("{}"), "application/json");
    ASSERT_TRUE(rejected);
    EXPECT_EQ(rejected->status, 422);

    auto missing = client.Get("/nowhere");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);
    EXPECT_EQ(JsonValue::parse(missing->body).find("detail")->stringValue, "Not Found");

    service->stop();
    serverThread.join();
    EXPECT_EQ(exitCode, 0);
}

TEST_F(PredictionServiceTest, StopBeforeStartSkipsListening) {
    PredictionService::Config config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.quiet = true;

    service->stop();
    EXPECT_TRUE(service->stopRequested());
    EXPECT_EQ(service->start(config), 0);
    EXPECT_FALSE(service->isRunning());
}

// A shutdown signal can land while start() is still binding.
TEST_F(PredictionServiceTest, StopDuringStartupIsNotLost) {
    PredictionService::Config config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.threadCount = 1;
    config.quiet = true;

    for (int attempt = 0; attempt < 5; ++attempt) {
        auto fresh = std::make_unique<PredictionService>(registry, *audit, monitor);
        int exitCode = -1;
        std::thread serverThread([&] { exitCode = fresh->start(config); });
        fresh->stop();
        serverThread.join();
        EXPECT_EQ(exitCode, 0) << "attempt " << attempt;
        EXPECT_FALSE(fresh->isRunning());
    }
}
