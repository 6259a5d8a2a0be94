// EngineConfig / ConfigLoader
#include "EngineConfig.h"
#include "TestSupport.h"
#include <cstdlib>

void test_DefaultsAreValid() {
    EngineConfig cfg;
    cfg.validate();
    ASSERT_NEAR(cfg.trigger.enterDeg, 1.0, 0.0);
    ASSERT_NEAR(cfg.trigger.exitDeg, 1.5, 0.0);
    ASSERT_NEAR(cfg.trigger.clarityMin, 0.65, 0.0);
    ASSERT_NEAR(cfg.trigger.freshnessHours, 24.0, 0.0);
    ASSERT_EQ(cfg.validator.k, 3);
    ASSERT_TRUE(cfg.validator.mode == ValidationMode::SIGN);
    ASSERT_EQ(cfg.history.maxSamples, size_t(5000));
    ASSERT_NEAR(cfg.trend.maxDays, 300.0, 0.0);
}

void test_LoadFromJson() {
    EngineConfig cfg = ConfigLoader::loadFromJsonString(R"({
        "trend": {"max_days": 120, "min_samples": 25, "fallback_samples": 60},
        "validator": {"k": 4, "mode": "either", "rank_window": 16},
        "trigger": {"enter_deg": 0.8, "exit_deg": 1.2, "clarity_min": 0.7, "future_tolerance_hours": 0.5},
        "confidence": {"cold_start_dispersion": 1.0},
        "runtime": {"interval_seconds": 60, "log_level": "debug"}
    })");
    ASSERT_NEAR(cfg.trend.maxDays, 120.0, 0.0);
    ASSERT_EQ(cfg.trend.minSamples, size_t(25));
    ASSERT_EQ(cfg.validator.k, 4);
    ASSERT_TRUE(cfg.validator.mode == ValidationMode::EITHER);
    ASSERT_EQ(cfg.validator.rankWindow, size_t(16));
    ASSERT_NEAR(cfg.trigger.enterDeg, 0.8, 0.0);
    ASSERT_NEAR(cfg.trigger.futureToleranceHours, 0.5, 0.0);
    ASSERT_NEAR(cfg.confidence.coldStartDispersion, 1.0, 0.0);
    // 未给出时跟随 k
    ASSERT_EQ(cfg.trigger.clarityExitEvaluations, 4);
    ASSERT_EQ(cfg.runtime.intervalSeconds, 60);
    ASSERT_EQ(cfg.runtime.logLevel, std::string("debug"));
    // 未出现的段落保持默认
    ASSERT_NEAR(cfg.confidence.persistWeight, 0.30, 0.0);
}

void test_ExitMustExceedEnter() {
    ASSERT_THROWS(ConfigLoader::loadFromJsonString(R"({"trigger": {"enter_deg": 1.5, "exit_deg": 1.5}})"), ConfigError);
    ASSERT_THROWS(ConfigLoader::loadFromJsonString(R"({"trigger": {"enter_deg": 2.0, "exit_deg": 1.0}})"), ConfigError);
}

void test_InvalidValuesRejected() {
    ASSERT_THROWS(ConfigLoader::loadFromJsonString(R"({"trigger": {"clarity_min": 1.4}})"), ConfigError);
    ASSERT_THROWS(ConfigLoader::loadFromJsonString(R"({"validator": {"k": 0}})"), ConfigError);
    ASSERT_THROWS(ConfigLoader::loadFromJsonString(R"({"validator": {"mode": "vote"}})"), ConfigError);
    ASSERT_THROWS(ConfigLoader::loadFromJsonString(R"({"trend": {"max_days": "long"}})"), ConfigError);
    ASSERT_THROWS(ConfigLoader::loadFromJsonString(R"({"trigger": {"future_tolerance_hours": -1}})"), ConfigError);
    ASSERT_THROWS(ConfigLoader::loadFromJsonString(R"({"confidence": {"cold_start_dispersion": 1.5}})"), ConfigError);
    ASSERT_THROWS(ConfigLoader::loadFromJsonString("{not json"), ConfigError);
    ASSERT_THROWS(ConfigLoader::loadFromJsonString("[1, 2]"), ConfigError);
}

void test_EnvSubstitution() {
    setenv("PHASEGAP_TEST_WEBHOOK", "https://hooks.example.invalid/abc", 1);
    unsetenv("PHASEGAP_UNSET_VAR");
    std::string out = ConfigLoader::substituteEnvVars(R"({"webhook_url": "${PHASEGAP_TEST_WEBHOOK}", "x": "${PHASEGAP_UNSET_VAR}"})");
    ASSERT_TRUE(out.find("https://hooks.example.invalid/abc") != std::string::npos);
    // 未定义的变量替换为空串, 不保留字面量
    ASSERT_TRUE(out.find("${PHASEGAP_UNSET_VAR}") == std::string::npos);
    ASSERT_TRUE(out.find(R"("x": "")") != std::string::npos);

    EngineConfig unset = ConfigLoader::loadFromJsonString(R"({"runtime": {"webhook_url": "${PHASEGAP_UNSET_VAR}"}})");
    ASSERT_TRUE(unset.runtime.webhookUrl.empty());

    EngineConfig cfg = ConfigLoader::loadFromJsonString(R"({"runtime": {"webhook_url": "${PHASEGAP_TEST_WEBHOOK}"}})");
    ASSERT_EQ(cfg.runtime.webhookUrl, std::string("https://hooks.example.invalid/abc"));
}

void test_MissingFileUsesDefaults() {
    EngineConfig cfg = ConfigLoader::loadFromFile("no_such_phasegap_config.json");
    ASSERT_NEAR(cfg.trigger.exitDeg, 1.5, 0.0);
}

void test_ModeNames() {
    for (ValidationMode m : {ValidationMode::SIGN, ValidationMode::RANK, ValidationMode::BOTH, ValidationMode::EITHER}) {
        ASSERT_TRUE(validationModeFromStr(validationModeToStr(m)) == m);
    }
    ASSERT_THROWS(validationModeFromStr("SIGN"), ConfigError);
}

int main() {
    quietLogs();
    std::cout << "========================================\n";
    std::cout << "Config Tests\n";
    std::cout << "========================================\n\n";

    RUN_TEST(DefaultsAreValid);
    RUN_TEST(LoadFromJson);
    RUN_TEST(ExitMustExceedEnter);
    RUN_TEST(InvalidValuesRejected);
    RUN_TEST(EnvSubstitution);
    RUN_TEST(MissingFileUsesDefaults);
    RUN_TEST(ModeNames);

    return summarize("test_config");
}
