#include "EngineConfig.h"
#include "Logger.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>

using json = nlohmann::json;

std::string validationModeToStr(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::SIGN:   return "sign";
        case ValidationMode::RANK:   return "rank";
        case ValidationMode::BOTH:   return "both";
        case ValidationMode::EITHER: return "either";
    }
    return "sign";
}

ValidationMode validationModeFromStr(const std::string& name) {
    if (name == "sign") return ValidationMode::SIGN;
    if (name == "rank") return ValidationMode::RANK;
    if (name == "both") return ValidationMode::BOTH;
    if (name == "either") return ValidationMode::EITHER;
    throw ConfigError("unknown validator.mode: " + name);
}

static void require(bool cond, const std::string& what) {
    if (!cond) throw ConfigError("invalid config: " + what);
}

void EngineConfig::validate() const {
    require(history.maxSamples >= trend.minSamples, "history.max_samples must be >= trend.min_samples");
    require(trend.maxDays > 0.0, "trend.max_days must be > 0");
    require(trend.minSamples >= 3, "trend.min_samples must be >= 3");
    require(trend.fallbackSamples >= trend.minSamples, "trend.fallback_samples must be >= trend.min_samples");
    require(trend.minTrimSamples >= 3, "trend.min_trim_samples must be >= 3");
    require(trend.trimIterations >= 0, "trend.trim_iterations must be >= 0");
    require(trend.trimLowPct >= 0.0 && trend.trimLowPct < trend.trimHighPct && trend.trimHighPct <= 100.0,
            "trend.trim_low_pct < trend.trim_high_pct within [0,100]");
    require(trend.maxGapDays > 0.0, "trend.max_gap_days must be > 0");
    require(trend.minSpanDays >= 0.0, "trend.min_span_days must be >= 0");

    require(validator.k >= 1, "validator.k must be >= 1");
    require(validator.rankWindow >= 3, "validator.rank_window must be >= 3");
    require(validator.rankAlpha > 0.0 && validator.rankAlpha < 1.0, "validator.rank_alpha in (0,1)");

    require(trigger.enterDeg > 0.0, "trigger.enter_deg must be > 0");
    require(trigger.exitDeg > trigger.enterDeg, "trigger.exit_deg must be > trigger.enter_deg");
    require(trigger.clarityMin >= 0.0 && trigger.clarityMin <= 1.0, "trigger.clarity_min in [0,1]");
    require(trigger.freshnessHours > 0.0, "trigger.freshness_hours must be > 0");
    require(trigger.futureToleranceHours >= 0.0, "trigger.future_tolerance_hours must be >= 0");
    require(trigger.clarityExitEvaluations >= 1, "trigger.clarity_exit_evaluations must be >= 1");

    require(confidence.persistWeight >= 0.0, "confidence.persist_weight must be >= 0");
    require(confidence.persistSaturation > 0.0, "confidence.persist_saturation must be > 0");
    require(confidence.dispersionWeight >= 0.0, "confidence.dispersion_weight must be >= 0");
    require(confidence.etaIqrScaleDays > 0.0, "confidence.eta_iqr_scale_days must be > 0");
    require(confidence.minEtaEstimates >= 2, "confidence.min_eta_estimates must be >= 2");
    require(confidence.coldStartDispersion >= 0.0 && confidence.coldStartDispersion <= 1.0,
            "confidence.cold_start_dispersion in [0,1]");
    require(confidence.etaLogSize >= confidence.minEtaEstimates, "confidence.eta_log_size must be >= min_eta_estimates");

    require(runtime.intervalSeconds >= 1, "runtime.interval_seconds must be >= 1");
    require(runtime.fetchTimeoutSeconds >= 1, "runtime.fetch_timeout_seconds must be >= 1");
}

std::string ConfigLoader::substituteEnvVars(const std::string& content) {
    static const std::regex var(R"(\$\{([^}]+)\})");
    std::string out;
    auto begin = std::sregex_iterator(content.begin(), content.end(), var);
    auto end = std::sregex_iterator();
    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const std::smatch& m = *it;
        out.append(content, last, m.position(0) - last);
        const char* value = std::getenv(m[1].str().c_str());
        if (value) {
            out += value;
        } else {
            LOG_WARN("config: environment variable " + m[1].str() + " not set, using empty value");
        }
        last = m.position(0) + m.length(0);
    }
    out.append(content, last, std::string::npos);
    return out;
}

EngineConfig ConfigLoader::loadFromJsonString(const std::string& jsonStr) {
    json j;
    try {
        j = json::parse(substituteEnvVars(jsonStr));
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("config parse error: ") + e.what());
    }
    if (!j.is_object()) throw ConfigError("config root must be an object");

    EngineConfig cfg;
    try {
        if (j.contains("history")) {
            const auto& h = j["history"];
            cfg.history.maxSamples = h.value("max_samples", cfg.history.maxSamples);
            cfg.history.historyFile = h.value("history_file", cfg.history.historyFile);
        }
        if (j.contains("trend")) {
            const auto& t = j["trend"];
            cfg.trend.maxDays = t.value("max_days", cfg.trend.maxDays);
            cfg.trend.fallbackSamples = t.value("fallback_samples", cfg.trend.fallbackSamples);
            cfg.trend.minSamples = t.value("min_samples", cfg.trend.minSamples);
            cfg.trend.minTrimSamples = t.value("min_trim_samples", cfg.trend.minTrimSamples);
            cfg.trend.trimIterations = t.value("trim_iterations", cfg.trend.trimIterations);
            cfg.trend.trimLowPct = t.value("trim_low_pct", cfg.trend.trimLowPct);
            cfg.trend.trimHighPct = t.value("trim_high_pct", cfg.trend.trimHighPct);
            cfg.trend.maxGapDays = t.value("max_gap_days", cfg.trend.maxGapDays);
            cfg.trend.minSpanDays = t.value("min_span_days", cfg.trend.minSpanDays);
        }
        if (j.contains("validator")) {
            const auto& v = j["validator"];
            cfg.validator.k = v.value("k", cfg.validator.k);
            cfg.validator.mode = validationModeFromStr(v.value("mode", validationModeToStr(cfg.validator.mode)));
            cfg.validator.rankWindow = v.value("rank_window", cfg.validator.rankWindow);
            cfg.validator.rankAlpha = v.value("rank_alpha", cfg.validator.rankAlpha);
        }
        // clarity 退出持续次数缺省跟随 k
        cfg.trigger.clarityExitEvaluations = cfg.validator.k;
        if (j.contains("trigger")) {
            const auto& g = j["trigger"];
            cfg.trigger.enterDeg = g.value("enter_deg", cfg.trigger.enterDeg);
            cfg.trigger.exitDeg = g.value("exit_deg", cfg.trigger.exitDeg);
            cfg.trigger.clarityMin = g.value("clarity_min", cfg.trigger.clarityMin);
            cfg.trigger.freshnessHours = g.value("freshness_hours", cfg.trigger.freshnessHours);
            cfg.trigger.futureToleranceHours = g.value("future_tolerance_hours", cfg.trigger.futureToleranceHours);
            cfg.trigger.clarityExitEvaluations = g.value("clarity_exit_evaluations", cfg.trigger.clarityExitEvaluations);
        }
        if (j.contains("confidence")) {
            const auto& c = j["confidence"];
            cfg.confidence.persistWeight = c.value("persist_weight", cfg.confidence.persistWeight);
            cfg.confidence.persistSaturation = c.value("persist_saturation", cfg.confidence.persistSaturation);
            cfg.confidence.dispersionWeight = c.value("dispersion_weight", cfg.confidence.dispersionWeight);
            cfg.confidence.etaIqrScaleDays = c.value("eta_iqr_scale_days", cfg.confidence.etaIqrScaleDays);
            cfg.confidence.minEtaEstimates = c.value("min_eta_estimates", cfg.confidence.minEtaEstimates);
            cfg.confidence.coldStartDispersion = c.value("cold_start_dispersion", cfg.confidence.coldStartDispersion);
            cfg.confidence.etaLogSize = c.value("eta_log_size", cfg.confidence.etaLogSize);
        }
        if (j.contains("runtime")) {
            const auto& r = j["runtime"];
            cfg.runtime.intervalSeconds = r.value("interval_seconds", cfg.runtime.intervalSeconds);
            cfg.runtime.fetchTimeoutSeconds = r.value("fetch_timeout_seconds", cfg.runtime.fetchTimeoutSeconds);
            cfg.runtime.samplesUrl = r.value("samples_url", cfg.runtime.samplesUrl);
            cfg.runtime.clarityUrl = r.value("clarity_url", cfg.runtime.clarityUrl);
            cfg.runtime.clarityFile = r.value("clarity_file", cfg.runtime.clarityFile);
            cfg.runtime.webhookUrl = r.value("webhook_url", cfg.runtime.webhookUrl);
            cfg.runtime.stateFile = r.value("state_file", cfg.runtime.stateFile);
            cfg.runtime.auditFile = r.value("audit_file", cfg.runtime.auditFile);
            cfg.runtime.statusFile = r.value("status_file", cfg.runtime.statusFile);
            cfg.runtime.logFile = r.value("log_file", cfg.runtime.logFile);
            cfg.runtime.logLevel = r.value("log_level", cfg.runtime.logLevel);
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("config type error: ") + e.what());
    }

    cfg.validate();
    return cfg;
}

EngineConfig ConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        LOG_WARN("Config file " + path + " not found, using defaults");
        EngineConfig cfg;
        cfg.validate();
        return cfg;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    EngineConfig cfg = loadFromJsonString(content);
    LOG_INFO("Loaded configuration from " + path);
    return cfg;
}
