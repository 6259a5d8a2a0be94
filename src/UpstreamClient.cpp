#include "UpstreamClient.h"
#include "Logger.h"
#include "SampleLoader.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

using json = nlohmann::json;

// libcurl 回调函数：写入内存
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

UpstreamClient::UpstreamClient(long timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {
    curl_global_init(CURL_GLOBAL_ALL);
}

UpstreamClient::~UpstreamClient() {
    curl_global_cleanup();
}

std::string UpstreamClient::httpGet(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("CURL init failed");

    std::string readBuffer;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }
    if (status >= 400) {
        throw std::runtime_error("HTTP " + std::to_string(status) + " from " + url);
    }
    return readBuffer;
}

std::optional<double> UpstreamClient::parseClarityJson(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) return std::nullopt;
        for (const char* key : {"gti_value", "gti", "clarity"}) {
            if (j.contains(key) && j[key].is_number()) {
                double v = j[key].get<double>();
                if (std::isfinite(v) && v >= 0.0 && v <= 1.0) return v;
                LOG_WARN(std::string("clarity value out of range for key ") + key);
                return std::nullopt;
            }
        }
    } catch (const json::parse_error& e) {
        LOG_WARN(std::string("clarity JSON parse error: ") + e.what());
    }
    return std::nullopt;
}

std::optional<double> UpstreamClient::fetchClarity(const std::string& url) {
    try {
        return parseClarityJson(httpGet(url));
    } catch (std::exception& e) {
        LOG_ERROR("fetchClarity error: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::vector<Sample> UpstreamClient::fetchSamples(const std::string& url) {
    try {
        std::string resp = httpGet(url);
        if (resp.empty()) {
            LOG_WARN("fetchSamples empty response from " + url);
            return {};
        }
        SampleLoader loader;
        return loader.loadFromJsonString(resp);
    } catch (std::exception& e) {
        LOG_ERROR("fetchSamples error: " + std::string(e.what()));
        return {};
    }
}

std::optional<double> UpstreamClient::readClarityFile(const std::string& path) const {
    std::ifstream ifs(path);
    if (!ifs) {
        LOG_WARN("clarity file not found: " + path);
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parseClarityJson(content);
}
