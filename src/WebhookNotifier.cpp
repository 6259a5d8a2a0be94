#include "WebhookNotifier.h"
#include "Logger.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t DiscardCallback(void* /*contents*/, size_t size, size_t nmemb, void* /*userp*/) {
    return size * nmemb;
}

std::string WebhookNotifier::buildPayload(const std::string& text) {
    json body;
    body["msg_type"] = "text";
    body["content"]["text"] = text;
    return body.dump();
}

bool WebhookNotifier::sendMessage(const std::string& text) {
    std::string url;
    long timeout = 10;
    {
        std::lock_guard<std::mutex> lk(mu_);
        url = webhook_;
        timeout = timeoutSeconds_;
    }
    if (url.empty()) {
        LOG_WARN("webhook not configured, alert not sent: " + text);
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG_ERROR("CURL init failed, alert not sent");
        return false;
    }

    std::string payload = buildPayload(text);
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, DiscardCallback);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        LOG_ERROR("webhook request failed: " + std::string(curl_easy_strerror(res)));
        return false;
    }
    if (status >= 400) {
        LOG_ERROR("webhook returned HTTP " + std::to_string(status));
        return false;
    }
    return true;
}
