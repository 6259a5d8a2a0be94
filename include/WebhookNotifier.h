#ifndef WEBHOOK_NOTIFIER_H
#define WEBHOOK_NOTIFIER_H

#include "AlertNotifier.h"
#include <string>
#include <mutex>

// 飞书机器人 webhook 告警
class WebhookNotifier : public AlertNotifier {
public:
    static WebhookNotifier& instance() {
        static WebhookNotifier inst;
        return inst;
    }

    void setWebhook(const std::string& webhook) {
        std::lock_guard<std::mutex> lk(mu_);
        webhook_ = webhook;
    }

    void setTimeoutSeconds(long seconds) {
        std::lock_guard<std::mutex> lk(mu_);
        timeoutSeconds_ = seconds;
    }

    bool sendMessage(const std::string& text) override;

    static std::string buildPayload(const std::string& text);

private:
    WebhookNotifier() = default;
    ~WebhookNotifier() override = default;
    WebhookNotifier(const WebhookNotifier&) = delete;
    WebhookNotifier& operator=(const WebhookNotifier&) = delete;

    std::string webhook_;
    long timeoutSeconds_ = 10;
    std::mutex mu_;
};

#endif
