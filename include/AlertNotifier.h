#pragma once
#include <string>

class AlertNotifier {
public:
    virtual ~AlertNotifier() = default;
    virtual bool sendMessage(const std::string& text) = 0;
};
