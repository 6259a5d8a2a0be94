#pragma once
#include "ConvergenceEngine.h"
#include <nlohmann/json.hpp>
#include <string>

class ReportGenerator {
public:
    static nlohmann::json statusToJson(const StatusRecord& st);
    static nlohmann::json etaToJson(const EtaRecord& eta);

    void printToConsole(const StatusRecord& st, const EtaRecord& eta);
    bool saveToFile(const std::string& path, const StatusRecord& st, const EtaRecord& eta);
};
