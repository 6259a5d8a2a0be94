#ifndef UPSTREAM_CLIENT_H
#define UPSTREAM_CLIENT_H

#include "PhaseHistoryStore.h"
#include <optional>
#include <string>
#include <vector>

// 上游数据: clarity (GTI) 与相位样本. 所有拉取都有超时, 失败返回空
class UpstreamClient {
public:
    explicit UpstreamClient(long timeoutSeconds = 10);
    ~UpstreamClient();

    std::optional<double> fetchClarity(const std::string& url);
    std::vector<Sample> fetchSamples(const std::string& url);

    // 本地文件中的最新 clarity, 格式同 HTTP 接口
    std::optional<double> readClarityFile(const std::string& path) const;

    // {"gti_value": x} / {"gti": x} / {"clarity": x}, 取值需在 [0,1]
    static std::optional<double> parseClarityJson(const std::string& body);

private:
    std::string httpGet(const std::string& url);

    long timeoutSeconds_;
};

#endif
