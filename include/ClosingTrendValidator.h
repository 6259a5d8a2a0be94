#pragma once
#include "EngineConfig.h"
#include "Statistics.h"
#include <optional>
#include <vector>

struct ValidationResult {
    int samplesConfirmed = 0;           // 当前连续收敛 (差分为负) 的长度
    bool signConfirmed = false;
    std::optional<KendallResult> rank;  // rank 检验未执行时为空
    bool rankConfirmed = false;
    bool confirmed = false;
};

// 确认收敛趋势不是单个样本的噪声
class ClosingTrendValidator {
public:
    explicit ClosingTrendValidator(const ValidatorConfig& cfg);

    // unwrappedRad: 按时间递增的解缠相位 (rad)
    ValidationResult validate(const std::vector<double>& unwrappedRad) const;

    static int closingStreak(const std::vector<double>& unwrappedRad);

private:
    ValidatorConfig cfg_;
};
