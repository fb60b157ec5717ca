// src/payout/win_rule.h
#pragma once

#include "../core/types.h"
#include <string>

namespace FairSlot {

// 中奖规则接口；新增规则只需新增实现类，无需修改已有规则
class WinRule {
public:
    virtual ~WinRule() = default;
    
    virtual bool Matches(const Symbols& symbols) const = 0;
    virtual Money CalculateWin(Money bet_amount) const = 0;
    virtual const std::string& GetName() const = 0;
};

} // namespace FairSlot
