// src/storage/account_repository.h
#pragma once

#include "../core/types.h"
#include <functional>
#include <optional>
#include <string>

namespace FairSlot {

// 冷存储（系统记录）接口
class AccountRepository {
public:
    // 返回 false 表示放弃本次修改（不写回）
    using Mutator = std::function<bool(Account&)>;
    
    virtual ~AccountRepository() = default;
    
    virtual std::optional<Account> Load(const std::string& id) = 0;
    
    // 整条记录 upsert
    virtual void Save(const Account& account) = 0;
    
    // 仅创建；id已存在时返回 false
    virtual bool Insert(const Account& account) = 0;
    
    // 单条记录的原子读-改-写；id不存在时返回 false
    virtual bool Update(const std::string& id, const Mutator& mutator) = 0;
    
    virtual size_t Count() const = 0;
};

} // namespace FairSlot
