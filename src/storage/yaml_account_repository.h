// src/storage/yaml_account_repository.h
#pragma once

#include "account_repository.h"
#include <yaml-cpp/yaml.h>
#include <mutex>
#include <string>
#include <unordered_map>

namespace FairSlot {

// 基于YAML文件的冷存储
// 全表常驻内存；每次修改后整体写入临时文件再rename，保证文件始终完整
class YamlAccountRepository : public AccountRepository {
public:
    explicit YamlAccountRepository(const std::string& file_path);
    ~YamlAccountRepository() override = default;
    
    std::optional<Account> Load(const std::string& id) override;
    void Save(const Account& account) override;
    bool Insert(const Account& account) override;
    bool Update(const std::string& id, const Mutator& mutator) override;
    size_t Count() const override;
    
    const std::string& GetFilePath() const { return file_path_; }

private:
    std::string file_path_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Account> accounts_;
    
    void LoadFromFile();
    void PersistLocked() const;
    
    static Account ParseAccount(const YAML::Node& node);
    static void EmitAccount(YAML::Emitter& out, const Account& account);
};

} // namespace FairSlot
