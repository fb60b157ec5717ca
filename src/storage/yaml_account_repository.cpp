// src/storage/yaml_account_repository.cpp
#include "yaml_account_repository.h"
#include "../utils/logger.h"
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>

namespace FairSlot {

YamlAccountRepository::YamlAccountRepository(const std::string& file_path)
    : file_path_(file_path) {
    
    std::filesystem::path path(file_path_);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    
    if (std::filesystem::exists(path)) {
        LoadFromFile();
    }
    
    LOG_INFO("YamlAccountRepository opened " + file_path_ + " with " + 
             std::to_string(accounts_.size()) + " accounts", "YamlAccountRepository");
}

std::optional<Account> YamlAccountRepository::Load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void YamlAccountRepository::Save(const Account& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto previous = accounts_.find(account.id);
    std::optional<Account> backup;
    if (previous != accounts_.end()) {
        backup = previous->second;
    }
    
    accounts_[account.id] = account;
    try {
        PersistLocked();
    } catch (...) {
        // 写盘失败：回滚内存状态后继续抛出
        if (backup) {
            accounts_[account.id] = *backup;
        } else {
            accounts_.erase(account.id);
        }
        throw;
    }
}

bool YamlAccountRepository::Insert(const Account& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accounts_.emplace(account.id, account).second) {
        return false;
    }
    
    try {
        PersistLocked();
    } catch (...) {
        accounts_.erase(account.id);
        throw;
    }
    return true;
}

bool YamlAccountRepository::Update(const std::string& id, const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return false;
    }
    
    Account working = it->second;
    if (!mutator(working)) {
        return true;
    }
    
    Account backup = it->second;
    it->second = std::move(working);
    try {
        PersistLocked();
    } catch (...) {
        it->second = std::move(backup);
        throw;
    }
    return true;
}

size_t YamlAccountRepository::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

void YamlAccountRepository::LoadFromFile() {
    YAML::Node root = YAML::LoadFile(file_path_);
    
    if (!root["accounts"]) {
        return;
    }
    
    for (const auto& node : root["accounts"]) {
        Account account = ParseAccount(node);
        accounts_[account.id] = std::move(account);
    }
}

void YamlAccountRepository::PersistLocked() const {
    // 按id排序输出，文件内容稳定便于diff
    std::map<std::string, const Account*> ordered;
    for (const auto& [id, account] : accounts_) {
        ordered[id] = &account;
    }
    
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "accounts" << YAML::Value << YAML::BeginSeq;
    for (const auto& [id, account] : ordered) {
        EmitAccount(out, *account);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    
    if (!out.good()) {
        throw std::runtime_error("Failed to serialize accounts: " + out.GetLastError());
    }
    
    const std::string temp_path = file_path_ + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open account store for writing: " + temp_path);
        }
        file << out.c_str() << "\n";
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed to write account store: " + temp_path);
        }
    }
    
    std::filesystem::rename(temp_path, file_path_);
}

Account YamlAccountRepository::ParseAccount(const YAML::Node& node) {
    Account account;
    account.id = node["id"].as<std::string>();
    account.balance = node["balance"].as<Money>(0);
    account.server_seed = node["server_seed"].as<std::string>("");
    account.server_seed_hash = node["server_seed_hash"].as<std::string>("");
    account.client_seed = node["client_seed"].as<std::string>("");
    account.nonce = node["nonce"].as<std::int64_t>(0);
    account.spin_count = node["spin_count"].as<std::int64_t>(0);
    account.balance_version = node["balance_version"].as<std::int64_t>(0);
    return account;
}

void YamlAccountRepository::EmitAccount(YAML::Emitter& out, const Account& account) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << account.id;
    out << YAML::Key << "balance" << YAML::Value << account.balance;
    out << YAML::Key << "server_seed" << YAML::Value << account.server_seed;
    out << YAML::Key << "server_seed_hash" << YAML::Value << account.server_seed_hash;
    out << YAML::Key << "client_seed" << YAML::Value << account.client_seed;
    out << YAML::Key << "nonce" << YAML::Value << account.nonce;
    out << YAML::Key << "spin_count" << YAML::Value << account.spin_count;
    out << YAML::Key << "balance_version" << YAML::Value << account.balance_version;
    out << YAML::EndMap;
}

} // namespace FairSlot
