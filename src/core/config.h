// src/core/config.h
#pragma once

#include "types.h"
#include <yaml-cpp/yaml.h>
#include <string>

namespace FairSlot {

class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // 加载服务配置文件，缺省项使用默认值
    bool LoadServiceConfig(const std::string& config_path);
    
    // 从YAML文本加载（测试用）
    bool LoadServiceConfigFromString(const std::string& yaml_text);
    
    // 校验符号表、头奖符号、规则列表等
    bool ValidateServiceConfig() const;
    
    const ServiceConfig& GetServiceConfig() const { return service_config_; }
    ServiceConfig& GetMutableServiceConfig() { return service_config_; }

private:
    ServiceConfig service_config_;
    
    bool ParseRoot(const YAML::Node& root);
    
    void ParseWalletConfig(const YAML::Node& node, WalletConfig& config);
    void ParseFairnessConfig(const YAML::Node& node, FairnessConfig& config);
    void ParsePayoutRulesConfig(const YAML::Node& node, std::vector<PayoutRuleConfig>& rules);
    void ParseReconciliationConfig(const YAML::Node& node, ReconciliationConfig& config);
    void ParseStorageConfig(const YAML::Node& node, StorageConfig& config);
    void ParseLoggingConfig(const YAML::Node& node, LoggingConfig& config);
    void ParseLoadTestConfig(const YAML::Node& node, LoadTestConfig& config);
};

} // namespace FairSlot
