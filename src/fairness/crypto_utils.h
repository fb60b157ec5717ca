// src/fairness/crypto_utils.h
#pragma once

#include <string>
#include <vector>

namespace FairSlot {

// Provably Fair 所需的密码学原语（OpenSSL libcrypto）
// 失败时抛出 CryptoError
class CryptoUtils {
public:
    // 启动检查：SHA-256 / HMAC / CSPRNG 不可用时抛出，阻止服务启动
    static void EnsureCryptoAvailable();
    
    // 32字节安全随机数，Base64编码，用作server seed
    static std::string GenerateSeed();
    
    // SHA-256，小写十六进制
    static std::string Sha256Hex(const std::string& input);
    
    // HMAC-SHA256(key, data)，小写十六进制
    static std::string HmacSha256Hex(const std::string& key, const std::string& data);
    
    static std::string Base64Encode(const std::vector<unsigned char>& bytes);
    static std::string BytesToHex(const unsigned char* data, size_t length);

    static constexpr size_t kSeedBytes = 32;
};

} // namespace FairSlot
