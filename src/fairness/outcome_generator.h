// src/fairness/outcome_generator.h
#pragma once

#include "../core/types.h"
#include <cstdint>
#include <string>

namespace FairSlot {

// 确定性结果生成器（纯函数，无隐藏状态）
//
//   message = client_seed + ":" + nonce
//   digest  = HMAC-SHA256(server_seed, message)
//   每个转轮取 8 个十六进制字符（32位），对符号表大小取模
//
// 符号表的大小和顺序决定了历史spin能否被验证，部署后不可更改。
class OutcomeGenerator {
public:
    static constexpr int kHexCharsPerReel = 8;
    static constexpr int kDigestHexLength = 64;
    
    OutcomeGenerator(const Symbols& alphabet, int reel_count);
    
    Symbols Generate(const std::string& server_seed,
                     const std::string& client_seed,
                     std::int64_t nonce) const;
    
    // 从已计算的摘要推导符号（验证用）
    Symbols SymbolsFromDigest(const std::string& hex_digest) const;
    
    static std::string BuildMessage(const std::string& client_seed, std::int64_t nonce);
    
    int GetReelCount() const { return reel_count_; }
    const Symbols& GetAlphabet() const { return alphabet_; }

private:
    Symbols alphabet_;
    int reel_count_;
    
    static std::uint32_t ParseHexChunk(const std::string& hex, size_t offset);
};

} // namespace FairSlot
