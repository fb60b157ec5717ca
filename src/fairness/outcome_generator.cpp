// src/fairness/outcome_generator.cpp
#include "outcome_generator.h"
#include "crypto_utils.h"
#include <set>
#include <stdexcept>

namespace FairSlot {

OutcomeGenerator::OutcomeGenerator(const Symbols& alphabet, int reel_count)
    : alphabet_(alphabet), reel_count_(reel_count) {
    
    if (alphabet_.size() < 2) {
        throw std::invalid_argument("Symbol alphabet needs at least 2 symbols");
    }
    
    std::set<std::string> unique_symbols(alphabet_.begin(), alphabet_.end());
    if (unique_symbols.size() != alphabet_.size()) {
        throw std::invalid_argument("Symbol alphabet contains duplicates");
    }
    
    if (reel_count_ < 1 || reel_count_ * kHexCharsPerReel > kDigestHexLength) {
        throw std::invalid_argument("Reel count must be between 1 and " + 
                                    std::to_string(kDigestHexLength / kHexCharsPerReel));
    }
}

Symbols OutcomeGenerator::Generate(const std::string& server_seed,
                                   const std::string& client_seed,
                                   std::int64_t nonce) const {
    const std::string digest = CryptoUtils::HmacSha256Hex(server_seed, 
                                                          BuildMessage(client_seed, nonce));
    return SymbolsFromDigest(digest);
}

Symbols OutcomeGenerator::SymbolsFromDigest(const std::string& hex_digest) const {
    const size_t needed = static_cast<size_t>(reel_count_) * kHexCharsPerReel;
    if (hex_digest.size() < needed) {
        throw std::invalid_argument("Digest too short: need " + std::to_string(needed) + 
                                    " hex characters, got " + std::to_string(hex_digest.size()));
    }
    
    Symbols symbols;
    symbols.reserve(reel_count_);
    
    for (int reel = 0; reel < reel_count_; ++reel) {
        std::uint32_t value = ParseHexChunk(hex_digest, static_cast<size_t>(reel) * kHexCharsPerReel);
        symbols.push_back(alphabet_[value % alphabet_.size()]);
    }
    
    return symbols;
}

std::string OutcomeGenerator::BuildMessage(const std::string& client_seed, std::int64_t nonce) {
    return client_seed + ":" + std::to_string(nonce);
}

std::uint32_t OutcomeGenerator::ParseHexChunk(const std::string& hex, size_t offset) {
    std::uint32_t value = 0;
    
    for (size_t i = offset; i < offset + kHexCharsPerReel; ++i) {
        char c = hex[i];
        std::uint32_t nibble;
        if (c >= '0' && c <= '9') {
            nibble = static_cast<std::uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            nibble = static_cast<std::uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            nibble = static_cast<std::uint32_t>(c - 'A' + 10);
        } else {
            throw std::invalid_argument(std::string("Invalid hex character in digest: ") + c);
        }
        value = (value << 4) | nibble;
    }
    
    return value;
}

} // namespace FairSlot
