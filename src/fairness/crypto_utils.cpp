// src/fairness/crypto_utils.cpp
#include "crypto_utils.h"
#include "../core/errors.h"
#include "../utils/logger.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/err.h>

namespace FairSlot {

namespace {

std::string LastOpenSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // namespace

void CryptoUtils::EnsureCryptoAvailable() {
    if (EVP_sha256() == nullptr) {
        throw CryptoError("SHA-256 digest not available");
    }
    
    // 自检：已知向量
    const std::string probe = Sha256Hex("abc");
    if (probe != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
        throw CryptoError("SHA-256 self-test failed");
    }
    
    if (RAND_status() != 1) {
        throw CryptoError("CSPRNG is not seeded");
    }
    
    LOG_INFO("Crypto primitives available (SHA-256, HMAC-SHA256, CSPRNG)", "CryptoUtils");
}

std::string CryptoUtils::GenerateSeed() {
    std::vector<unsigned char> bytes(kSeedBytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw CryptoError("RAND_bytes failed: " + LastOpenSslError());
    }
    return Base64Encode(bytes);
}

std::string CryptoUtils::Sha256Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, 
                   EVP_sha256(), nullptr) != 1) {
        throw CryptoError("SHA-256 failed: " + LastOpenSslError());
    }
    
    return BytesToHex(digest, digest_len);
}

std::string CryptoUtils::HmacSha256Hex(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    
    // digest 放在栈上，线程安全
    unsigned char* result = HMAC(EVP_sha256(),
                                 key.data(), static_cast<int>(key.size()),
                                 reinterpret_cast<const unsigned char*>(data.data()),
                                 data.size(),
                                 digest, &digest_len);
    if (result == nullptr) {
        throw CryptoError("HMAC-SHA256 failed: " + LastOpenSslError());
    }
    
    return BytesToHex(digest, digest_len);
}

std::string CryptoUtils::Base64Encode(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        return "";
    }
    
    // 每3字节输出4字符，外加结尾的'\0'
    std::string encoded(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                  bytes.data(), static_cast<int>(bytes.size()));
    if (written < 0) {
        throw CryptoError("Base64 encoding failed");
    }
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

std::string CryptoUtils::BytesToHex(const unsigned char* data, size_t length) {
    static const char kHexDigits[] = "0123456789abcdef";
    
    std::string hex;
    hex.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        hex.push_back(kHexDigits[data[i] >> 4]);
        hex.push_back(kHexDigits[data[i] & 0x0f]);
    }
    return hex;
}

} // namespace FairSlot
