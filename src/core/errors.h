// src/core/errors.h
#pragma once

#include <stdexcept>
#include <string>

namespace FairSlot {

// 领域错误基类，Kind 供上层（HTTP层等）映射状态码
class ServiceError : public std::runtime_error {
public:
    enum class Kind {
        NOT_FOUND,
        CONFLICT,
        INSUFFICIENT_FUNDS,
        VALIDATION,
        CRYPTO
    };
    
    ServiceError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    
    Kind GetKind() const { return kind_; }

private:
    Kind kind_;
};

class NotFoundError : public ServiceError {
public:
    NotFoundError(const std::string& resource, const std::string& id)
        : ServiceError(Kind::NOT_FOUND, resource + " not found with id: " + id) {}
};

class ConflictError : public ServiceError {
public:
    explicit ConflictError(const std::string& id)
        : ServiceError(Kind::CONFLICT, "Account already exists: " + id) {}
};

class InsufficientFundsError : public ServiceError {
public:
    explicit InsufficientFundsError(const std::string& account_id)
        : ServiceError(Kind::INSUFFICIENT_FUNDS, 
                       "Insufficient funds for account: " + account_id) {}
};

class ValidationError : public ServiceError {
public:
    explicit ValidationError(const std::string& message)
        : ServiceError(Kind::VALIDATION, message) {}
};

// 哈希原语不可用，只应在启动阶段出现
class CryptoError : public ServiceError {
public:
    explicit CryptoError(const std::string& message)
        : ServiceError(Kind::CRYPTO, "Internal cryptography error: " + message) {}
};

} // namespace FairSlot
