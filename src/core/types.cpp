// src/core/types.cpp
#include "types.h"
#include "errors.h"
#include <cctype>
#include <limits>

namespace FairSlot {

namespace {

struct ParsedDecimal {
    bool negative = false;
    std::string integer_part;
    std::string fraction_part;
};

ParsedDecimal SplitDecimal(const std::string& text) {
    ParsedDecimal parsed;
    size_t pos = 0;
    
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        parsed.negative = text[pos] == '-';
        ++pos;
    }
    
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        parsed.integer_part.push_back(text[pos++]);
    }
    
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            parsed.fraction_part.push_back(text[pos++]);
        }
    }
    
    if (pos != text.size() || (parsed.integer_part.empty() && parsed.fraction_part.empty())) {
        throw ValidationError("Malformed amount: '" + text + "'");
    }
    
    return parsed;
}

} // namespace

Money ToMinorUnits(const std::string& decimal_amount) {
    ParsedDecimal parsed = SplitDecimal(decimal_amount);
    
    const Money max_major = std::numeric_limits<Money>::max() / kMinorUnitsPerMajor - 1;
    
    Money major = 0;
    for (char c : parsed.integer_part) {
        major = major * 10 + (c - '0');
        if (major > max_major) {
            throw ValidationError("Amount out of range: '" + decimal_amount + "'");
        }
    }
    
    // 只取前两位小数，其余截断
    Money minor = 0;
    for (int i = 0; i < kMinorUnitDigits; ++i) {
        minor *= 10;
        if (i < static_cast<int>(parsed.fraction_part.size())) {
            minor += parsed.fraction_part[i] - '0';
        }
    }
    
    Money total = major * kMinorUnitsPerMajor + minor;
    return parsed.negative ? -total : total;
}

Money ParseWager(const std::string& decimal_amount) {
    ParsedDecimal parsed = SplitDecimal(decimal_amount);
    
    for (size_t i = kMinorUnitDigits; i < parsed.fraction_part.size(); ++i) {
        if (parsed.fraction_part[i] != '0') {
            throw ValidationError("Amount has more than " + std::to_string(kMinorUnitDigits) +
                                  " decimal places: '" + decimal_amount + "'");
        }
    }
    
    Money amount = ToMinorUnits(decimal_amount);
    if (amount <= 0) {
        throw ValidationError("Wager must be positive: '" + decimal_amount + "'");
    }
    return amount;
}

std::string FormatMoney(Money amount) {
    bool negative = amount < 0;
    // 取绝对值时避免溢出
    std::uint64_t magnitude = negative 
        ? static_cast<std::uint64_t>(-(amount + 1)) + 1 
        : static_cast<std::uint64_t>(amount);
    
    std::string minor = std::to_string(magnitude % kMinorUnitsPerMajor);
    if (minor.size() < static_cast<size_t>(kMinorUnitDigits)) {
        minor.insert(0, kMinorUnitDigits - minor.size(), '0');
    }
    
    return (negative ? "-" : "") + std::to_string(magnitude / kMinorUnitsPerMajor) + "." + minor;
}

} // namespace FairSlot
