// src/payout/win_rules.cpp
#include "win_rules.h"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace FairSlot {

MultiplierRule::MultiplierRule(const std::string& name, std::int64_t multiplier, int reel_count)
    : reel_count_(reel_count), name_(name), multiplier_(multiplier) {
    
    if (multiplier_ <= 0) {
        throw std::invalid_argument("Rule " + name_ + ": multiplier must be positive");
    }
    if (reel_count_ < 1) {
        throw std::invalid_argument("Rule " + name_ + ": reel count must be positive");
    }
}

Money MultiplierRule::CalculateWin(Money bet_amount) const {
    if (bet_amount > std::numeric_limits<Money>::max() / multiplier_) {
        throw std::overflow_error("Payout overflow in rule " + name_);
    }
    return bet_amount * multiplier_;
}

bool MultiplierRule::AllEqual(const Symbols& symbols) const {
    if (static_cast<int>(symbols.size()) != reel_count_) {
        return false;
    }
    return std::all_of(symbols.begin(), symbols.end(),
                       [&](const std::string& symbol) { return symbol == symbols.front(); });
}

JackpotRule::JackpotRule(const std::string& jackpot_symbol, std::int64_t multiplier, 
                         int reel_count)
    : MultiplierRule("jackpot", multiplier, reel_count), jackpot_symbol_(jackpot_symbol) {
}

bool JackpotRule::Matches(const Symbols& symbols) const {
    return AllEqual(symbols) && symbols.front() == jackpot_symbol_;
}

ThreeOfAKindRule::ThreeOfAKindRule(const std::string& jackpot_symbol, std::int64_t multiplier, 
                                   int reel_count)
    : MultiplierRule("three_of_a_kind", multiplier, reel_count), jackpot_symbol_(jackpot_symbol) {
}

bool ThreeOfAKindRule::Matches(const Symbols& symbols) const {
    return AllEqual(symbols) && symbols.front() != jackpot_symbol_;
}

} // namespace FairSlot
