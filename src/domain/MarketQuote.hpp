/**
 * @file MarketQuote.hpp
 * @brief Price snapshot delivered by the market collaborator.
 */

#pragma once

#include <string>
#include "domain/Clock.hpp"

namespace worldpulse::domain {

struct MarketQuote {
    std::string symbol;
    std::string name;
    double price = 0.0;
    double changePercent = 0.0;
    Timestamp timestamp{};
};

} // namespace worldpulse::domain
