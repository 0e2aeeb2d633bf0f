#pragma once

#include "core/leg.hpp"

#include <vector>

// ---------------------------------------------------------------------------
// Market-conflict rules: two legs on the same game that cannot both win.
// ---------------------------------------------------------------------------
namespace conflict_rules {

inline bool opposite_sides(Side a, Side b) {
    return (a == Side::HOME && b == Side::AWAY) || (a == Side::AWAY && b == Side::HOME);
}

inline bool opposite_totals(Side a, Side b) {
    return (a == Side::OVER && b == Side::UNDER) || (a == Side::UNDER && b == Side::OVER);
}

inline bool conflicts(const Leg& a, const Leg& b) {
    if (!same_game(a, b) || a.market_type != b.market_type) return false;
    Side sa = a.side();
    Side sb = b.side();
    switch (a.market_type) {
        case MarketType::MONEYLINE:
        case MarketType::SPREAD:
            return opposite_sides(sa, sb);
        case MarketType::TOTAL:
            return opposite_totals(sa, sb);
    }
    return false;
}

inline bool conflicts_with_any(const Leg& leg, const std::vector<Leg>& selected) {
    for (const auto& other : selected) {
        if (conflicts(leg, other)) return true;
    }
    return false;
}

}  // namespace conflict_rules
