#pragma once

#include "core/errors.hpp"
#include "core/leg.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LegFlipper — turns a leg into the opposite outcome of the same market.
//   h2h:     home <-> away (literal or team name)
//   spreads: home <-> away, point negated
//   totals:  over <-> under, point unchanged
// Prices swap with the stored opposite quote, so flip(flip(leg)) == leg.
// ---------------------------------------------------------------------------
struct LegFlipper {
    static Leg flip(const Leg& leg) {
        Leg out = leg;
        switch (leg.market_type) {
            case MarketType::MONEYLINE:
                out.outcome = other_team_pick(leg, "moneyline");
                break;
            case MarketType::SPREAD:
                out.outcome = other_team_pick(leg, "spread");
                if (leg.point) out.point = -*leg.point;
                break;
            case MarketType::TOTAL:
                if (leg.outcome == "over") out.outcome = "under";
                else if (leg.outcome == "under") out.outcome = "over";
                else throw ValidationError("Invalid totals pick '" + leg.outcome +
                                           "' (expected over/under) for game " + leg.game_label());
                break;
            default:
                throw ValidationError("Unsupported market_type (expected h2h/spreads/totals)");
        }
        out.set_quote(leg.opposite);
        out.opposite = leg.quote();
        return out;
    }

    static std::vector<Leg> flip_all(const std::vector<Leg>& legs) {
        std::vector<Leg> out;
        out.reserve(legs.size());
        for (const auto& leg : legs) out.push_back(flip(leg));
        return out;
    }

private:
    static std::string other_team_pick(const Leg& leg, const char* market_name) {
        if (leg.outcome == "home") return "away";
        if (leg.outcome == "away") return "home";
        if (!leg.home_team.empty() && leg.outcome == leg.home_team && !leg.away_team.empty()) {
            return leg.away_team;
        }
        if (!leg.away_team.empty() && leg.outcome == leg.away_team && !leg.home_team.empty()) {
            return leg.home_team;
        }
        throw ValidationError("Invalid " + std::string(market_name) + " pick '" + leg.outcome +
                              "' for game " + leg.game_label());
    }
};
