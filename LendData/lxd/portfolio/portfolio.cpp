/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <lxd/portfolio/portfolio.hpp>
#include <lxd/utilities/log.hpp>
#include <lxd/utilities/parsers.hpp>
#include <lxe/errors.hpp>
#include <lxe/time/tenorschedule.hpp>

#include <set>

namespace lend {
namespace data {

Portfolio::Portfolio(const std::vector<Position>& positions) { build(positions); }

void Portfolio::build(const std::vector<Position>& positions) {
    std::vector<Size> runStarts, runIndex;
    std::map<std::pair<CurrencyId, Timestamp>, Size> futureClaims;
    std::set<CurrencyId> closedRuns;

    for (Size i = 0; i < positions.size(); ++i) {
        const Position& p = positions[i];
        if (i == 0 || p.currencyId() != positions[i - 1].currencyId()) {
            LXE_REQUIRE_CONTRACT(closedRuns.insert(p.currencyId()).second,
                                 "positions of currency " << p.currencyId() << " are not contiguous, position " << i
                                                          << " starts a second run");
            runStarts.push_back(i);
        }
        runIndex.push_back(runStarts.size() - 1);

        if (p.isFutureClaim()) {
            bool inserted = futureClaims.insert(std::make_pair(std::make_pair(p.currencyId(), p.maturity()), i)).second;
            LXE_REQUIRE_CONTRACT(inserted, "duplicate future claim for currency " << p.currencyId() << " maturity "
                                                                                << p.maturity() << " at position " << i);
        } else {
            LXE_REQUIRE_CONTRACT(p.tier() >= 1 && p.tier() <= LendExt::TenorSchedule::maxTiers,
                                 "invalid tier at position " << i << ": " << p);
        }
    }

    positions_ = positions;
    initialNotionals_.clear();
    for (const auto& p : positions_)
        initialNotionals_.push_back(p.notional());
    runStarts_.swap(runStarts);
    runIndex_.swap(runIndex);
    futureClaims_.swap(futureClaims);
    DLOG("Portfolio built with " << positions_.size() << " positions in " << runStarts_.size() << " currency runs");
}

const Position& Portfolio::operator[](Size i) const {
    LXE_REQUIRE_CONTRACT(i < positions_.size(), "position index " << i << " out of range, portfolio size "
                                                                   << positions_.size());
    return positions_[i];
}

Size Portfolio::runBegin(Size i) const {
    LXE_REQUIRE_CONTRACT(i < positions_.size(), "position index " << i << " out of range, portfolio size "
                                                                   << positions_.size());
    return runStarts_[runIndex_[i]];
}

Size Portfolio::runEnd(Size i) const {
    LXE_REQUIRE_CONTRACT(i < positions_.size(), "position index " << i << " out of range, portfolio size "
                                                                   << positions_.size());
    Size next = runIndex_[i] + 1;
    return next < runStarts_.size() ? runStarts_[next] : positions_.size();
}

Size Portfolio::futureClaimIndex(CurrencyId currencyId, Timestamp maturity) const {
    auto it = futureClaims_.find(std::make_pair(currencyId, maturity));
    return it == futureClaims_.end() ? positions_.size() : it->second;
}

void Portfolio::accumulateNotional(Size i, const Amount& amount) {
    LXE_REQUIRE_CONTRACT(i < positions_.size(), "position index " << i << " out of range, portfolio size "
                                                                   << positions_.size());
    Position& p = positions_[i];
    LXE_REQUIRE_CONTRACT(p.isFutureClaim(), "cannot accumulate a notional into " << p);
    p.setNotional(LendExt::SafeInt256::add(p.notional(), amount));
}

void Portfolio::reset() {
    for (Size i = 0; i < positions_.size(); ++i)
        positions_[i].setNotional(initialNotionals_[i]);
}

void Portfolio::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "Portfolio");
    std::vector<Position> positions;
    for (XMLNode* n : XMLUtils::getChildrenNodes(node, "Position")) {
        LendExt::CurrencyId ccy = static_cast<LendExt::CurrencyId>(parseSize(XMLUtils::getChildValue(n, "CurrencyId", true)));
        Timestamp maturity = parseTimestamp(XMLUtils::getChildValue(n, "Maturity", true));
        Position::Kind kind = parsePositionKind(XMLUtils::getChildValue(n, "Kind", true));
        Size tier = 0;
        if (kind == Position::Kind::PooledLiquidity)
            tier = parseTier(XMLUtils::getChildValue(n, "Tier", true));
        Amount notional = parseAmount(XMLUtils::getChildValue(n, "Notional", true));
        positions.push_back(Position(ccy, maturity, kind, tier, notional));
        TLOG("Loaded position " << positions.back());
    }
    build(positions);
}

} // namespace data
} // namespace lend
