//------------------------------------------------------------------------------
/*
    This file is part of trustnet, derived from rippled:
    https://github.com/ripple/rippled
    Copyright (c) 2012-2024 Ripple Labs Inc.

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================


#include <test/jtx.h>

#include <trustnet/protocol/Indexes.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace trustnet {
namespace test {

class Invariants_test : public boost::beast::unit_test::suite
{
    using Pair = std::pair<std::size_t, std::size_t>;

    std::vector<jtx::Account> const accounts_{
        jtx::Account{"alice"},
        jtx::Account{"bob"},
        jtx::Account{"carol"},
        jtx::Account{"dan"},
        jtx::Account{"eve"}};

    struct State
    {
        std::int64_t balance;
        std::int64_t limitLo;
        std::int64_t limitHi;

        bool
        operator==(State const&) const = default;
    };

    std::map<Pair, State>
    snapshot(jtx::Env& env) const
    {
        std::map<Pair, State> ret;
        for (std::size_t i = 0; i < accounts_.size(); ++i)
        {
            for (std::size_t j = i + 1; j < accounts_.size(); ++j)
            {
                if (auto const line = env.le(accounts_[i], accounts_[j]))
                    ret[{i, j}] = State{
                        line->balance(), line->limitLo(), line->limitHi()};
            }
        }
        return ret;
    }

    // Every line must carry a balance within its limits.
    bool
    withinLimits(std::map<Pair, State> const& lines)
    {
        bool ok = true;
        for (auto const& [pair, s] : lines)
        {
            if (s.balance > s.limitLo || s.balance < -s.limitHi)
            {
                ok = false;
                log << accounts_[pair.first].name() << "/"
                    << accounts_[pair.second].name()
                    << " balance=" << s.balance << " limits=" << s.limitLo
                    << "/" << s.limitHi << std::endl;
            }
        }
        return ok;
    }

    void
    testCanonicalOrder()
    {
        testcase("Canonical order");

        std::mt19937 rng(20241019);
        std::uniform_int_distribution<int> byte(0, 255);

        for (int n = 0; n < 200; ++n)
        {
            AccountID p;
            AccountID q;
            for (auto& b : p)
                b = static_cast<std::uint8_t>(byte(rng));
            for (auto& b : q)
                b = static_cast<std::uint8_t>(byte(rng));

            auto const pq = canonicalize(p, q);
            auto const qp = canonicalize(q, p);
            if (!BEAST_EXPECT(pq && qp))
                continue;
            BEAST_EXPECT(*pq == *qp);
            BEAST_EXPECT(pq->lo < pq->hi);
            BEAST_EXPECT(keylet::line(p, q).key == keylet::line(q, p).key);
        }

        for (auto const& a : accounts_)
        {
            for (auto const& b : accounts_)
            {
                auto const ab = canonicalize(a, b);
                auto const ba = canonicalize(b, a);
                if (a == b)
                {
                    BEAST_EXPECT(!ab && ab.error() == temDST_IS_SRC);
                    continue;
                }
                BEAST_EXPECT(ab && ba && *ab == *ba);
            }
        }
    }

    void
    testRandomSequence(std::uint32_t seed)
    {
        testcase("Random sequence, seed " + std::to_string(seed));

        using namespace jtx;
        Env env(*this);
        std::mt19937 rng(seed);

        auto pick = [&rng](std::int64_t lo, std::int64_t hi) {
            return std::uniform_int_distribution<std::int64_t>(lo, hi)(rng);
        };

        // Distinct account indexes, in random order.
        auto distinct = [&](std::size_t count) {
            std::vector<std::size_t> ids(accounts_.size());
            for (std::size_t i = 0; i < ids.size(); ++i)
                ids[i] = i;
            std::shuffle(ids.begin(), ids.end(), rng);
            ids.resize(count);
            return ids;
        };

        for (std::size_t i = 0; i < accounts_.size(); ++i)
        {
            for (std::size_t j = i + 1; j < accounts_.size(); ++j)
                env(trust(
                    accounts_[i], accounts_[j], pick(50, 500), pick(50, 500)));
        }

        auto lines = snapshot(env);
        BEAST_EXPECT(lines.size() == 10);

        int applied = 0;
        int refused = 0;
        for (int step = 0; step < 400; ++step)
        {
            ApplyResult result{tesSUCCESS, false, 0, {}};
            switch (pick(0, 3))
            {
                case 0: {
                    auto const ids = distinct(2);
                    result = env(
                        pay(accounts_[ids[0]],
                            accounts_[ids[1]],
                            pick(1, 200)),
                        ter(std::ignore));
                    break;
                }
                case 1: {
                    auto const ids =
                        distinct(static_cast<std::size_t>(pick(3, 5)));
                    std::vector<Account> hops;
                    for (std::size_t h = 1; h + 1 < ids.size(); ++h)
                        hops.push_back(accounts_[ids[h]]);
                    result = env(
                        ripple(
                            accounts_[ids.front()],
                            hops,
                            accounts_[ids.back()],
                            pick(1, 200)),
                        ter(std::ignore));
                    break;
                }
                case 2: {
                    auto const ids = distinct(2);
                    result = env(
                        limits(
                            accounts_[ids[0]],
                            accounts_[ids[1]],
                            pick(1, 500),
                            pick(1, 500)),
                        sig(accounts_[ids[1]]),
                        ter(std::ignore));
                    break;
                }
                default: {
                    auto const ids = distinct(2);
                    auto const& debtor = accounts_[ids[0]];
                    auto const& creditor = accounts_[ids[1]];
                    auto const owed = env.balance(creditor, debtor);
                    auto const amount =
                        owed > 0 ? pick(1, owed) : pick(1, 100);
                    result = env(
                        settle(debtor, creditor, amount), ter(std::ignore));
                    break;
                }
            }

            auto const after = snapshot(env);
            if (result.applied)
            {
                ++applied;
                BEAST_EXPECT(isTesSuccess(result.ter));
                BEAST_EXPECT(result.seq == env.seq());
                if (!BEAST_EXPECT(withinLimits(after)))
                    return;
            }
            else
            {
                ++refused;
                BEAST_EXPECT(after == lines);
            }
            lines = after;
        }

        BEAST_EXPECT(env.seq() == 10 + applied);
        BEAST_EXPECT(applied > 0);
        BEAST_EXPECT(refused > 0);
        log << "seed " << seed << ": " << applied << " applied, " << refused
            << " refused" << std::endl;
    }

public:
    void
    run() override
    {
        testCanonicalOrder();
        for (std::uint32_t seed : {1u, 7u, 42u, 1000003u})
            testRandomSequence(seed);
    }
};

BEAST_DEFINE_TESTSUITE(trustnet, app, Invariants);

}  // namespace test
}  // namespace trustnet
