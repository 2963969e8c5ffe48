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


#include <test/jtx/Account.h>

#include <trustnet/ledger/Sandbox.h>
#include <trustnet/ledger/TrustLineStore.h>
#include <trustnet/ledger/View.h>

#include <boost/beast/_experimental/unit_test/suite.hpp>

#include <limits>
#include <stdexcept>

namespace trustnet {
namespace test {

class TrustLineStore_test : public boost::beast::unit_test::suite
{
    jtx::Account const alice{"alice"};
    jtx::Account const bob{"bob"};
    jtx::Account const carol{"carol"};

    static LinePair
    pair(AccountID const& a, AccountID const& b)
    {
        auto const p = canonicalize(a, b);
        if (!p)
            return {};
        return *p;
    }

    static std::shared_ptr<TrustLine>
    makeLine(
        AccountID const& a,
        AccountID const& b,
        std::int64_t limitLo,
        std::int64_t limitHi)
    {
        return std::make_shared<TrustLine>(
            pair(a, b), 1, limitLo, limitHi, true);
    }

    void
    testStore()
    {
        testcase("store");

        TrustLineStore store;
        BEAST_EXPECT(store.seq() == 0);
        BEAST_EXPECT(store.info().lineCount == 0);

        auto const ab = makeLine(alice, bob, 100, 100);
        auto const bc = makeLine(bob, carol, 100, 100);
        store.rawInsert(ab);
        store.rawInsert(bc);
        BEAST_EXPECT(store.size() == 2);
        BEAST_EXPECT(store.info().lineCount == 2);

        BEAST_EXPECT(store.exists(keylet::line(bob, alice)));
        BEAST_EXPECT(store.read(keylet::line(bob, alice)) == ab);
        BEAST_EXPECT(!store.read(keylet::line(alice, carol)));

        BEAST_EXPECT(store.linesOf(alice).size() == 1);
        BEAST_EXPECT(store.linesOf(bob).size() == 2);
        BEAST_EXPECT(store.linesOf(jtx::Account("dan")).empty());

        auto const bobs = store.linesOf(bob);
        BEAST_EXPECT(bobs.size() == 2 && bobs[0] < bobs[1]);

        try
        {
            store.rawInsert(makeLine(alice, bob, 5, 5));
            fail("duplicate insert");
        }
        catch (std::logic_error const&)
        {
            pass();
        }

        try
        {
            store.rawReplace(makeLine(alice, carol, 5, 5));
            fail("replace of a missing line");
        }
        catch (std::logic_error const&)
        {
            pass();
        }

        store.advance();
        BEAST_EXPECT(store.seq() == 1);
    }

    void
    testSandbox()
    {
        testcase("sandbox");

        TrustLineStore store;
        store.rawInsert(makeLine(alice, bob, 100, 100));

        {
            Sandbox sb(store);
            BEAST_EXPECT(sb.seq() == store.seq() + 1);

            // A peeked line is a private copy.
            auto const line = sb.peek(keylet::line(alice, bob));
            BEAST_EXPECT(line);
            line->setBalance(10);
            BEAST_EXPECT(sb.read(keylet::line(alice, bob))->balance() == 0);
            BEAST_EXPECT(sb.size() == 0);

            sb.update(line);
            BEAST_EXPECT(sb.read(keylet::line(alice, bob))->balance() == 10);
            BEAST_EXPECT(store.read(keylet::line(alice, bob))->balance() == 0);

            sb.insert(makeLine(bob, carol, 50, 50));
            BEAST_EXPECT(sb.exists(keylet::line(carol, bob)));
            BEAST_EXPECT(!store.exists(keylet::line(carol, bob)));
            BEAST_EXPECT(sb.info().lineCount == 2);
            BEAST_EXPECT(sb.linesOf(bob).size() == 2);
            BEAST_EXPECT(store.linesOf(bob).size() == 1);

            try
            {
                sb.insert(makeLine(alice, bob, 1, 1));
                fail("duplicate insert");
            }
            catch (std::logic_error const&)
            {
                pass();
            }

            // Nothing reaches the store until the sandbox is applied.
            sb.discard();
            BEAST_EXPECT(sb.size() == 0);
            BEAST_EXPECT(!sb.exists(keylet::line(carol, bob)));
            BEAST_EXPECT(sb.read(keylet::line(alice, bob))->balance() == 0);
        }

        {
            Sandbox sb(store);
            auto const line = sb.peek(keylet::line(alice, bob));
            line->setBalance(-25);
            sb.update(line);
            sb.insert(makeLine(bob, carol, 50, 50));

            auto const modified = sb.modified();
            BEAST_EXPECT(modified.size() == 2);

            sb.apply(store);
            BEAST_EXPECT(
                store.read(keylet::line(alice, bob))->balance() == -25);
            BEAST_EXPECT(store.exists(keylet::line(bob, carol)));
            BEAST_EXPECT(store.info().lineCount == 2);
            BEAST_EXPECT(store.linesOf(carol).size() == 1);
        }
    }

    void
    testCreditedBalance()
    {
        testcase("creditedBalance");

        // alice is the low account.
        auto const line = makeLine(alice, bob, 1000, 500);

        auto result = creditedBalance(*line, alice, 600);
        BEAST_EXPECT(result && *result == 600);
        line->setBalance(600);

        result = creditedBalance(*line, bob, 1200);
        BEAST_EXPECT(!result && result.error() == tecPATH_DRY);

        result = creditedBalance(*line, bob, 1100);
        BEAST_EXPECT(result && *result == -500);

        result = creditedBalance(*line, alice, 401);
        BEAST_EXPECT(!result && result.error() == tecPATH_DRY);

        result = creditedBalance(*line, alice, 400);
        BEAST_EXPECT(result && *result == 1000);

        result = creditedBalance(*line, alice, 0);
        BEAST_EXPECT(!result && result.error() == temBAD_AMOUNT);

        result = creditedBalance(
            *line, alice, std::numeric_limits<std::int64_t>::max());
        BEAST_EXPECT(!result && result.error() == temOVERFLOW);

        BEAST_EXPECT(availableCredit(*line, alice) == 400);
        BEAST_EXPECT(availableCredit(*line, bob) == 1100);

        line->freeze();
        BEAST_EXPECT(line->frozen());
        BEAST_EXPECT(line->limitLo() == 0 && line->limitHi() == 0);
        BEAST_EXPECT(!line->allowRippling());
        BEAST_EXPECT(line->balance() == 600);
        result = creditedBalance(*line, bob, 1);
        BEAST_EXPECT(!result && result.error() == tecFROZEN);
        BEAST_EXPECT(availableCredit(*line, alice) == 0);
        BEAST_EXPECT(availableCredit(*line, bob) == 0);

        auto const wide = makeLine(
            alice,
            bob,
            std::numeric_limits<std::int64_t>::max(),
            std::numeric_limits<std::int64_t>::max());
        wide->setBalance(-10);
        BEAST_EXPECT(
            availableCredit(*wide, alice) ==
            std::numeric_limits<std::int64_t>::max());
    }

    void
    testViewHelpers()
    {
        testcase("view helpers");

        beast::Journal const j{beast::Journal::getNullSink()};
        TrustLineStore store;

        {
            Sandbox sb(store);
            BEAST_EXPECT(
                trustCreate(sb, pair(alice, bob), 7, 100, 50, true, j) ==
                tesSUCCESS);
            BEAST_EXPECT(
                trustCreate(sb, pair(bob, alice), 7, 100, 50, true, j) ==
                tecDUPLICATE);
            sb.apply(store);
            store.advance();
        }

        auto line = getLine(store, bob, alice);
        BEAST_EXPECT(line);
        BEAST_EXPECT((*line)->asset() == 7);
        BEAST_EXPECT((*line)->balance() == 0);
        BEAST_EXPECT((*line)->qualityIn() == QUALITY_ONE);
        BEAST_EXPECT((*line)->qualityOut() == QUALITY_ONE);
        BEAST_EXPECT((*line)->createdSeq() == 1);
        BEAST_EXPECT((*line)->ordinal() == 1);
        BEAST_EXPECT((*line)->previousTxnSeq() == 1);

        auto missing = getLine(store, alice, carol);
        BEAST_EXPECT(!missing && missing.error() == tecNO_LINE);
        missing = getLine(store, alice, alice);
        BEAST_EXPECT(!missing && missing.error() == temDST_IS_SRC);

        {
            Sandbox sb(store);
            BEAST_EXPECT(rippleCredit(sb, bob, alice, 40, j) == tesSUCCESS);
            BEAST_EXPECT(
                rippleCredit(sb, bob, alice, 20, j) == tecPATH_DRY);
            BEAST_EXPECT(
                rippleCredit(sb, bob, carol, 20, j) == tecNO_LINE);

            // alice owes bob 40, so bob's limit cannot drop below it.
            BEAST_EXPECT(
                setLineLimits(sb, alice, bob, 100, 39, j) ==
                tecLIMIT_EXPOSURE);
            BEAST_EXPECT(
                setLineLimits(sb, alice, bob, 1, 40, j) == tesSUCCESS);

            BEAST_EXPECT(
                settleDebt(sb, bob, alice, 1, j) == tecEXCEEDS_DEBT);
            BEAST_EXPECT(
                settleDebt(sb, alice, bob, 41, j) == tecEXCEEDS_DEBT);
            BEAST_EXPECT(settleDebt(sb, alice, bob, 15, j) == tesSUCCESS);

            BEAST_EXPECT(
                setLineQuality(sb, alice, bob, 990000, 1000000, j) ==
                tesSUCCESS);
            BEAST_EXPECT(
                setLineRippling(sb, bob, alice, false, j) == tesSUCCESS);

            auto const after = sb.read(keylet::line(alice, bob));
            BEAST_EXPECT(after->balance() == -25);
            BEAST_EXPECT(after->balanceFor(bob) == 25);
            BEAST_EXPECT(after->limitLo() == 1);
            BEAST_EXPECT(after->limitHi() == 40);
            BEAST_EXPECT(after->qualityIn() == 990000);
            BEAST_EXPECT(!after->allowRippling());
            BEAST_EXPECT(after->previousTxnSeq() == 2);
            BEAST_EXPECT(after->createdSeq() == 1);

            BEAST_EXPECT(freezeLine(sb, alice, bob, j) == tesSUCCESS);
            BEAST_EXPECT(
                setLineLimits(sb, alice, bob, 10, 10, j) == tecFROZEN);
            BEAST_EXPECT(
                setLineRippling(sb, alice, bob, true, j) == tecFROZEN);
            BEAST_EXPECT(
                setLineQuality(sb, alice, bob, 1, 1, j) == tecFROZEN);
            BEAST_EXPECT(settleDebt(sb, alice, bob, 1, j) == tecFROZEN);
            BEAST_EXPECT(rippleCredit(sb, alice, bob, 1, j) == tecFROZEN);
        }

        // The sandbox was never applied.
        line = getLine(store, alice, bob);
        BEAST_EXPECT(line && (*line)->balance() == 0);
        BEAST_EXPECT(line && !(*line)->frozen());
    }

    void
    run() override
    {
        testStore();
        testSandbox();
        testCreditedBalance();
        testViewHelpers();
    }
};

BEAST_DEFINE_TESTSUITE(trustnet, ledger, TrustLineStore);

}  // namespace test
}  // namespace trustnet
