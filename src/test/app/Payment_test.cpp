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

#include <limits>

namespace trustnet {
namespace test {

class Payment_test : public boost::beast::unit_test::suite
{
    void
    testRoundTrip()
    {
        testcase("Round trip");

        using namespace jtx;
        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};

        env(trust(alice, bob, 100, 100));

        auto const result = env(pay(alice, bob, 40));
        BEAST_EXPECT(result.affected.size() == 1);
        BEAST_EXPECT(env.le(alice, bob)->balance() == 40);
        BEAST_EXPECT(env.balance(alice, bob) == 40);
        BEAST_EXPECT(env.balance(bob, alice) == -40);

        env(pay(bob, alice, 40));
        BEAST_EXPECT(env.le(alice, bob)->balance() == 0);
        BEAST_EXPECT(env.seq() == 3);
    }

    void
    testLimits()
    {
        testcase("Limits");

        using namespace jtx;
        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};

        env(trust(alice, bob, 1000, 500));

        env(pay(alice, bob, 600));
        BEAST_EXPECT(env.le(alice, bob)->balance() == 600);

        // Would leave bob owed 600, above the 500 alice extends him.
        env(pay(bob, alice, 1200), ter(tecPATH_DRY));
        BEAST_EXPECT(env.le(alice, bob)->balance() == 600);
        BEAST_EXPECT(env.seq() == 2);

        // Exactly to either bound.
        env(pay(alice, bob, 400));
        BEAST_EXPECT(env.le(alice, bob)->balance() == 1000);
        env(pay(alice, bob, 1), ter(tecPATH_DRY));
        env(pay(bob, alice, 1500));
        BEAST_EXPECT(env.le(alice, bob)->balance() == -500);
        env(pay(bob, alice, 1), ter(tecPATH_DRY));

        BEAST_EXPECT(env.seq() == 4);
    }

    void
    testMalformed()
    {
        testcase("Malformed");

        using namespace jtx;
        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};
        Account const carol{"carol"};

        env(trust(alice, bob, 100, 100));

        env(pay(alice, bob, 0), ter(temBAD_AMOUNT));
        env(pay(alice, bob, -5), ter(temBAD_AMOUNT));
        env(pay(alice, alice, 5), ter(temDST_IS_SRC));
        env(JTx(alice, PaymentFields{}), ter(temINVALID_ACCOUNT_ID));

        // No line between alice and carol.
        env(pay(alice, carol, 5), ter(tecNO_LINE));
        env(pay(carol, alice, 5), ter(tecNO_LINE));

        BEAST_EXPECT(env.le(alice, bob)->balance() == 0);
        BEAST_EXPECT(env.seq() == 1);
    }

    void
    testOverflow()
    {
        testcase("Overflow");

        using namespace jtx;
        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};

        auto const max = std::numeric_limits<std::int64_t>::max();
        env(trust(alice, bob, max, max));

        env(pay(alice, bob, max));
        BEAST_EXPECT(env.le(alice, bob)->balance() == max);
        env(pay(alice, bob, 1), ter(temOVERFLOW));
        BEAST_EXPECT(env.le(alice, bob)->balance() == max);

        env(pay(bob, alice, max));
        BEAST_EXPECT(env.le(alice, bob)->balance() == 0);
    }

public:
    void
    run() override
    {
        testRoundTrip();
        testLimits();
        testMalformed();
        testOverflow();
    }
};

BEAST_DEFINE_TESTSUITE(trustnet, app, Payment);

}  // namespace test
}  // namespace trustnet
