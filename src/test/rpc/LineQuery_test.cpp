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
#include <trustnet/protocol/jss.h>
#include <trustnet/rpc/ErrorCodes.h>

namespace trustnet {
namespace test {

class LineQuery_test : public boost::beast::unit_test::suite
{
    static Json::Value
    request(jtx::Account const& account, jtx::Account const& peer)
    {
        Json::Value params(Json::objectValue);
        params[jss::account] = toBase16(account.id());
        params[jss::peer] = toBase16(peer.id());
        return params;
    }

    void
    testDispatch()
    {
        testcase("Dispatch");

        using namespace jtx;
        Env env(*this);

        auto const unknown = env.rpc("submit", Json::objectValue);
        BEAST_EXPECT(unknown[jss::error] == "unknownCmd");
        BEAST_EXPECT(unknown[jss::error_code].asInt() == rpcUNKNOWN_COMMAND);

        auto const notObject = env.rpc("balance", Json::arrayValue);
        BEAST_EXPECT(notObject[jss::error] == "invalidParams");
    }

    void
    testBalance()
    {
        testcase("Balance");

        using namespace jtx;
        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};
        Account const carol{"carol"};

        env(trust(alice, bob, 1000, 500, true, 9));
        env(pay(alice, bob, 600));
        auto const seq = env.seq();

        auto const jv = env.rpc("balance", request(alice, bob));
        BEAST_EXPECT(jv[jss::account] == toBase16(alice.id()));
        BEAST_EXPECT(jv[jss::peer] == toBase16(bob.id()));
        BEAST_EXPECT(jv[jss::asset].asUInt() == 9);
        BEAST_EXPECT(jv[jss::balance].asInt64() == 600);
        BEAST_EXPECT(jv[jss::limit].asInt64() == 1000);
        BEAST_EXPECT(jv[jss::limit_peer].asInt64() == 500);

        auto const other = env.rpc("balance", request(bob, alice));
        BEAST_EXPECT(other[jss::balance].asInt64() == -600);
        BEAST_EXPECT(other[jss::limit].asInt64() == 500);

        // Queries never write.
        BEAST_EXPECT(env.seq() == seq);
        BEAST_EXPECT(env.le(alice, bob)->balance() == 600);

        auto const missing = env.rpc("balance", request(alice, carol));
        BEAST_EXPECT(missing[jss::error] == "lineNotFound");
        BEAST_EXPECT(
            missing[jss::error_code].asInt() == rpcLINE_NOT_FOUND);

        auto const self = env.rpc("balance", request(alice, alice));
        BEAST_EXPECT(self[jss::error] == "invalidParams");

        Json::Value params(Json::objectValue);
        params[jss::account] = toBase16(alice.id());
        auto const noPeer = env.rpc("balance", params);
        BEAST_EXPECT(noPeer[jss::error_message] == "Missing field 'peer'.");

        params[jss::peer] = std::string(64, '0');
        auto const zero = env.rpc("balance", params);
        BEAST_EXPECT(zero[jss::error] == "actMalformed");
    }

    void
    testCredit()
    {
        testcase("Credit");

        using namespace jtx;
        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};

        env(trust(alice, bob, 1000, 500));
        env(pay(alice, bob, 600));

        auto available = [&](Account const& a, Account const& b) {
            return env.rpc("credit", request(a, b))[jss::available].asInt64();
        };

        // alice may still send 400; bob may send back 600 plus 500.
        BEAST_EXPECT(available(alice, bob) == 400);
        BEAST_EXPECT(available(bob, alice) == 1100);

        env(pay(bob, alice, 1100));
        BEAST_EXPECT(available(bob, alice) == 0);
        BEAST_EXPECT(available(alice, bob) == 1500);
        env(pay(bob, alice, 1), ter(tecPATH_DRY));

        env(freeze(env.master, alice, bob));
        BEAST_EXPECT(available(alice, bob) == 0);
        BEAST_EXPECT(available(bob, alice) == 0);

        Account const carol{"carol"};
        auto const missing = env.rpc("credit", request(alice, carol));
        BEAST_EXPECT(missing[jss::error] == "lineNotFound");
    }

    void
    testTrustLine()
    {
        testcase("Trust line");

        using namespace jtx;
        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};

        env(trust(bob, alice, 300, 200, false, 4));
        env(quality(alice, bob, 990'000, QUALITY_ONE));
        env(pay(bob, alice, 50));

        Json::Value params(Json::objectValue);
        params[jss::first] = toBase16(bob.id());
        params[jss::second] = toBase16(alice.id());

        auto const jv = env.rpc("trust_line", params);
        BEAST_EXPECT(jv[jss::ledger_seq].asUInt() == 3);

        auto const& node = jv[jss::node];
        BEAST_EXPECT(
            node[jss::index] == to_string(keylet::line(alice, bob).key));
        BEAST_EXPECT(node[jss::account_lo] == toBase16(alice.id()));
        BEAST_EXPECT(node[jss::account_hi] == toBase16(bob.id()));
        BEAST_EXPECT(node[jss::asset].asUInt() == 4);
        BEAST_EXPECT(node[jss::balance].asInt64() == -50);
        BEAST_EXPECT(node[jss::limit_lo].asInt64() == 300);
        BEAST_EXPECT(node[jss::limit_hi].asInt64() == 200);
        BEAST_EXPECT(node[jss::quality_in].asUInt() == 990'000);
        BEAST_EXPECT(node[jss::quality_out].asUInt() == QUALITY_ONE);
        BEAST_EXPECT(!node[jss::allow_rippling].asBool());
        BEAST_EXPECT(!node[jss::frozen].asBool());
        BEAST_EXPECT(node[jss::created_seq].asUInt() == 1);
        BEAST_EXPECT(node[jss::ordinal].asUInt64() == 1);
        BEAST_EXPECT(node[jss::previous_txn_seq].asUInt() == 3);

        // The same line from either order.
        Json::Value swapped(Json::objectValue);
        swapped[jss::first] = toBase16(alice.id());
        swapped[jss::second] = toBase16(bob.id());
        BEAST_EXPECT(env.rpc("trust_line", swapped)[jss::node] == node);

        Json::Value missing(Json::objectValue);
        missing[jss::first] = toBase16(alice.id());
        auto const err = env.rpc("trust_line", missing);
        BEAST_EXPECT(err[jss::error_message] == "Missing field 'second'.");
    }

public:
    void
    run() override
    {
        testDispatch();
        testBalance();
        testCredit();
        testTrustLine();
    }
};

BEAST_DEFINE_TESTSUITE(trustnet, rpc, LineQuery);

}  // namespace test
}  // namespace trustnet
