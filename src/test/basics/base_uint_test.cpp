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


#include <trustnet/basics/base_uint.h>

#include <boost/beast/_experimental/unit_test/suite.hpp>

#include <set>
#include <string>
#include <unordered_set>

namespace trustnet {
namespace test {

struct base_uint_test : boost::beast::unit_test::suite
{
    using test96 = base_uint<96>;

    void
    testParse()
    {
        testcase("parseHex");

        test96 u;
        BEAST_EXPECT(u.isZero());
        BEAST_EXPECT(u.parseHex("0102030405060708090A0B0C"));
        BEAST_EXPECT(to_string(u) == "0102030405060708090A0B0C");
        BEAST_EXPECT(u.isNonZero());
        BEAST_EXPECT(u.begin()[0] == 0x01);
        BEAST_EXPECT(u.begin()[11] == 0x0c);

        // Lower case is accepted and printed back in upper case.
        test96 v;
        BEAST_EXPECT(v.parseHex("0102030405060708090a0b0c"));
        BEAST_EXPECT(u == v);

        // Wrong length or a bad character leaves the value unchanged.
        BEAST_EXPECT(!v.parseHex("0102"));
        BEAST_EXPECT(!v.parseHex("0102030405060708090A0B0CFF"));
        BEAST_EXPECT(!v.parseHex("0102030405060708090A0B0G"));
        BEAST_EXPECT(u == v);

        test96 z;
        BEAST_EXPECT(z.parseHex("000000000000000000000000"));
        BEAST_EXPECT(!z);
    }

    void
    testOrdering()
    {
        testcase("ordering");

        test96 a;
        test96 b;
        test96 c;
        BEAST_EXPECT(a.parseHex("000000000000000000000001"));
        BEAST_EXPECT(b.parseHex("000000000000000000000100"));
        BEAST_EXPECT(c.parseHex("010000000000000000000000"));

        // Ordering is the byte-wise ordering of the big-endian value.
        BEAST_EXPECT(a < b);
        BEAST_EXPECT(b < c);
        BEAST_EXPECT(a < c);
        BEAST_EXPECT(c > a);
        BEAST_EXPECT(a <= a);
        BEAST_EXPECT(a >= a);
        BEAST_EXPECT(a != b);
        BEAST_EXPECT(compare(a, a) == 0);
        BEAST_EXPECT(compare(a, c) < 0);

        std::set<test96> ordered{c, a, b};
        BEAST_EXPECT(*ordered.begin() == a);
        BEAST_EXPECT(*ordered.rbegin() == c);

        std::unordered_set<test96> hashed{a, b, c, a};
        BEAST_EXPECT(hashed.size() == 3);
    }

    void
    run() override
    {
        static_assert(test96::bytes == 12);
        static_assert(uint256::size() == 32);

        testParse();
        testOrdering();
    }
};

BEAST_DEFINE_TESTSUITE(trustnet, basics, base_uint);

}  // namespace test
}  // namespace trustnet
