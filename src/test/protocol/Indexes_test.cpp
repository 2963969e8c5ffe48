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


#include <trustnet/protocol/AccountID.h>
#include <trustnet/protocol/Indexes.h>
#include <trustnet/protocol/digest.h>

#include <boost/beast/_experimental/unit_test/suite.hpp>

#include <set>
#include <string>

namespace trustnet {

class Indexes_test : public boost::beast::unit_test::suite
{
    static AccountID
    account(char last)
    {
        AccountID id;
        BEAST_EXPECT(id.parseHex(std::string(63, '0') + last));
        return id;
    }

    void
    testDigest()
    {
        testcase("sha512Half");

        // The first half of SHA-512 of the empty string.
        BEAST_EXPECT(
            to_string(sha512Half()) ==
            "CF83E1357EEFB8BDF1542850D66D8007"
            "D620E4050B5715DC83F4A921D36CE9CE");

        auto const a = account('1');
        auto const b = account('2');
        BEAST_EXPECT(sha512Half(a, b) == sha512Half(a, b));
        BEAST_EXPECT(sha512Half(a, b) != sha512Half(b, a));
        BEAST_EXPECT(
            sha512Half(std::uint16_t{1}) != sha512Half(std::uint32_t{1}));
    }

    void
    testAccountID()
    {
        testcase("AccountID");

        auto const hex = std::string(62, '0') + "aB";
        auto const id = parseBase16(hex);
        BEAST_EXPECT(id && toBase16(*id) == std::string(62, '0') + "AB");
        BEAST_EXPECT(parseAccount(hex).has_value());

        // The zero identity is reserved.
        BEAST_EXPECT(!parseBase16(std::string(64, '0')));
        BEAST_EXPECT(!isValidAccount(noAccount()));

        auto const bad = parseAccount("not an account");
        BEAST_EXPECT(!bad && bad.error() == temINVALID_ACCOUNT_ID);
        BEAST_EXPECT(!parseBase16(std::string(63, '1')));
        BEAST_EXPECT(!parseBase16(std::string(65, '1')));
    }

    void
    testCanonicalize()
    {
        testcase("canonicalize");

        auto const a = account('1');
        auto const b = account('2');

        auto const ab = canonicalize(a, b);
        auto const ba = canonicalize(b, a);
        BEAST_EXPECT(ab && ba);
        BEAST_EXPECT(*ab == *ba);
        BEAST_EXPECT(ab->lo == a);
        BEAST_EXPECT(ab->hi == b);
        BEAST_EXPECT(ab->peer(a) == b);
        BEAST_EXPECT(ab->peer(b) == a);
        BEAST_EXPECT(ab->contains(a) && ab->contains(b));
        BEAST_EXPECT(!ab->contains(account('3')));

        auto const self = canonicalize(a, a);
        BEAST_EXPECT(!self && self.error() == temDST_IS_SRC);

        auto const zero = canonicalize(a, noAccount());
        BEAST_EXPECT(!zero && zero.error() == temINVALID_ACCOUNT_ID);
    }

    void
    testLineKeylet()
    {
        testcase("keylet::line");

        auto const a = account('1');
        auto const b = account('2');
        auto const c = account('3');

        auto const ab = keylet::line(a, b);
        BEAST_EXPECT(ab.type == ltTRUST_LINE);
        BEAST_EXPECT(ab.key == keylet::line(b, a).key);

        auto const pair = canonicalize(b, a);
        BEAST_EXPECT(pair && keylet::line(*pair).key == ab.key);

        // Distinct pairs have distinct keys.
        std::set<uint256> keys{
            ab.key, keylet::line(a, c).key, keylet::line(b, c).key};
        BEAST_EXPECT(keys.size() == 3);
    }

    void
    run() override
    {
        testDigest();
        testAccountID();
        testCanonicalize();
        testLineKeylet();
    }
};

BEAST_DEFINE_TESTSUITE(trustnet, protocol, Indexes);

}  // namespace trustnet
