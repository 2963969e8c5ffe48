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


#include <trustnet/basics/mulDiv.h>
#include <trustnet/basics/safe_math.h>

#include <boost/beast/_experimental/unit_test/suite.hpp>

#include <cstdint>
#include <limits>

namespace trustnet {
namespace test {

struct mulDiv_test : boost::beast::unit_test::suite
{
    void
    testMulDiv()
    {
        testcase("mulDiv");

        auto const max = std::numeric_limits<std::uint64_t>::max();
        std::uint64_t const max32 = std::numeric_limits<std::uint32_t>::max();

        auto result = mulDiv(85, 20, 5);
        BEAST_EXPECT(result && *result == 340);
        result = mulDiv(20, 85, 5);
        BEAST_EXPECT(result && *result == 340);

        result = mulDiv(0, max - 1, max - 3);
        BEAST_EXPECT(result && *result == 0);

        result = mulDiv(max, 2, max / 2);
        BEAST_EXPECT(result && *result == 4);

        result = mulDiv(max32 + 1, max32 + 1, 5);
        BEAST_EXPECT(result && *result == 3689348814741910323);

        result = mulDiv(max32 + 1, max32 + 1, (max32 + 1) * 2);
        BEAST_EXPECT(result && *result == 2147483648);

        // The quotient is truncated.
        result = mulDiv(1000, 999000, 1000000);
        BEAST_EXPECT(result && *result == 999);
        result = mulDiv(999, 999000, 1000000);
        BEAST_EXPECT(result && *result == 998);
        result = mulDiv(1, 999000, 1000000);
        BEAST_EXPECT(result && *result == 0);

        // Overflow
        result = mulDiv(max - 1, max - 2, 5);
        BEAST_EXPECT(!result);

        // Division by zero
        result = mulDiv(1, 1, 0);
        BEAST_EXPECT(!result);
    }

    void
    testChecked()
    {
        testcase("checked arithmetic");

        auto const max = std::numeric_limits<std::int64_t>::max();
        auto const min = std::numeric_limits<std::int64_t>::min();

        BEAST_EXPECT(addChecked<std::int64_t>(40, 2) == 42);
        BEAST_EXPECT(addChecked<std::int64_t>(-40, -2) == -42);
        BEAST_EXPECT(addChecked<std::int64_t>(max, 0) == max);
        BEAST_EXPECT(addChecked<std::int64_t>(max - 1, 1) == max);
        BEAST_EXPECT(!addChecked<std::int64_t>(max, 1));
        BEAST_EXPECT(!addChecked<std::int64_t>(min, -1));
        BEAST_EXPECT(addChecked<std::int64_t>(min, max) == -1);

        BEAST_EXPECT(subChecked<std::int64_t>(40, 42) == -2);
        BEAST_EXPECT(subChecked<std::int64_t>(min + 1, 1) == min);
        BEAST_EXPECT(!subChecked<std::int64_t>(min, 1));
        BEAST_EXPECT(!subChecked<std::int64_t>(max, -1));
        BEAST_EXPECT(!subChecked<std::int64_t>(0, min));
        BEAST_EXPECT(subChecked<std::int64_t>(-1, min) == max);
    }

    void
    run() override
    {
        testMulDiv();
        testChecked();
    }
};

BEAST_DEFINE_TESTSUITE(trustnet, basics, mulDiv);

}  // namespace test
}  // namespace trustnet
