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


#include <trustnet/protocol/TER.h>

#include <boost/beast/_experimental/unit_test/suite.hpp>

#include <string>
#include <type_traits>

namespace trustnet {

struct TER_test : public boost::beast::unit_test::suite
{
    void
    testTransResultInfo()
    {
        testcase("transResultInfo");

        for (auto const& [code, info] : transResults())
        {
            auto const ter = TER::fromInt(code);
            BEAST_EXPECT(transToken(ter) == info.first);
            BEAST_EXPECT(transHuman(ter) == info.second);

            auto const back = transCode(info.first);
            BEAST_EXPECT(back && *back == ter);
        }

        BEAST_EXPECT(transToken(tecNO_LINE) == "tecNO_LINE");
        BEAST_EXPECT(transToken(TER::fromInt(42)) == "-");
        BEAST_EXPECT(transHuman(TER::fromInt(42)) == "-");
        BEAST_EXPECT(!transCode("tecNOT_A_CODE"));
    }

    void
    testRanges()
    {
        testcase("ranges");

        BEAST_EXPECT(isTemMalformed(temMALFORMED));
        BEAST_EXPECT(isTemMalformed(temUNKNOWN));
        BEAST_EXPECT(!isTemMalformed(tefFAILURE));
        BEAST_EXPECT(isTefFailure(tefBAD_QUORUM));
        BEAST_EXPECT(!isTefFailure(tesSUCCESS));
        BEAST_EXPECT(isTesSuccess(tesSUCCESS));
        BEAST_EXPECT(!isTesSuccess(tecPATH_DRY));
        BEAST_EXPECT(isTecClaim(tecPATH_DRY));
        BEAST_EXPECT(isTecClaim(tecEXCEEDS_DEBT));
        BEAST_EXPECT(!isTecClaim(temBAD_AMOUNT));

        // A NotTEC can hold every class except tec.
        static_assert(std::is_convertible_v<TEMcodes, NotTEC>);
        static_assert(std::is_convertible_v<TEFcodes, NotTEC>);
        static_assert(std::is_convertible_v<TEScodes, NotTEC>);
        static_assert(!std::is_convertible_v<TECcodes, NotTEC>);
        static_assert(std::is_convertible_v<NotTEC, TER>);
        static_assert(std::is_convertible_v<TECcodes, TER>);
        static_assert(!std::is_convertible_v<TER, NotTEC>);
        static_assert(!std::is_convertible_v<int, TER>);

        NotTEC const notTec = temBAD_PATH_LOOP;
        TER const ter = notTec;
        BEAST_EXPECT(ter == temBAD_PATH_LOOP);
        BEAST_EXPECT(TERtoInt(ter) == TERtoInt(temBAD_PATH_LOOP));
        BEAST_EXPECT(!!ter);
        BEAST_EXPECT(!TER{tesSUCCESS});
    }

    void
    testCategories()
    {
        testcase("categories");

        auto check = [this](TER ter, ErrorCategory expected, char const* s) {
            BEAST_EXPECTS(categorize(ter) == expected, transToken(ter));
            BEAST_EXPECT(to_string(categorize(ter)) == s);
        };

        check(tesSUCCESS, ErrorCategory::None, "none");
        check(temBAD_AMOUNT, ErrorCategory::Validation, "validation");
        check(temDST_IS_SRC, ErrorCategory::Validation, "validation");
        check(temOVERFLOW, ErrorCategory::Validation, "validation");
        check(
            temINVALID_ACCOUNT_ID, ErrorCategory::Validation, "validation");
        check(
            tecPATH_DRY,
            ErrorCategory::InsufficientCredit,
            "insufficient_credit");
        check(
            tecLIMIT_EXPOSURE,
            ErrorCategory::InsufficientCredit,
            "insufficient_credit");
        check(
            tecFROZEN, ErrorCategory::InsufficientCredit, "insufficient_credit");
        check(
            tecEXCEEDS_DEBT,
            ErrorCategory::InsufficientCredit,
            "insufficient_credit");
        check(tecNO_PERMISSION, ErrorCategory::Authorization, "authorization");
        check(tefBAD_QUORUM, ErrorCategory::Authorization, "authorization");
        check(tecNO_LINE, ErrorCategory::NotFound, "not_found");
        check(tecDUPLICATE, ErrorCategory::AlreadyExists, "already_exists");
        check(
            tecNO_RIPPLE, ErrorCategory::RipplingDisabled, "rippling_disabled");
        check(tefEXCEPTION, ErrorCategory::Internal, "internal");
        check(tefINTERNAL, ErrorCategory::Internal, "internal");
    }

    void
    run() override
    {
        testTransResultInfo();
        testRanges();
        testCategories();
    }
};

BEAST_DEFINE_TESTSUITE(trustnet, protocol, TER);

}  // namespace trustnet
