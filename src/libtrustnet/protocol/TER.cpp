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

#include <boost/range/adaptor/transformed.hpp>
#include <boost/range/iterator_range_core.hpp>

#include <type_traits>

namespace trustnet {

std::unordered_map<
    TERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults()
{
    // clang-format off

    // Macros are associated with an enum value so that unused codes are
    // easy to spot with a grep.
#define MAKE_ERROR(code, desc) { code, { #code, desc } }

    static
    std::unordered_map<
        TERUnderlyingType,
        std::pair<char const* const, char const* const>> const results
    {
        MAKE_ERROR(tecPATH_DRY,               "Not enough credit on a line to carry the amount."),
        MAKE_ERROR(tecNO_LINE,                "No trust line exists between the two accounts."),
        MAKE_ERROR(tecFROZEN,                 "The trust line is frozen."),
        MAKE_ERROR(tecNO_PERMISSION,          "The account is not allowed to perform this operation."),
        MAKE_ERROR(tecDUPLICATE,              "A trust line already exists for this pair of accounts."),
        MAKE_ERROR(tecNO_RIPPLE,              "Rippling is disabled on a line of the path."),
        MAKE_ERROR(tecLIMIT_EXPOSURE,         "The new limit is below the debt it must cover."),
        MAKE_ERROR(tecEXCEEDS_DEBT,           "Settlement amount exceeds the outstanding debt."),

        MAKE_ERROR(tefFAILURE,                "Failed to apply."),
        MAKE_ERROR(tefINTERNAL,               "Internal error."),
        MAKE_ERROR(tefEXCEPTION,              "Unexpected exception while applying."),
        MAKE_ERROR(tefBAD_QUORUM,             "Both parties of the line must authorize this change."),

        MAKE_ERROR(temMALFORMED,              "Malformed transaction."),
        MAKE_ERROR(temBAD_AMOUNT,             "Amount must be positive."),
        MAKE_ERROR(temBAD_LIMIT,              "Credit limit must be positive."),
        MAKE_ERROR(temBAD_QUALITY,            "Quality must lie in (0, 1000000]."),
        MAKE_ERROR(temDST_IS_SRC,             "Source and destination are the same account."),
        MAKE_ERROR(temBAD_PATH,               "Malformed: Bad path."),
        MAKE_ERROR(temBAD_PATH_COUNT,         "Malformed: Too many or too few intermediaries."),
        MAKE_ERROR(temBAD_PATH_LOOP,          "Malformed: Path repeats an account."),
        MAKE_ERROR(temINVALID_ACCOUNT_ID,     "Malformed: A field contains an invalid account ID."),
        MAKE_ERROR(temBAD_SIGNER,             "Malformed: A signer is not a party of the line."),
        MAKE_ERROR(temBAD_TRANSFER,           "Malformed: Settlement transfer does not match."),
        MAKE_ERROR(temOVERFLOW,               "Amount arithmetic overflowed."),
        MAKE_ERROR(temUNKNOWN,                "The transaction type is unknown."),

        MAKE_ERROR(tesSUCCESS,                "The transaction was applied."),
    };
    // clang-format on

#undef MAKE_ERROR

    return results;
}

bool
transResultInfo(TER code, std::string& token, std::string& text)
{
    auto& results = transResults();

    auto const r = results.find(TERtoInt(code));

    if (r == results.end())
        return false;

    token = r->second.first;
    text = r->second.second;
    return true;
}

std::string
transToken(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? token : "-";
}

std::string
transHuman(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? text : "-";
}

std::optional<TER>
transCode(std::string const& token)
{
    static auto const results = [] {
        auto& byTer = transResults();
        auto range = boost::make_iterator_range(byTer.begin(), byTer.end());
        auto tRange = boost::adaptors::transform(range, [](auto const& r) {
            return std::make_pair(r.second.first, r.first);
        });
        std::unordered_map<std::string, TERUnderlyingType> const byToken(
            tRange.begin(), tRange.end());
        return byToken;
    }();

    auto const r = results.find(token);

    if (r == results.end())
        return std::nullopt;

    return TER::fromInt(r->second);
}

ErrorCategory
categorize(TER code)
{
    if (isTesSuccess(code))
        return ErrorCategory::None;

    if (isTemMalformed(code))
        return ErrorCategory::Validation;

    switch (TERtoInt(code))
    {
        case tecPATH_DRY:
        case tecLIMIT_EXPOSURE:
        case tecFROZEN:
        case tecEXCEEDS_DEBT:
            return ErrorCategory::InsufficientCredit;
        case tecNO_PERMISSION:
        case tefBAD_QUORUM:
            return ErrorCategory::Authorization;
        case tecNO_LINE:
            return ErrorCategory::NotFound;
        case tecDUPLICATE:
            return ErrorCategory::AlreadyExists;
        case tecNO_RIPPLE:
            return ErrorCategory::RipplingDisabled;
        default:
            break;
    }
    return ErrorCategory::Internal;
}

std::string
to_string(ErrorCategory category)
{
    switch (category)
    {
        case ErrorCategory::None:
            return "none";
        case ErrorCategory::Validation:
            return "validation";
        case ErrorCategory::InsufficientCredit:
            return "insufficient_credit";
        case ErrorCategory::Authorization:
            return "authorization";
        case ErrorCategory::NotFound:
            return "not_found";
        case ErrorCategory::AlreadyExists:
            return "already_exists";
        case ErrorCategory::RipplingDisabled:
            return "rippling_disabled";
        case ErrorCategory::Internal:
            break;
    }
    return "internal";
}

}  // namespace trustnet
