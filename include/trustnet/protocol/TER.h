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

#ifndef TRUSTNET_PROTOCOL_TER_H_INCLUDED
#define TRUSTNET_PROTOCOL_TER_H_INCLUDED

#include <trustnet/basics/safe_cast.h>

#include <json/json.h>

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace trustnet {

// "Transaction Engine Result"
// or Transaction ERror.
//
using TERUnderlyingType = int;

//------------------------------------------------------------------------------

enum TEMcodes : TERUnderlyingType {
    // -299 .. -200: M Malformed
    // Causes:
    // - The request can never succeed, whatever the ledger holds.
    // Implications:
    // - Not applied
    // - Ledger untouched
    temMALFORMED = -299,

    temBAD_AMOUNT,
    temBAD_LIMIT,
    temBAD_QUALITY,
    temDST_IS_SRC,
    temBAD_PATH,
    temBAD_PATH_COUNT,
    temBAD_PATH_LOOP,
    temINVALID_ACCOUNT_ID,
    temBAD_SIGNER,
    temBAD_TRANSFER,
    temOVERFLOW,
    temUNKNOWN,
};

//------------------------------------------------------------------------------

enum TEFcodes : TERUnderlyingType {
    // -199 .. -100: F
    //    Failure (the engine itself could not process the request)
    //
    // Causes:
    // - Missing authorization quorum.
    // - Broken internal state or an exception thrown while applying.
    //
    // Implications:
    // - Not applied
    // - Ledger untouched
    tefFAILURE = -199,
    tefINTERNAL,
    tefEXCEPTION,
    tefBAD_QUORUM,
};

//------------------------------------------------------------------------------

enum TEScodes : TERUnderlyingType {
    // 0: S Success (success)
    // Causes:
    // - Success.
    // Implications:
    // - Applied
    // - Forwarded
    tesSUCCESS = 0
};

//------------------------------------------------------------------------------

enum TECcodes : TERUnderlyingType {
    // 100 .. 255 C
    //   Claim: the request was well formed but the current ledger state
    //   does not allow it.
    //
    // Implications:
    // - Not applied
    // - Ledger untouched; the sandbox is discarded.
    //
    // Keep these codes stable. Only append new ones.
    tecCLAIM = 100,
    tecPATH_DRY = 128,
    tecNO_LINE = 135,
    tecFROZEN = 137,
    tecNO_PERMISSION = 139,
    tecDUPLICATE = 149,
    tecNO_RIPPLE = 190,
    tecLIMIT_EXPOSURE = 191,
    tecEXCEEDS_DEBT = 192,
};

//------------------------------------------------------------------------------

// For generic purposes, a free function that returns the value of a TE*codes.
constexpr TERUnderlyingType
TERtoInt(TEMcodes v)
{
    return safe_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TEFcodes v)
{
    return safe_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TEScodes v)
{
    return safe_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TECcodes v)
{
    return safe_cast<TERUnderlyingType>(v);
}

//------------------------------------------------------------------------------
// Template class that is specific to selected ranges of error codes.  The
// Trait tells std::enable_if which ranges are allowed.
template <template <typename> class Trait>
class TERSubset
{
    TERUnderlyingType code_;

public:
    // Constructors
    constexpr TERSubset() : code_(tesSUCCESS)
    {
    }
    constexpr TERSubset(TERSubset const& rhs) = default;
    constexpr TERSubset(TERSubset&& rhs) = default;

private:
    constexpr explicit TERSubset(int rhs) : code_(rhs)
    {
    }

public:
    static constexpr TERSubset
    fromInt(int from)
    {
        return TERSubset(from);
    }

    // Trait tells enable_if which types are allowed for construction.
    template <
        typename T,
        typename = std::enable_if_t<
            Trait<std::remove_cv_t<std::remove_reference_t<T>>>::value>>
    constexpr TERSubset(T rhs) : code_(TERtoInt(rhs))
    {
    }

    // Assignment
    constexpr TERSubset&
    operator=(TERSubset const& rhs) = default;
    constexpr TERSubset&
    operator=(TERSubset&& rhs) = default;

    // Trait tells enable_if which types are allowed for assignment.
    template <typename T>
    constexpr auto
    operator=(T rhs) -> std::enable_if_t<Trait<T>::value, TERSubset&>
    {
        code_ = TERtoInt(rhs);
        return *this;
    }

    // Conversion to bool.
    explicit operator bool() const
    {
        return code_ != tesSUCCESS;
    }

    // Conversion to Json::Value allows assignment to Json::Objects
    // without casting.
    operator Json::Value() const
    {
        return Json::Value{code_};
    }

    // Streaming operator.
    friend std::ostream&
    operator<<(std::ostream& os, TERSubset const& rhs)
    {
        return os << rhs.code_;
    }

    // Only a named conversion to the underlying value is provided, so
    // that a TER never silently becomes an int.
    friend constexpr TERUnderlyingType
    TERtoInt(TERSubset v)
    {
        return v.code_;
    }
};

// Comparison operators.
// Only enabled if both arguments return int if TERtoInt is called with them.
template <typename L, typename R>
constexpr auto
operator==(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) == TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator!=(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) != TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator<(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) < TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator>=(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) >= TERtoInt(rhs);
}

//------------------------------------------------------------------------------

// Use traits to build a TERSubset that can convert from any of the TE*codes
// enums *except* TECcodes: NotTEC

// NOTE: NotTEC is the result of preflight. Preflight only sees the request,
// never the ledger, so it has no business returning a claim code.
template <typename FROM>
class CanCvtToNotTEC : public std::false_type
{
};
template <>
class CanCvtToNotTEC<TEMcodes> : public std::true_type
{
};
template <>
class CanCvtToNotTEC<TEFcodes> : public std::true_type
{
};
template <>
class CanCvtToNotTEC<TEScodes> : public std::true_type
{
};

using NotTEC = TERSubset<CanCvtToNotTEC>;

//------------------------------------------------------------------------------

// Use traits to build a TERSubset that can convert from any of the TE*codes
// enums as well as from NotTEC.
template <typename FROM>
class CanCvtToTER : public std::false_type
{
};
template <>
class CanCvtToTER<TEMcodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TEFcodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TEScodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TECcodes> : public std::true_type
{
};
template <>
class CanCvtToTER<NotTEC> : public std::true_type
{
};

// TER allows all of the subsets.
using TER = TERSubset<CanCvtToTER>;

//------------------------------------------------------------------------------

inline bool
isTemMalformed(TER x)
{
    return ((x) >= temMALFORMED && (x) < tefFAILURE);
}

inline bool
isTefFailure(TER x)
{
    return ((x) >= tefFAILURE && (x) < tesSUCCESS);
}

inline bool
isTesSuccess(TER x)
{
    return ((x) == tesSUCCESS);
}

inline bool
isTecClaim(TER x)
{
    return ((x) >= tecCLAIM);
}

/** The broad kind of failure a result code reports. */
enum class ErrorCategory {
    None,
    Validation,
    InsufficientCredit,
    Authorization,
    NotFound,
    AlreadyExists,
    RipplingDisabled,
    Internal
};

/** Map a result code onto its failure category.
    tesSUCCESS maps to ErrorCategory::None.
*/
ErrorCategory
categorize(TER code);

std::string
to_string(ErrorCategory category);

std::unordered_map<
    TERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults();

bool
transResultInfo(TER code, std::string& token, std::string& text);

std::string
transToken(TER code);

std::string
transHuman(TER code);

std::optional<TER>
transCode(std::string const& token);

}  // namespace trustnet

#endif
