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


#ifndef TRUSTNET_TEST_JTX_JTX_H_INCLUDED
#define TRUSTNET_TEST_JTX_JTX_H_INCLUDED

#include <trustnet/protocol/STTx.h>
#include <trustnet/protocol/TER.h>

#include <optional>
#include <utility>
#include <vector>

namespace trustnet {
namespace test {
namespace jtx {

/** Execution context for applying a transaction.
    This contains the fields of the transaction and the result it is
    expected to produce.
*/
struct JTx
{
    AccountID account;
    STTx::Body body;
    std::vector<AccountID> signers;
    std::optional<TER> ter = TER{tesSUCCESS};

    JTx(AccountID const& account_, STTx::Body body_)
        : account(account_), body(std::move(body_))
    {
    }

    STTx
    stx() const
    {
        return STTx(account, body, signers);
    }
};

}  // namespace jtx
}  // namespace test
}  // namespace trustnet

#endif
