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

#ifndef TRUSTNET_PROTOCOL_JSONFIELDS_H_INCLUDED
#define TRUSTNET_PROTOCOL_JSONFIELDS_H_INCLUDED

#include <json/json.h>

namespace trustnet {
namespace jss {

// JSON static strings

#define JSS(x) inline ::Json::StaticString const x(#x)

/* These "StaticString" field names are used instead of string literals
   when reading and writing Json::Value objects.

   Most strings have a trailing comment. Here is the legend:

   in: Read by the given RPC handler from its `Json::Value` parameter.
   out: Assigned by the given RPC handler in the `Json::Value` it returns.
   field: A field of at least one type of transaction.
   error: Common properties of RPC error responses.
*/

JSS(Freeze);                 // transaction type.
JSS(LimitSet);               // transaction type.
JSS(Payment);                // transaction type.
JSS(QualitySet);             // transaction type.
JSS(Ripple);                 // transaction type.
JSS(RippleSet);              // transaction type.
JSS(Settle);                 // transaction type.
JSS(TransactionType);        // field.
JSS(TrustCreate);            // transaction type.
JSS(TrustLine);              // ledger type.
JSS(account);                // in: AccountLines, Balance, Credit; field.
JSS(account_hi);             // out: TrustLine
JSS(account_lo);             // out: TrustLine
JSS(affected);               // out: ApplyResult
JSS(allow_rippling);         // out: TrustLine, AccountLines; field.
JSS(amount);                 // field.
JSS(applied);                // out: ApplyResult
JSS(asset);                  // out: TrustLine, AccountLines; field.
JSS(available);              // out: Credit
JSS(balance);                // out: TrustLine, AccountLines, Balance
JSS(category);               // error.
JSS(counterparty);           // field.
JSS(created_seq);            // out: TrustLine
JSS(credit);                 // out: Credit
JSS(destination);            // field.
JSS(engine_result);          // out: ApplyResult
JSS(engine_result_code);     // out: ApplyResult
JSS(engine_result_message);  // out: ApplyResult
JSS(error);                  // error.
JSS(error_code);             // error.
JSS(error_message);          // error.
JSS(first);                  // field.
JSS(frozen);                 // out: TrustLine, AccountLines
JSS(hops);                   // field.
JSS(index);                  // out: TrustLine
JSS(ledger_seq);             // out: ApplyResult, AccountLines
JSS(limit);                  // in: AccountLines; out: AccountLines
JSS(limit_hi);               // out: TrustLine; field.
JSS(limit_lo);               // out: TrustLine; field.
JSS(limit_peer);             // out: AccountLines
JSS(lines);                  // out: AccountLines
JSS(marker);                 // in/out: AccountLines
JSS(node);                   // out: TrustLine
JSS(ordinal);                // out: TrustLine
JSS(payee);                  // field.
JSS(payer);                  // field.
JSS(peer);                   // in: TrustLine, Balance, Credit; out: AccountLines
JSS(previous_txn_seq);       // out: TrustLine
JSS(quality_in);             // out: TrustLine, AccountLines; field.
JSS(quality_out);            // out: TrustLine, AccountLines; field.
JSS(second);                 // field.
JSS(signers);                // field.
JSS(status);                 // error.
JSS(success);                // rpc.
JSS(transfer);               // field.

#undef JSS

}  // namespace jss
}  // namespace trustnet

#endif
