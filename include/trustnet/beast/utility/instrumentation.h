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

#ifndef TRUSTNET_BEAST_UTILITY_INSTRUMENTATION_H_INCLUDED
#define TRUSTNET_BEAST_UTILITY_INSTRUMENTATION_H_INCLUDED

#include <cassert>

// TRUSTNET_ASSERT checks an invariant in debug builds. The message names
// the function and the condition, "namespace::function : condition", so a
// failure can be located without a debugger.
//
// Invariants are never a substitute for error handling: any condition that
// depends on input or on ledger state must be reported with a result code.
#define TRUSTNET_ASSERT(cond, message) assert((message) && (cond))

// Marks a branch that must be unreachable.
#define UNREACHABLE(message) assert((message) && false)

#endif
