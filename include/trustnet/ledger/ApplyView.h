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

#ifndef TRUSTNET_LEDGER_APPLYVIEW_H_INCLUDED
#define TRUSTNET_LEDGER_APPLYVIEW_H_INCLUDED

#include <trustnet/ledger/ReadView.h>

#include <memory>

namespace trustnet {

/** Writeable view to a ledger, for applying a transaction.

    This refinement of ReadView provides an interface where
    the lines held in the view can be inserted and modified.
*/
class ApplyView : public ReadView
{
public:
    ApplyView() = default;

    /** Prepare to modify the line associated with key.

        The returned line is a private copy. Changes to it are not seen
        by the view until update() is called.

        @return `nullptr` if the key is not present
    */
    virtual std::shared_ptr<TrustLine>
    peek(Keylet const& k) = 0;

    /** Insert a new state line

        Requirements:
            The key must not already exist.

        Effects:
            The key is associated with the line and the creation
            counter advances.

        @note The key is taken from the line
    */
    virtual void
    insert(std::shared_ptr<TrustLine> const& line) = 0;

    /** Indicate changes to a peeked line

        Requirements:
            The line must have been obtained from peek.

        Effects:
            The line is recorded as modified.
    */
    virtual void
    update(std::shared_ptr<TrustLine> const& line) = 0;
};

}  // namespace trustnet

#endif
