#pragma once

#include <tempo/protocol/types.hpp>
#include <tempo/protocol/ledger_parameters.hpp>

namespace tempo { namespace chain { namespace util {

using tempo::protocol::fee_schedule;
using tempo::protocol::share_type;

struct purchase_split
{
  share_type protocol_fee = 0;
  //what is left of the client fee after the referral was carved out of it
  share_type client_fee = 0;
  share_type referral_fee = 0;
  //stays with the ledger
  share_type net_amount = 0;
  //part of net_amount that goes to the reward pool
  share_type rewards = 0;
};

/**
  * Splits a purchase of `amount` between the fee legs, the referrer and the ledger. The referral
  * is computed from the amount left after the protocol fee and is paid out of the client fee, so
  * it can never exceed it. All divisions round down.
  */
purchase_split split_purchase( const share_type& amount, const fee_schedule& fees, uint16_t referral_bps, uint16_t reward_bps );

/// amount * bps / 100%, rounded down
share_type apply_bps( const share_type& amount, uint32_t bps );

} } } // tempo::chain::util
