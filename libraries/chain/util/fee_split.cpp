#include <tempo/chain/util/fee_split.hpp>

#include <tempo/protocol/config.hpp>

#include <fc/exception/exception.hpp>
#include <fc/uint128.hpp>

#include <algorithm>

namespace tempo { namespace chain { namespace util {

share_type apply_bps( const share_type& amount, uint32_t bps )
{
  FC_ASSERT( amount >= 0 );
  FC_ASSERT( bps <= TEMPO_100_PERCENT );
  fc::uint128_t result = fc::uint128_t( static_cast< uint64_t >( amount.value ) ) * bps / TEMPO_100_PERCENT;
  return static_cast< int64_t >( result );
}

purchase_split split_purchase( const share_type& amount, const fee_schedule& fees, uint16_t referral_bps, uint16_t reward_bps )
{
  purchase_split split;

  split.protocol_fee = apply_bps( amount, fees.protocol_bps );
  split.client_fee = apply_bps( amount, fees.client_bps );

  if( referral_bps > 0 )
  {
    split.referral_fee = std::min( apply_bps( amount - split.protocol_fee, referral_bps ), split.client_fee );
    split.client_fee -= split.referral_fee;
  }

  split.net_amount = amount - split.protocol_fee - split.client_fee - split.referral_fee;
  split.rewards = apply_bps( split.net_amount, reward_bps );

  FC_ASSERT( split.net_amount >= 0 && split.rewards <= split.net_amount );
  return split;
}

} } } // tempo::chain::util
