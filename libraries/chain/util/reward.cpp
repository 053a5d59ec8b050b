#include <tempo/chain/util/reward.hpp>
#include <tempo/chain/util/uint256.hpp>

#include <tempo/protocol/exceptions.hpp>

namespace tempo { namespace chain { namespace util {

uint64_t curve_period( const curve_parameters& curve, const time_point_sec& now )
{
  FC_ASSERT( curve.period_seconds > 0 );
  if( now <= curve.start_time )
    return 0;
  return ( now - curve.start_time ).to_seconds() / curve.period_seconds;
}

uint64_t curve_multiplier( const curve_parameters& curve, const time_point_sec& now )
{
  try
  {
  const uint64_t period = curve_period( curve, now );
  if( period >= curve.num_periods )
    return curve.min_multiplier;

  const uint64_t remaining = curve.num_periods - period;
  u256 result = 0;

  switch( curve.kind )
  {
    case protocol::exponential_curve:
      result = 1;
      for( uint64_t i = 0; i < remaining; ++i )
        result *= curve.formula_base;
      break;
    case protocol::linear_curve:
      {
        const u256 span = curve.formula_base - curve.min_multiplier;
        result = curve.min_multiplier + ( span * remaining ) / curve.num_periods;
      }
      break;
    default:
      FC_ASSERT( false, "Unknown curve kind ${k}", ("k", int( curve.kind )) );
  }

  FC_ASSERT( result <= u256( TEMPO_MAX_CURVE_MULTIPLIER ), "Multiplier overflow" );
  return static_cast< uint64_t >( result );
  } FC_CAPTURE_AND_RETHROW( (curve)(now) )
}

uint128_t shares_for_amount( const share_type& amount, uint64_t multiplier )
{
  FC_ASSERT( amount >= 0 );
  // 63 bits times 64 bits, always fits
  return uint128_t( static_cast< uint64_t >( amount.value ) ) * multiplier;
}

uint128_t points_increment( const share_type& amount, const uint128_t& total_shares )
{
  FC_ASSERT( amount >= 0 );
  FC_ASSERT( total_shares > 0, "Cannot spread rewards over zero shares" );
  u256 points = u256( static_cast< uint64_t >( amount.value ) ) << TEMPO_POINTS_MAGNITUDE_BITS;
  points /= to256( total_shares );
  TEMPO_ASSERT( points <= to256( fc::uint128_max_value() ), protocol::capacity_exceeded_exception,
    "Reward allocation too large for outstanding shares", ("amount", amount)("total_shares", total_shares) );
  return from256( points );
}

uint128_t accumulated_rewards( const uint128_t& shares, const uint128_t& points_per_share )
{
  u256 accumulated = ( to256( shares ) * to256( points_per_share ) ) >> TEMPO_POINTS_MAGNITUDE_BITS;
  TEMPO_ASSERT( accumulated <= to256( fc::uint128_max_value() ), protocol::capacity_exceeded_exception,
    "Accumulated rewards overflow", ("shares", shares)("points_per_share", points_per_share) );
  return from256( accumulated );
}

uint128_t reward_checkpoint( const uint128_t& shares, const uint128_t& points_per_share )
{
  const u256 magnified = to256( shares ) * to256( points_per_share );
  u256 checkpoint = magnified >> TEMPO_POINTS_MAGNITUDE_BITS;
  if( ( checkpoint << TEMPO_POINTS_MAGNITUDE_BITS ) != magnified )
    ++checkpoint;
  TEMPO_ASSERT( checkpoint <= to256( fc::uint128_max_value() ), protocol::capacity_exceeded_exception,
    "Reward checkpoint overflow", ("shares", shares)("points_per_share", points_per_share) );
  return from256( checkpoint );
}

uint128_t rewards_since( const uint128_t& shares, const uint128_t& points_per_share, const uint128_t& checkpoint )
{
  const uint128_t accumulated = accumulated_rewards( shares, points_per_share );
  return accumulated > checkpoint ? accumulated - checkpoint : 0;
}

} } } // tempo::chain::util
