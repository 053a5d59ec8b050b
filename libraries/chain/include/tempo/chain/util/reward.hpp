#pragma once

#include <tempo/protocol/config.hpp>
#include <tempo/protocol/types.hpp>
#include <tempo/protocol/ledger_parameters.hpp>

#include <fc/uint128.hpp>

namespace tempo { namespace chain { namespace util {

using tempo::protocol::curve_parameters;
using tempo::protocol::share_type;
using tempo::protocol::time_point_sec;

using fc::uint128_t;

/// index of the curve period `now` falls into, 0 before the curve starts
uint64_t curve_period( const curve_parameters& curve, const time_point_sec& now );

/**
  * Share multiplier of the curve at `now`. Non-increasing in time, reaches min_multiplier once all
  * periods have elapsed.
  */
uint64_t curve_multiplier( const curve_parameters& curve, const time_point_sec& now );

/// shares bought by `amount` at the given multiplier
uint128_t shares_for_amount( const share_type& amount, uint64_t multiplier );

/// growth of points_per_share when `amount` is spread over `total_shares`, rounded down
uint128_t points_increment( const share_type& amount, const uint128_t& total_shares );

/// rewards accumulated by `shares` at `points_per_share` since the start of the pool, rounded down
uint128_t accumulated_rewards( const uint128_t& shares, const uint128_t& points_per_share );

/**
  * Reward debt of `shares` at `points_per_share`, rounded up. Together with accumulated_rewards
  * rounding down this keeps the sum of all entitlements within the pool balance.
  */
uint128_t reward_checkpoint( const uint128_t& shares, const uint128_t& points_per_share );

/// rewards accumulated since the checkpoint, 0 when rounding left nothing
uint128_t rewards_since( const uint128_t& shares, const uint128_t& points_per_share, const uint128_t& checkpoint );

} } } // tempo::chain::util
