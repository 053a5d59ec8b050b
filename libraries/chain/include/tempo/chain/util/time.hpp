#pragma once

#include <tempo/protocol/exceptions.hpp>
#include <tempo/protocol/types.hpp>

#include <limits>

namespace tempo { namespace chain { namespace util {

using tempo::protocol::time_point_sec;

/// t + seconds, fails with capacity_exceeded_exception past the end of the ledger clock
inline time_point_sec add_seconds( const time_point_sec& t, uint64_t seconds )
{
  const uint64_t result = uint64_t( t.sec_since_epoch() ) + seconds;
  TEMPO_ASSERT( result <= std::numeric_limits< uint32_t >::max(), tempo::protocol::capacity_exceeded_exception,
    "Time ${t} + ${s} seconds is out of range", ("t", t)("s", seconds) );
  return time_point_sec( static_cast< uint32_t >( result ) );
}

/// t - seconds, stops at the epoch
inline time_point_sec sub_seconds( const time_point_sec& t, uint64_t seconds )
{
  const uint64_t current = t.sec_since_epoch();
  return time_point_sec( static_cast< uint32_t >( current > seconds ? current - seconds : 0 ) );
}

} } } // tempo::chain::util
