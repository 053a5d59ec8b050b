#pragma once

#include <tempo/protocol/types.hpp>

#include <fc/uint128.hpp>

namespace tempo { namespace chain { namespace util {

inline u256 to256( const fc::uint128_t& t )
{
  u256 v( fc::uint128_high_bits( t ) );
  v <<= 64;
  v |= fc::uint128_low_bits( t );
  return v;
}

inline fc::uint128_t from256( const u256& v )
{
  FC_ASSERT( v <= to256( fc::uint128_max_value() ), "Value does not fit in 128 bits" );
  return fc::to_uint128( static_cast< uint64_t >( v >> 64 ), static_cast< uint64_t >( v & std::numeric_limits< uint64_t >::max() ) );
}

} } } // tempo::chain::util
