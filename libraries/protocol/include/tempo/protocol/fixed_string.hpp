#pragma once

#include <fc/exception/exception.hpp>
#include <fc/uint128.hpp>
#include <fc/variant.hpp>
#include <fc/io/raw_fwd.hpp>
#include <fc/reflect/reflect.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <string>

namespace tempo { namespace protocol {

/**
  * In-place storage for a short account name. Packed big-endian into a 128-bit integer
  * so that comparing the integers orders names lexicographically.
  *
  * The empty string (all zero bytes) is the null account.
  */
class fixed_string
{
  public:
    fixed_string() = default;
    fixed_string( const char* str ) : fixed_string( std::string( str ) ) {}
    fixed_string( const std::string& str )
    {
      FC_ASSERT( str.size() <= sizeof( data ), "Input too large: `${in}` (${is}) for fixed size string: (${fs})",
        ("in", str)("is", str.size())("fs", sizeof( data )) );

      char buf[ sizeof( data ) ] = {};
      memcpy( buf, str.data(), str.size() );

      uint64_t hi = 0;
      uint64_t lo = 0;
      memcpy( &hi, buf, sizeof( hi ) );
      memcpy( &lo, buf + sizeof( hi ), sizeof( lo ) );
      data = fc::to_uint128( boost::endian::big_to_native( hi ), boost::endian::big_to_native( lo ) );
    }

    operator std::string()const
    {
      char buf[ sizeof( data ) ];
      uint64_t hi = boost::endian::native_to_big( fc::uint128_high_bits( data ) );
      uint64_t lo = boost::endian::native_to_big( fc::uint128_low_bits( data ) );
      memcpy( buf, &hi, sizeof( hi ) );
      memcpy( buf + sizeof( hi ), &lo, sizeof( lo ) );
      return std::string( buf, strnlen( buf, sizeof( buf ) ) );
    }

    uint32_t size()const { return std::string( *this ).size(); }
    uint32_t length()const { return size(); }
    bool empty()const { return data == 0; }

    friend std::string operator + ( const fixed_string& a, const std::string& b ) { return std::string( a ) + b; }
    friend std::string operator + ( const std::string& a, const fixed_string& b ) { return a + std::string( b ); }
    friend bool operator <  ( const fixed_string& a, const fixed_string& b ) { return a.data <  b.data; }
    friend bool operator <= ( const fixed_string& a, const fixed_string& b ) { return a.data <= b.data; }
    friend bool operator >  ( const fixed_string& a, const fixed_string& b ) { return a.data >  b.data; }
    friend bool operator >= ( const fixed_string& a, const fixed_string& b ) { return a.data >= b.data; }
    friend bool operator == ( const fixed_string& a, const fixed_string& b ) { return a.data == b.data; }
    friend bool operator != ( const fixed_string& a, const fixed_string& b ) { return a.data != b.data; }

    fc::uint128_t data = 0;
};

} } // tempo::protocol

namespace fc {

inline void to_variant( const tempo::protocol::fixed_string& s, variant& v ) { v = std::string( s ); }
inline void from_variant( const variant& v, tempo::protocol::fixed_string& s ) { s = tempo::protocol::fixed_string( v.as_string() ); }

namespace raw {

template< typename Stream >
inline void pack( Stream& s, const tempo::protocol::fixed_string& u )
{
  pack( s, std::string( u ) );
}

template< typename Stream >
inline void unpack( Stream& s, tempo::protocol::fixed_string& u, uint32_t depth = 0 )
{
  std::string str;
  unpack( s, str, depth );
  u = tempo::protocol::fixed_string( str );
}

} } // fc::raw

FC_REFLECT_TYPENAME( tempo::protocol::fixed_string )
