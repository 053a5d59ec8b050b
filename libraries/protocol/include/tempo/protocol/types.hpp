#pragma once

#include <tempo/protocol/fixed_string.hpp>

#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>
#include <fc/uint128.hpp>
#include <fc/container/flat.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tempo {

using fc::uint128_t;
typedef boost::multiprecision::uint256_t  u256;

namespace protocol {

using std::string;
using std::vector;

using fc::optional;
using fc::static_variant;
using fc::time_point_sec;
using fc::uint128_t;

using boost::container::flat_map;
using boost::container::flat_set;

typedef fc::safe< int64_t >   share_type;
typedef fc::safe< uint64_t >  ushare_type;

typedef fixed_string          account_name_type;
typedef uint16_t              tier_id_type;
typedef uint16_t              curve_id_type;
typedef uint64_t              token_id_type;
typedef uint64_t              referral_code_type;
typedef uint16_t              role_mask_type;

} } // tempo::protocol
