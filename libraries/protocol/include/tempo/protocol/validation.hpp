#pragma once

#include <tempo/protocol/types.hpp>
#include <tempo/protocol/config.hpp>
#include <tempo/protocol/exceptions.hpp>

namespace tempo { namespace protocol {

inline void validate_account_not_null( const account_name_type& account, const char* context = "account" )
{
  TEMPO_ASSERT( !account.empty(), invalid_account_exception,
    "${context} cannot be the null account", ("context", context) );
}

inline void validate_amount_not_negative( const share_type& amount, const char* context = "amount" )
{
  TEMPO_VALIDATION_ASSERT( amount >= 0, "${context} cannot be negative. Actual: ${amount}",
    ("context", context)("amount", amount) );
}

inline void validate_amount_greater_than_zero( const share_type& amount, const char* context = "amount" )
{
  TEMPO_VALIDATION_ASSERT( amount > 0, "${context} must be greater than zero. Actual: ${amount}",
    ("context", context)("amount", amount) );
}

template< typename int_t >
inline void validate_number_in_100_percent_range( const int_t number, const char* context = "bps" )
{
  TEMPO_VALIDATION_ASSERT( number <= TEMPO_100_PERCENT, "${context} exceeds 100 percent. Value: ${v}, Max: ${max}",
    ("context", context)("v", number)("max", TEMPO_100_PERCENT) );
}

} } // tempo::protocol
