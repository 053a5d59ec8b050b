#include <tempo/chain/util/currency.hpp>

#include <tempo/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace tempo { namespace chain { namespace util {

using namespace tempo::protocol;

share_type currency::balance()const
{
  return _ledger.balance_of( _type, _holder );
}

share_type currency::capture( const account_name_type& from, const share_type& amount, const share_type& attached_value )
{
  try
  {
  FC_ASSERT( amount >= 0 );

  if( _type.is_native() )
  {
    TEMPO_ASSERT( attached_value == amount, invalid_capture_exception,
      "Attached value ${v} does not match the amount ${a}", ("v", attached_value)("a", amount) );
    if( amount == 0 )
      return amount;
    TEMPO_ASSERT( _ledger.transfer( _type, from, _holder, amount ), insufficient_funds_exception,
      "Account ${f} cannot cover ${a}", ("f", from)("a", amount) );
    return amount;
  }

  TEMPO_ASSERT( attached_value == 0, invalid_capture_exception,
    "Native value attached to a ${t} payment", ("t", _type.token)("v", attached_value) );
  if( amount == 0 )
    return amount;

  const share_type before = balance();
  TEMPO_ASSERT( _ledger.transfer( _type, from, _holder, amount ), insufficient_funds_exception,
    "Account ${f} cannot cover ${a}", ("f", from)("a", amount) );
  const share_type received = balance() - before;

  TEMPO_ASSERT( received >= amount, invalid_capture_exception,
    "Received ${r} instead of ${a}", ("r", received)("a", amount)("token", _type.token) );
  return amount;
  } FC_CAPTURE_AND_RETHROW( (from)(amount)(attached_value) )
}

void currency::transfer( const account_name_type& to, const share_type& amount )
{
  TEMPO_ASSERT( try_transfer( to, amount ), transfer_failed_exception,
    "Transfer of ${a} to ${to} was rejected", ("a", amount)("to", to) );
}

bool currency::try_transfer( const account_name_type& to, const share_type& amount )
{
  FC_ASSERT( amount >= 0 );
  if( amount == 0 )
    return true;
  return _ledger.transfer( _type, _holder, to, amount );
}

} } } // tempo::chain::util
