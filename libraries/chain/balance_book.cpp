#include <tempo/chain/balance_book.hpp>

#include <tempo/chain/asset_balance_object.hpp>
#include <tempo/chain/database.hpp>

namespace tempo { namespace chain {

balance_book::balance_book( database& db ) : _db( db ) {}

share_type balance_book::balance_of( const currency_type& currency, const account_name_type& holder )const
{
  const auto* balance = _db.find< asset_balance_object, by_currency_owner >( boost::make_tuple( currency, holder ) );
  return balance == nullptr ? share_type( 0 ) : balance->balance;
}

bool balance_book::transfer( const currency_type& currency, const account_name_type& from,
  const account_name_type& to, const share_type& amount )
{
  FC_ASSERT( amount >= 0, "Negative transfer", ("amount", amount) );
  if( amount == 0 )
    return true;
  if( _frozen.count( to ) || balance_of( currency, from ) < amount )
    return false;

  share_type fee = 0;
  if( !currency.is_native() )
  {
    auto itr = _transfer_fees.find( currency.token );
    if( itr != _transfer_fees.end() )
      fee = static_cast< int64_t >( fc::uint128_t( amount.value ) * itr->second / TEMPO_100_PERCENT );
  }

  adjust_balance( currency, from, -amount );
  adjust_balance( currency, to, amount - fee );
  return true;
}

void balance_book::issue( const currency_type& currency, const account_name_type& to, const share_type& amount )
{
  FC_ASSERT( amount > 0, "Issued amount must be positive", ("amount", amount) );
  adjust_balance( currency, to, amount );
}

void balance_book::set_transfer_fee( const account_name_type& token, uint16_t fee_bps )
{
  FC_ASSERT( fee_bps <= TEMPO_100_PERCENT );
  if( fee_bps == 0 )
    _transfer_fees.erase( token );
  else
    _transfer_fees[ token ] = fee_bps;
}

void balance_book::set_frozen( const account_name_type& account, bool frozen )
{
  if( frozen )
    _frozen.insert( account );
  else
    _frozen.erase( account );
}

void balance_book::adjust_balance( const currency_type& currency, const account_name_type& owner, const share_type& delta )
{
  const auto* balance = _db.find< asset_balance_object, by_currency_owner >( boost::make_tuple( currency, owner ) );
  if( balance == nullptr )
  {
    FC_ASSERT( delta >= 0 );
    _db.create< asset_balance_object >( currency, owner, delta );
  }
  else
  {
    FC_ASSERT( balance->balance + delta >= 0, "Insufficient balance", ("owner", owner)("balance", balance->balance)("delta", delta) );
    _db.modify( *balance, [&]( asset_balance_object& b )
    {
      b.balance += delta;
    } );
  }
}

} } // tempo::chain
