#pragma once

#include <tempo/chain/external_interfaces.hpp>

namespace tempo { namespace chain { namespace util {

/**
  * The asset the ledger is denominated in, seen from the ledger account.
  *
  * Incoming funds are captured exactly: the native asset has to be attached in full, a fungible
  * token is pulled and the ledger checks that the whole amount actually arrived. Outgoing funds
  * go through transfer, which fails the operation, or try_transfer, which reports the failure.
  */
class currency
{
  public:
    currency( asset_ledger_interface& ledger, const currency_type& type, const account_name_type& holder )
      : _ledger( ledger ), _type( type ), _holder( holder ) {}

    const currency_type& type()const { return _type; }

    /// amount held by the ledger account
    share_type balance()const;

    /// moves `amount` from `from` into the ledger account, returns the captured amount
    share_type capture( const account_name_type& from, const share_type& amount, const share_type& attached_value );

    void transfer( const account_name_type& to, const share_type& amount );

    bool try_transfer( const account_name_type& to, const share_type& amount );

  private:
    asset_ledger_interface& _ledger;
    currency_type           _type;
    account_name_type       _holder;
};

} } } // tempo::chain::util
