#pragma once

#include <tempo/chain/external_interfaces.hpp>

#include <map>
#include <set>

namespace tempo { namespace chain {

  class database;

  /**
    * Default asset ledger. Balances are asset_balance_objects of the ledger database, so a failed
    * operation undoes its payments too.
    *
    * Token behaviour that is not ledger state (transfer fees, frozen accounts) is configuration
    * of the book itself.
    */
  class balance_book : public asset_ledger_interface
  {
    public:
      explicit balance_book( database& db );
      virtual ~balance_book() = default;

      virtual share_type balance_of( const currency_type& currency, const account_name_type& holder )const override;
      virtual bool transfer( const currency_type& currency, const account_name_type& from,
        const account_name_type& to, const share_type& amount ) override;

      /// creates new funds out of thin air
      void issue( const currency_type& currency, const account_name_type& to, const share_type& amount );

      /// part of every transfer of the token that is burned on the way, in basis points
      void set_transfer_fee( const account_name_type& token, uint16_t fee_bps );
      /// frozen accounts cannot receive funds
      void set_frozen( const account_name_type& account, bool frozen );

    private:
      void adjust_balance( const currency_type& currency, const account_name_type& owner, const share_type& delta );

      database&                               _db;
      std::map< account_name_type, uint16_t > _transfer_fees;
      std::set< account_name_type >           _frozen;
  };

} } // tempo::chain
