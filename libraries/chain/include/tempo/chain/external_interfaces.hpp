#pragma once

#include <tempo/protocol/types.hpp>
#include <tempo/protocol/ledger_parameters.hpp>

namespace tempo { namespace chain {

  using tempo::protocol::account_name_type;
  using tempo::protocol::currency_type;
  using tempo::protocol::share_type;
  using tempo::protocol::role_mask_type;
  using tempo::protocol::token_id_type;

  /**
    * Asset ledger the funds of the ledger live in. A rejected transfer returns false and moves
    * nothing. Implementations may charge a fee on transfer, in which case the recipient gets less
    * than `amount`.
    */
  class asset_ledger_interface
  {
    public:
      virtual ~asset_ledger_interface() = default;

      virtual share_type balance_of( const currency_type& currency, const account_name_type& holder )const = 0;
      virtual bool transfer( const currency_type& currency, const account_name_type& from,
        const account_name_type& to, const share_type& amount ) = 0;
  };

  /// Owner/role layer. True when the account holds any of the roles in the mask.
  class authority_interface
  {
    public:
      virtual ~authority_interface() = default;

      virtual bool has_role( const account_name_type& account, role_mask_type roles )const = 0;
  };

  /// Identity token layer, told about every token id assigned by the ledger.
  class identity_interface
  {
    public:
      virtual ~identity_interface() = default;

      virtual void mint( const account_name_type& account, token_id_type token_id ) = 0;
  };

} } // tempo::chain
