#pragma once

#include <tempo/chain/ledger_object_types.hpp>

namespace tempo { namespace chain {

  /**
    * Balance of one asset held by one account in the built-in balance book. Kept in the same
    * database as the ledger so that payments are undone together with the ledger state.
    */
  class asset_balance_object : public object< asset_balance_object_type, asset_balance_object >
  {
    CHAINBASE_OBJECT( asset_balance_object );
    public:
      template< typename Allocator >
      asset_balance_object( allocator< Allocator > a, uint64_t _id, const currency_type& _currency, const account_name_type& _owner,
        const share_type& _balance )
        : id( _id ), currency( _currency ), owner( _owner ), balance( _balance )
      {}

      currency_type     currency;
      account_name_type owner;
      share_type        balance = 0;

    CHAINBASE_UNPACK_CONSTRUCTOR(asset_balance_object);
  };

  typedef multi_index_container<
    asset_balance_object,
    indexed_by<
      ordered_unique< tag< by_id >,
        const_mem_fun< asset_balance_object, asset_balance_object::id_type, &asset_balance_object::get_id > >,
      ordered_unique< tag< by_currency_owner >,
        composite_key< asset_balance_object,
          member< asset_balance_object, currency_type, &asset_balance_object::currency >,
          member< asset_balance_object, account_name_type, &asset_balance_object::owner >
        >
      >
    >,
    allocator< asset_balance_object >
  > asset_balance_index;

} } // tempo::chain

FC_REFLECT( tempo::chain::asset_balance_object, (id)(currency)(owner)(balance) )
CHAINBASE_SET_INDEX_TYPE( tempo::chain::asset_balance_object, tempo::chain::asset_balance_index )
