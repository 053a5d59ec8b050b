#pragma once

#include <tempo/chain/ledger_object_types.hpp>

namespace tempo { namespace chain {

  /**
    * @class dynamic_global_property_object
    * @brief Maintains global state of the ledger
    *
    * Single instance created at genesis. Holds the ledger clock, the accounts the ledger works on
    * behalf of and the token supply counters.
    */
  class dynamic_global_property_object : public object< dynamic_global_property_object_type, dynamic_global_property_object >
  {
    CHAINBASE_OBJECT( dynamic_global_property_object );
    public:
      template< typename Allocator >
      dynamic_global_property_object( allocator< Allocator > a, uint64_t _id,
        const time_point_sec& _time, const account_name_type& _ledger_account, const account_name_type& _creator,
        const currency_type& _currency, uint64_t _global_supply_cap )
        : id( _id ), time( _time ), ledger_account( _ledger_account ), creator( _creator ), currency( _currency ),
        global_supply_cap( _global_supply_cap )
      {}

      //ledger clock, only moves forward
      time_point_sec    time;
      //account holding all funds of the ledger
      account_name_type ledger_account;
      account_name_type creator;
      currency_type     currency;

      //next subscription token id, ids are never reused
      token_id_type     next_token_id = 1;
      //number of minted subscription tokens
      uint64_t          total_supply = 0;
      //0 - unlimited
      uint64_t          global_supply_cap = 0;
      //number of created tiers, also the id of the last one
      uint32_t          tier_count = 0;

    CHAINBASE_UNPACK_CONSTRUCTOR(dynamic_global_property_object);
  };

  typedef multi_index_container<
    dynamic_global_property_object,
    indexed_by<
      ordered_unique< tag< by_id >,
        const_mem_fun< dynamic_global_property_object, dynamic_global_property_object::id_type, &dynamic_global_property_object::get_id > >
    >,
    allocator< dynamic_global_property_object >
  > dynamic_global_property_index;

} } // tempo::chain

FC_REFLECT( tempo::chain::dynamic_global_property_object,
          (id)
          (time)
          (ledger_account)
          (creator)
          (currency)
          (next_token_id)
          (total_supply)
          (global_supply_cap)
          (tier_count)
        )
CHAINBASE_SET_INDEX_TYPE( tempo::chain::dynamic_global_property_object, tempo::chain::dynamic_global_property_index )
