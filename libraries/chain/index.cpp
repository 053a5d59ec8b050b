#include <tempo/chain/database.hpp>

#include <tempo/chain/asset_balance_object.hpp>
#include <tempo/chain/global_property_object.hpp>
#include <tempo/chain/ledger_objects.hpp>

namespace tempo { namespace chain {

// singletons first, then the per-id and per-account tables
void database::initialize_indexes()
{
  add_index< dynamic_global_property_index >();
  add_index< fee_schedule_index >();
  add_index< reward_pool_index >();

  add_index< tier_index >();
  add_index< reward_curve_index >();
  add_index< referral_code_index >();

  add_index< subscription_index >();
  add_index< reward_holder_index >();
  add_index< asset_balance_index >();
}

} } // tempo::chain
