#include <tempo/chain/detail_views.hpp>

#include <tempo/chain/util/reward.hpp>

namespace tempo { namespace chain {

subscription_details::subscription_details( const subscription_object& s, const database& db ) :
  account( s.account ),
  token_id( s.token_id ),
  tier_id( s.tier_id ),
  expires_at( s.expires_at ),
  purchase_expires( s.purchase_expires ),
  granted_seconds( s.granted_seconds ),
  remaining_seconds( s.get_remaining_seconds( db.head_time() ) ),
  active( s.is_active( db.head_time() ) ),
  reward_balance( db.get_reward_balance( s.account ) )
{
  const auto* holder = db.find_reward_holder( s.account );
  if( holder != nullptr )
    reward_shares = holder->shares;
}

tier_details::tier_details( const tier_object& t, const database& db ) :
  tier_id( t.tier_id ),
  params( t.params ),
  subscriber_count( t.subscriber_count ),
  on_sale( !t.params.paused && t.is_purchasable() && t.is_on_sale( db.head_time() ) )
{}

subscription_details get_subscription_details( const database& db, const account_name_type& account )
{
  const auto* sub = db.find_subscription( account );
  if( sub != nullptr )
    return subscription_details( *sub, db );

  //shares can outlive the subscription record of an account
  subscription_details details;
  details.account = account;
  const auto* holder = db.find_reward_holder( account );
  if( holder != nullptr )
    details.reward_shares = holder->shares;
  details.reward_balance = db.get_reward_balance( account );
  return details;
}

fc::optional< tier_details > get_tier_details( const database& db, tier_id_type tier_id )
{
  fc::optional< tier_details > result;
  const auto* tier = db.find_tier( tier_id );
  if( tier != nullptr )
    result = tier_details( *tier, db );
  return result;
}

std::vector< tier_details > get_tiers( const database& db )
{
  std::vector< tier_details > result;
  const auto& idx = db.get_index< tier_index, by_tier >();
  for( auto itr = idx.begin(); itr != idx.end(); ++itr )
    result.emplace_back( *itr, db );
  return result;
}

reward_pool_details get_reward_pool_details( const database& db )
{
  const auto& pool = db.get_reward_pool();

  reward_pool_details details;
  details.total_shares = pool.total_shares;
  details.points_per_share = pool.points_per_share;
  details.allocated = pool.allocated;
  details.withdrawn = pool.withdrawn;
  details.balance = pool.get_balance();
  details.curve_count = pool.curve_count;
  details.slashable = pool.slashable;
  details.slash_grace_period_seconds = pool.slash_grace_period_seconds;
  return details;
}

fee_schedule get_fee_details( const database& db )
{
  return db.get_fee_schedule().schedule;
}

curve_details get_curve_details( const database& db, curve_id_type curve_id )
{
  const auto& curve = db.get_reward_curve( curve_id );
  const auto now = db.head_time();

  curve_details details;
  details.curve_id = curve.curve_id;
  details.params = curve.params;
  details.current_period = util::curve_period( curve.params, now );
  details.current_multiplier = util::curve_multiplier( curve.params, now );
  return details;
}

fc::optional< referral_code_details > get_referral_code_details( const database& db, referral_code_type code )
{
  fc::optional< referral_code_details > result;
  const auto* obj = db.find_referral_code( code );
  if( obj == nullptr )
    return result;

  referral_code_details details;
  details.code = obj->code;
  details.bps = obj->bps;
  details.permanent = obj->permanent;
  details.restricted_account = obj->restricted_account;
  result = details;
  return result;
}

ledger_details get_ledger_details( const database& db )
{
  const auto& dgpo = db.get_dynamic_global_properties();

  ledger_details details;
  details.time = dgpo.time;
  details.ledger_account = dgpo.ledger_account;
  details.creator = dgpo.creator;
  details.currency = dgpo.currency;
  details.next_token_id = dgpo.next_token_id;
  details.total_supply = dgpo.total_supply;
  details.global_supply_cap = dgpo.global_supply_cap;
  details.tier_count = dgpo.tier_count;
  details.ledger_balance = db.get_ledger_balance();
  details.reward_pool_balance = db.get_reward_pool().get_balance();
  details.creator_balance = details.ledger_balance - details.reward_pool_balance;
  return details;
}

uint64_t remaining_seconds( const database& db, const account_name_type& account )
{
  return db.get_remaining_seconds( account );
}

share_type reward_balance_of( const database& db, const account_name_type& account )
{
  return db.get_reward_balance( account );
}

share_type creator_balance( const database& db )
{
  return db.get_creator_balance();
}

} } // tempo::chain
