#include <tempo/protocol/ledger_operations.hpp>

#include <tempo/chain/database.hpp>
#include <tempo/chain/ledger_evaluator.hpp>
#include <tempo/chain/ledger_objects.hpp>

#include <tempo/chain/util/fee_split.hpp>
#include <tempo/chain/util/time.hpp>

#include <algorithm>
#include <limits>

namespace tempo { namespace chain {

namespace {

/// 0 keeps the current tier, a newcomer lands in the first one
tier_id_type resolve_tier( const subscription_object* sub, tier_id_type requested )
{
  if( requested != 0 )
    return requested;
  return sub != nullptr && sub->in_tier() ? sub->tier_id : 1;
}

void enter_tier( database& db, const subscription_object& sub, const tier_object& tier )
{
  if( !sub.in_tier() )
    db.join_tier( sub, tier );
  else if( sub.tier_id != tier.tier_id )
    db.switch_tier( sub, tier );
}

uint16_t resolve_referral_bps( database& db, const purchase_operation& o )
{
  uint16_t bps = 0;
  if( o.referral_code != 0 )
  {
    const auto* code = db.find_referral_code( o.referral_code );
    if( code != nullptr )
    {
      TEMPO_ASSERT( !code->is_restricted() || code->restricted_account == o.referrer, not_eligible_exception,
        "Referral code ${c} is reserved for ${r}", ("c", o.referral_code)("r", code->restricted_account)("referrer", o.referrer) );
      bps = code->bps;
    }
  }

  if( o.referrer.empty() )
    return 0;
  if( bps == 0 )
    bps = db.get_fee_schedule().schedule.client_referral_bps;
  return bps;
}

} // namespace

void purchase_evaluator::do_apply( const purchase_operation& o )
{
  try
  {
    const auto now = _db.head_time();
    const auto* existing = _db.find_subscription( o.account );
    const tier_id_type current_tier = existing != nullptr ? existing->tier_id : 0;
    const tier_id_type tier_id = resolve_tier( existing, o.tier_id );

    const auto& tier = _db.get_tier( tier_id );

    TEMPO_ASSERT( current_tier == 0 || current_tier == tier_id || o.payer == o.account, tier_invalid_switch_exception,
      "Only ${a} can move its subscription to another tier", ("a", o.account)("payer", o.payer)("from", current_tier)("to", tier_id) );
    TEMPO_ASSERT( !tier.params.paused, state_conflict_exception, "Tier ${t} is paused", ("t", tier_id) );
    TEMPO_ASSERT( tier.is_on_sale( now ), state_conflict_exception, "Tier ${t} is not on sale at ${now}",
      ("t", tier_id)("now", now)("start", tier.params.start_time)("end", tier.params.end_time) );
    TEMPO_ASSERT( tier.is_purchasable(), state_conflict_exception, "Time on tier ${t} can only be granted", ("t", tier_id) );

    const bool first_purchase = existing == nullptr || existing->purchase_expires == time_point_sec();
    const share_type mint_price = first_purchase ? tier.params.initial_mint_price : share_type( 0 );
    TEMPO_ASSERT( o.amount >= mint_price, insufficient_funds_exception,
      "Amount ${a} does not cover the mint price ${m}", ("a", o.amount)("m", mint_price) );

    u256 bought = u256( ( o.amount - mint_price ).value ) * tier.params.period_duration_seconds;
    bought /= u256( tier.params.price_per_period.value );
    TEMPO_ASSERT( bought <= u256( std::numeric_limits< uint32_t >::max() ), capacity_exceeded_exception,
      "Amount ${a} buys more time than the ledger can hold", ("a", o.amount) );
    const uint64_t seconds = static_cast< uint64_t >( bought );

    const bool lapsed = existing != nullptr && existing->in_tier() && existing->expires_at < now;
    if( current_tier != tier_id || lapsed )
    {
      TEMPO_ASSERT( seconds >= tier.params.period_duration_seconds, insufficient_funds_exception,
        "Joining tier ${t} requires at least one full period", ("t", tier_id)("seconds", seconds)("amount", o.amount) );
    }
    else
    {
      TEMPO_ASSERT( seconds > 0, insufficient_funds_exception, "Amount ${a} buys no time", ("a", o.amount) );
    }

    auto currency = _db.get_currency();
    currency.capture( o.payer, o.amount, o.attached_value );

    const auto& sub = _db.mint_subscription( o.account );
    enter_tier( _db, sub, tier );
    _db.extend_subscription( sub, seconds, true );

    TEMPO_ASSERT( tier.params.max_commitment_seconds == 0 || sub.get_remaining_seconds( now ) <= tier.params.max_commitment_seconds,
      capacity_exceeded_exception, "Subscription would run for more than ${max} seconds",
      ("max", tier.params.max_commitment_seconds)("remaining", sub.get_remaining_seconds( now )) );

    const auto& fees = _db.get_fee_schedule().schedule;
    const auto split = util::split_purchase( o.amount, fees, resolve_referral_bps( _db, o ), tier.params.reward_bps );

    if( split.protocol_fee > 0 )
    {
      currency.transfer( fees.protocol_recipient, split.protocol_fee );
      _db.push_virtual_operation( fee_transferred_operation( o.account, fees.protocol_recipient, protocol_fee_leg, split.protocol_fee ) );
    }
    if( split.client_fee > 0 )
    {
      currency.transfer( fees.client_recipient, split.client_fee );
      _db.push_virtual_operation( fee_transferred_operation( o.account, fees.client_recipient, client_fee_leg, split.client_fee ) );
    }
    if( split.referral_fee > 0 )
    {
      currency.transfer( o.referrer, split.referral_fee );
      _db.push_virtual_operation( referral_paid_operation( o.account, o.referrer, o.referral_code, split.referral_fee ) );
    }

    share_type rewards = 0;
    if( split.rewards > 0 )
    {
      _db.issue_reward_shares( o.account, split.rewards, tier.params.reward_curve_id );
      //with no shares at all the rewards stay with the creator
      if( _db.get_reward_pool().total_shares > 0 )
      {
        _db.allocate_rewards( o.payer, split.rewards );
        rewards = split.rewards;
      }
    }

    _db.push_virtual_operation( subscription_purchased_operation( o.payer, o.account, tier_id, sub.token_id,
      o.amount, split.net_amount, rewards, seconds, sub.expires_at ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void grant_time_evaluator::do_apply( const grant_time_operation& o )
{
  try
  {
    const auto* existing = _db.find_subscription( o.account );
    const auto& tier = _db.get_tier( resolve_tier( existing, o.tier_id ) );

    const auto& sub = _db.mint_subscription( o.account );
    enter_tier( _db, sub, tier );
    _db.extend_subscription( sub, o.seconds, false );

    _db.push_virtual_operation( time_granted_operation( o.account, tier.tier_id, o.seconds, sub.expires_at ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void revoke_time_evaluator::do_apply( const revoke_time_operation& o )
{
  try
  {
    const auto& sub = _db.get_subscription( o.account );
    const auto now = _db.head_time();

    //paid time and time already gone are never taken away
    time_point_sec expires_at = util::sub_seconds( sub.expires_at, sub.granted_seconds );
    expires_at = std::max( expires_at, std::max( now, sub.purchase_expires ) );
    expires_at = std::min( expires_at, sub.expires_at );

    const uint64_t removed = sub.expires_at.sec_since_epoch() - expires_at.sec_since_epoch();
    _db.modify( sub, [&]( subscription_object& s )
    {
      s.expires_at = expires_at;
      s.granted_seconds = 0;
    } );

    _db.push_virtual_operation( time_revoked_operation( o.account, removed, expires_at ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void refund_subscription_evaluator::do_apply( const refund_subscription_operation& o )
{
  try
  {
    const share_type creator_balance = _db.get_creator_balance();
    TEMPO_ASSERT( o.amount <= creator_balance, insufficient_funds_exception,
      "Creator balance ${b} cannot cover the refund of ${a}", ("b", creator_balance)("a", o.amount) );

    const auto& sub = _db.get_subscription( o.account );
    const auto now = _db.head_time();

    uint64_t removed = 0;
    if( sub.in_tier() )
    {
      const auto& params = _db.get_tier( sub.tier_id ).params;
      const uint64_t paid = sub.get_paid_remaining_seconds( now );
      if( params.price_per_period == 0 )
      {
        removed = paid;
      }
      else
      {
        u256 refunded = u256( o.amount.value ) * params.period_duration_seconds / u256( params.price_per_period.value );
        removed = refunded < u256( paid ) ? static_cast< uint64_t >( refunded ) : paid;
      }
    }

    _db.modify( sub, [&]( subscription_object& s )
    {
      s.expires_at = util::sub_seconds( s.expires_at, removed );
      s.purchase_expires = util::sub_seconds( s.purchase_expires, removed );
    } );

    _db.get_currency().transfer( o.account, o.amount );

    _db.push_virtual_operation( subscription_refunded_operation( o.account, o.amount, removed, sub.expires_at ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void deactivate_subscription_evaluator::do_apply( const deactivate_subscription_operation& o )
{
  try
  {
    const auto* sub = _db.find_subscription( o.account );
    if( sub == nullptr || !sub->in_tier() )
      return;

    TEMPO_ASSERT( _db.head_time() > sub->expires_at, state_conflict_exception,
      "Subscription of ${a} is active until ${e}", ("a", o.account)("e", sub->expires_at) );

    const tier_id_type tier_id = sub->tier_id;
    _db.leave_tier( *sub );

    _db.push_virtual_operation( subscription_deactivated_operation( o.account, tier_id ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void transfer_subscription_evaluator::do_apply( const transfer_subscription_operation& o )
{
  try
  {
    const auto& from = _db.get_subscription( o.from );
    const auto* to = _db.find_subscription( o.to );
    TEMPO_ASSERT( to == nullptr || !to->has_token(), state_conflict_exception,
      "${to} already holds a subscription", ("to", o.to) );

    if( from.in_tier() )
    {
      TEMPO_ASSERT( _db.get_tier( from.tier_id ).params.transferable, state_conflict_exception,
        "Subscriptions of tier ${t} cannot be transferred", ("t", from.tier_id) );
    }

    if( to == nullptr )
      to = &_db.create< subscription_object >( o.to );

    const token_id_type token_id = from.token_id;
    _db.modify( *to, [&]( subscription_object& s )
    {
      s.token_id = from.token_id;
      s.tier_id = from.tier_id;
      s.expires_at = from.expires_at;
      s.granted_seconds = from.granted_seconds;
      s.purchase_expires = from.purchase_expires;
    } );
    _db.modify( from, [&]( subscription_object& s )
    {
      s.token_id = 0;
      s.tier_id = 0;
      s.expires_at = time_point_sec();
      s.granted_seconds = 0;
      s.purchase_expires = time_point_sec();
    } );

    _db.move_reward_holder( o.from, o.to );

    _db.push_virtual_operation( subscription_transferred_operation( o.from, o.to, token_id ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

} } // tempo::chain
