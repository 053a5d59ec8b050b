#include <tempo/protocol/ledger_operations.hpp>

#include <tempo/chain/database.hpp>
#include <tempo/chain/ledger_evaluator.hpp>
#include <tempo/chain/ledger_objects.hpp>

#include <tempo/chain/util/time.hpp>

#include <fc/log/logger.hpp>

namespace tempo { namespace chain {

void yield_rewards_evaluator::do_apply( const yield_rewards_operation& o )
{
  try
  {
    TEMPO_ASSERT( _db.get_reward_pool().total_shares > 0, not_eligible_exception,
      "There are no reward shares to yield to" );

    _db.get_currency().capture( o.payer, o.amount, o.attached_value );
    _db.allocate_rewards( o.payer, o.amount );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void claim_rewards_evaluator::do_apply( const claim_rewards_operation& o )
{
  try
  {
    _db.claim_rewards( o.account );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void slash_evaluator::do_apply( const slash_operation& o )
{
  try
  {
    const auto& pool = _db.get_reward_pool();
    TEMPO_ASSERT( pool.slashable, not_slashable_exception, "Reward shares of this ledger cannot be slashed" );

    const auto* sub = _db.find_subscription( o.account );
    const time_point_sec expires_at = sub != nullptr ? sub->expires_at : time_point_sec();
    const time_point_sec slashable_after = util::add_seconds( expires_at, pool.slash_grace_period_seconds );
    TEMPO_ASSERT( _db.head_time() > slashable_after, not_slashable_exception,
      "Account ${a} cannot be slashed before ${t}", ("a", o.account)("t", slashable_after) );

    const auto* holder = _db.find_reward_holder( o.account );
    TEMPO_ASSERT( holder != nullptr && holder->shares > 0, not_slashable_exception,
      "Account ${a} holds no reward shares", ("a", o.account) );

    const uint128_t shares = holder->shares;
    const share_type amount = _db.burn_reward_shares( o.account );
    _db.push_virtual_operation( shares_slashed_operation( o.account, shares, amount ) );

    if( amount == 0 )
      return;

    if( _db.get_currency().try_transfer( o.account, amount ) )
    {
      _db.withdraw_from_reward_pool( amount );
    }
    else
    {
      //funds stay in the pool without an owner
      wlog( "Payout of ${amount} to slashed account ${a} failed", (amount)("a", o.account) );
      _db.push_virtual_operation( slash_payout_failed_operation( o.account, amount ) );
    }
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void create_reward_curve_evaluator::do_apply( const create_reward_curve_operation& o )
{
  try
  {
    const auto& curve = _db.create_reward_curve( o.params );
    _db.push_virtual_operation( reward_curve_created_operation( curve.curve_id, curve.params ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void issue_reward_shares_evaluator::do_apply( const issue_reward_shares_operation& o )
{
  try
  {
    _db.issue_raw_reward_shares( o.account, uint128_t( o.shares ), 0 );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

} } // tempo::chain
