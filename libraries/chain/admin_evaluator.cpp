#include <tempo/protocol/ledger_operations.hpp>

#include <tempo/chain/database.hpp>
#include <tempo/chain/ledger_evaluator.hpp>
#include <tempo/chain/ledger_objects.hpp>

namespace tempo { namespace chain {

void create_tier_evaluator::do_apply( const create_tier_operation& o )
{
  try
  {
    const auto& tier = _db.create_tier( o.params );
    _db.push_virtual_operation( tier_created_operation( tier.tier_id, tier.params ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void update_tier_evaluator::do_apply( const update_tier_operation& o )
{
  try
  {
    const auto& tier = _db.get_tier( o.tier_id );
    _db.validate_tier_parameters( o.params );

    TEMPO_ASSERT( o.params.supply_cap == 0 || o.params.supply_cap >= tier.subscriber_count, capacity_exceeded_exception,
      "Tier ${t} already has ${c} subscribers", ("t", o.tier_id)("c", tier.subscriber_count)("supply_cap", o.params.supply_cap) );

    _db.modify( tier, [&]( tier_object& t )
    {
      t.params = o.params;
    } );

    _db.push_virtual_operation( tier_updated_operation( tier.tier_id, tier.params ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void set_tier_paused_evaluator::do_apply( const set_tier_paused_operation& o )
{
  try
  {
    const auto& tier = _db.get_tier( o.tier_id );
    _db.modify( tier, [&]( tier_object& t )
    {
      t.params.paused = o.paused;
    } );

    _db.push_virtual_operation( tier_updated_operation( tier.tier_id, tier.params ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void set_referral_code_evaluator::do_apply( const set_referral_code_operation& o )
{
  try
  {
    const auto& fees = _db.get_fee_schedule().schedule;
    TEMPO_VALIDATION_ASSERT( o.bps <= fees.client_bps,
      "Referral code cannot pay more than the client fee of ${c} bps", ("c", fees.client_bps)("bps", o.bps) );

    const auto* code = _db.find_referral_code( o.code );
    if( code == nullptr )
    {
      code = &_db.create< referral_code_object >( o.code );
    }
    else
    {
      TEMPO_ASSERT( !code->permanent, state_conflict_exception, "Referral code ${c} is permanent", ("c", o.code) );
    }

    _db.modify( *code, [&]( referral_code_object& c )
    {
      c.bps = o.bps;
      c.permanent = o.permanent;
      c.restricted_account = o.restricted_account;
    } );

    _db.push_virtual_operation( referral_code_set_operation( o.code, o.bps, o.permanent, o.restricted_account ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void delete_referral_code_evaluator::do_apply( const delete_referral_code_operation& o )
{
  try
  {
    const auto* code = _db.find_referral_code( o.code );
    TEMPO_VALIDATION_ASSERT( code != nullptr, "Unknown referral code ${c}", ("c", o.code) );
    TEMPO_ASSERT( !code->permanent, state_conflict_exception, "Referral code ${c} is permanent", ("c", o.code) );

    _db.remove( *code );

    _db.push_virtual_operation( referral_code_deleted_operation( o.code ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void set_global_supply_cap_evaluator::do_apply( const set_global_supply_cap_operation& o )
{
  try
  {
    const auto& dgpo = _db.get_dynamic_global_properties();
    TEMPO_ASSERT( o.supply_cap == 0 || o.supply_cap >= dgpo.total_supply, capacity_exceeded_exception,
      "${s} subscriptions were already minted", ("s", dgpo.total_supply)("supply_cap", o.supply_cap) );

    _db.modify( dgpo, [&]( dynamic_global_property_object& p )
    {
      p.global_supply_cap = o.supply_cap;
    } );

    _db.push_virtual_operation( global_supply_cap_changed_operation( o.supply_cap ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void withdraw_creator_funds_evaluator::do_apply( const withdraw_creator_funds_operation& o )
{
  try
  {
    const share_type creator_balance = _db.get_creator_balance();
    TEMPO_ASSERT( o.amount <= creator_balance, insufficient_funds_exception,
      "Creator balance ${b} cannot cover ${a}", ("b", creator_balance)("a", o.amount) );

    _db.get_currency().transfer( o.to, o.amount );

    _db.push_virtual_operation( creator_funds_withdrawn_operation( o.to, o.amount ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

void update_fee_recipient_evaluator::do_apply( const update_fee_recipient_operation& o )
{
  try
  {
    const auto& fees = _db.get_fee_schedule();
    const account_name_type old_recipient = fees.get_recipient( o.leg );
    TEMPO_ASSERT( !old_recipient.empty() && o.caller == old_recipient, not_eligible_exception,
      "Only the current recipient can hand the fee over", ("recipient", old_recipient)("caller", o.caller) );

    _db.modify( fees, [&]( fee_schedule_object& f )
    {
      if( o.leg == protocol_fee_leg )
      {
        f.schedule.protocol_recipient = o.new_recipient;
        if( o.new_recipient.empty() )
          f.schedule.protocol_bps = 0;
      }
      else
      {
        f.schedule.client_recipient = o.new_recipient;
        if( o.new_recipient.empty() )
        {
          f.schedule.client_bps = 0;
          f.schedule.client_referral_bps = 0;
        }
      }
    } );

    _db.push_virtual_operation( fee_recipient_changed_operation( o.leg, old_recipient, o.new_recipient ) );
  }
  FC_CAPTURE_AND_RETHROW( (o) )
}

} } // tempo::chain
