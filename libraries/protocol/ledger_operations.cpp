#include <tempo/protocol/ledger_operations.hpp>

#include <tempo/protocol/validation.hpp>

namespace tempo { namespace protocol {

void purchase_operation::validate()const
{
  validate_account_not_null( payer, "payer" );
  validate_account_not_null( account );
  validate_amount_not_negative( amount );
  validate_amount_not_negative( attached_value, "attached value" );
}

void grant_time_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  validate_account_not_null( account );
  TEMPO_VALIDATION_ASSERT( seconds > 0, "Granted time must be positive" );
}

void revoke_time_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  validate_account_not_null( account );
}

void refund_subscription_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  validate_account_not_null( account );
  validate_amount_greater_than_zero( amount );
}

void deactivate_subscription_operation::validate()const
{
  validate_account_not_null( account );
}

void yield_rewards_operation::validate()const
{
  validate_account_not_null( payer, "payer" );
  validate_amount_greater_than_zero( amount );
  validate_amount_not_negative( attached_value, "attached value" );
}

void claim_rewards_operation::validate()const
{
  validate_account_not_null( account );
}

void slash_operation::validate()const
{
  validate_account_not_null( account );
}

void create_tier_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  params.validate();
}

void update_tier_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  TEMPO_VALIDATION_ASSERT( tier_id > 0, "Tier ids start at 1" );
  params.validate();
}

void set_tier_paused_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  TEMPO_VALIDATION_ASSERT( tier_id > 0, "Tier ids start at 1" );
}

void create_reward_curve_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  params.validate();
}

void set_referral_code_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  TEMPO_VALIDATION_ASSERT( code != 0, "Referral code 0 is reserved for no code" );
  validate_number_in_100_percent_range( bps, "Referral bps" );
}

void delete_referral_code_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  TEMPO_VALIDATION_ASSERT( code != 0, "Referral code 0 is reserved for no code" );
}

void set_global_supply_cap_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
}

void issue_reward_shares_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  validate_account_not_null( account );
  TEMPO_VALIDATION_ASSERT( shares > 0, "Issued shares must be positive" );
}

void withdraw_creator_funds_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  validate_account_not_null( to, "recipient" );
  validate_amount_greater_than_zero( amount );
}

void update_fee_recipient_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  TEMPO_VALIDATION_ASSERT( leg == protocol_fee_leg || leg == client_fee_leg, "Unknown fee leg", ("leg", int( leg )) );
}

void transfer_subscription_operation::validate()const
{
  validate_account_not_null( caller, "caller" );
  validate_account_not_null( from, "from" );
  validate_account_not_null( to, "to" );
  TEMPO_VALIDATION_ASSERT( from != to, "Cannot transfer a subscription to its holder", ("account", from) );
}

} } // tempo::protocol
