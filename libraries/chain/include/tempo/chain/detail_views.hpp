#pragma once

#include <tempo/chain/database.hpp>

#include <fc/optional.hpp>

namespace tempo { namespace chain {

/**
  * Read-only views of the ledger state. They never modify the database and can be called at any
  * time outside of apply_operation.
  */

struct subscription_details
{
  subscription_details() = default;
  subscription_details( const subscription_object& s, const database& db );

  account_name_type account;
  token_id_type     token_id = 0;
  tier_id_type      tier_id = 0;
  time_point_sec    expires_at;
  time_point_sec    purchase_expires;
  uint64_t          granted_seconds = 0;
  uint64_t          remaining_seconds = 0;
  bool              active = false;
  uint128_t         reward_shares = 0;
  share_type        reward_balance = 0;
};

struct tier_details
{
  tier_details() = default;
  tier_details( const tier_object& t, const database& db );

  tier_id_type      tier_id = 0;
  tier_parameters   params;
  uint32_t          subscriber_count = 0;
  bool              on_sale = false;
};

struct reward_pool_details
{
  uint128_t         total_shares = 0;
  uint128_t         points_per_share = 0;
  share_type        allocated = 0;
  share_type        withdrawn = 0;
  share_type        balance = 0;
  uint16_t          curve_count = 0;
  bool              slashable = false;
  uint32_t          slash_grace_period_seconds = 0;
};

struct curve_details
{
  curve_id_type     curve_id = 0;
  curve_parameters  params;
  uint64_t          current_period = 0;
  uint64_t          current_multiplier = 0;
};

struct referral_code_details
{
  referral_code_type  code = 0;
  uint16_t            bps = 0;
  bool                permanent = false;
  account_name_type   restricted_account;
};

struct ledger_details
{
  time_point_sec    time;
  account_name_type ledger_account;
  account_name_type creator;
  currency_type     currency;
  token_id_type     next_token_id = 0;
  uint64_t          total_supply = 0;
  uint64_t          global_supply_cap = 0;
  uint32_t          tier_count = 0;
  share_type        ledger_balance = 0;
  share_type        creator_balance = 0;
  share_type        reward_pool_balance = 0;
};

/// empty details (no token, no tier) for an account that never subscribed
subscription_details                  get_subscription_details( const database& db, const account_name_type& account );
fc::optional< tier_details >          get_tier_details( const database& db, tier_id_type tier_id );
std::vector< tier_details >           get_tiers( const database& db );
reward_pool_details                   get_reward_pool_details( const database& db );
fee_schedule                          get_fee_details( const database& db );
/// throws validation_exception for an unknown curve
curve_details                         get_curve_details( const database& db, curve_id_type curve_id );
fc::optional< referral_code_details > get_referral_code_details( const database& db, referral_code_type code );
ledger_details                        get_ledger_details( const database& db );

uint64_t   remaining_seconds( const database& db, const account_name_type& account );
share_type reward_balance_of( const database& db, const account_name_type& account );
share_type creator_balance( const database& db );

} } // tempo::chain

FC_REFLECT( tempo::chain::subscription_details,
          (account)
          (token_id)
          (tier_id)
          (expires_at)
          (purchase_expires)
          (granted_seconds)
          (remaining_seconds)
          (active)
          (reward_shares)
          (reward_balance)
        )

FC_REFLECT( tempo::chain::tier_details, (tier_id)(params)(subscriber_count)(on_sale) )

FC_REFLECT( tempo::chain::reward_pool_details,
          (total_shares)
          (points_per_share)
          (allocated)
          (withdrawn)
          (balance)
          (curve_count)
          (slashable)
          (slash_grace_period_seconds)
        )

FC_REFLECT( tempo::chain::curve_details, (curve_id)(params)(current_period)(current_multiplier) )

FC_REFLECT( tempo::chain::referral_code_details, (code)(bps)(permanent)(restricted_account) )

FC_REFLECT( tempo::chain::ledger_details,
          (time)
          (ledger_account)
          (creator)
          (currency)
          (next_token_id)
          (total_supply)
          (global_supply_cap)
          (tier_count)
          (ledger_balance)
          (creator_balance)
          (reward_pool_balance)
        )
