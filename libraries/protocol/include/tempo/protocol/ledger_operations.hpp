#pragma once
#include <tempo/protocol/base.hpp>
#include <tempo/protocol/operation_util.hpp>
#include <tempo/protocol/ledger_parameters.hpp>

namespace tempo { namespace protocol {

/**
  * Buys time on a tier. The payer funds the purchase, the account receives the time and the
  * reward shares. With the native currency `attached_value` has to match `amount` exactly,
  * with a fungible token it has to be zero and the amount is pulled from the payer.
  */
struct purchase_operation : public base_operation
{
  account_name_type   payer;
  account_name_type   account;
  /// 0 - keep the current tier, or the first tier for a new subscriber
  tier_id_type        tier_id = 0;
  share_type          amount = 0;
  share_type          attached_value = 0;
  /// 0 - no code
  referral_code_type  referral_code = 0;
  account_name_type   referrer;

  void validate()const;
};

struct grant_time_operation : public base_operation
{
  account_name_type   caller;
  account_name_type   account;
  uint32_t            seconds = 0;
  tier_id_type        tier_id = 0;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_AGENT; }
};

/// Takes back the granted part of the remaining time, paid time is never touched.
struct revoke_time_operation : public base_operation
{
  account_name_type   caller;
  account_name_type   account;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_AGENT; }
};

struct refund_subscription_operation : public base_operation
{
  account_name_type   caller;
  account_name_type   account;
  share_type          amount = 0;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const
  {
    a[ caller ] |= TEMPO_ROLE_MANAGER | TEMPO_ROLE_AGENT;
  }
};

/// Releases the tier slot of an expired subscription. Anyone can call it.
struct deactivate_subscription_operation : public base_operation
{
  account_name_type   account;

  void validate()const;
};

/// Sends funds straight into the reward pool. Requires outstanding shares.
struct yield_rewards_operation : public base_operation
{
  account_name_type   payer;
  share_type          amount = 0;
  share_type          attached_value = 0;

  void validate()const;
};

struct claim_rewards_operation : public base_operation
{
  account_name_type   account;

  void validate()const;
};

struct slash_operation : public base_operation
{
  account_name_type   account;

  void validate()const;
};

struct create_tier_operation : public base_operation
{
  account_name_type   caller;
  tier_parameters     params;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_MANAGER; }
};

/// Overwrites all parameters of the tier. Current subscriber count is preserved.
struct update_tier_operation : public base_operation
{
  account_name_type   caller;
  tier_id_type        tier_id = 0;
  tier_parameters     params;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_MANAGER; }
};

struct set_tier_paused_operation : public base_operation
{
  account_name_type   caller;
  tier_id_type        tier_id = 0;
  bool                paused = true;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_MANAGER; }
};

struct create_reward_curve_operation : public base_operation
{
  account_name_type   caller;
  curve_parameters    params;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_MANAGER; }
};

struct set_referral_code_operation : public base_operation
{
  account_name_type   caller;
  referral_code_type  code = 0;
  uint16_t            bps = 0;
  /// once set the code can be neither changed nor deleted
  bool                permanent = false;
  /// when set only this referrer can use the code
  account_name_type   restricted_account;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_MANAGER; }
};

struct delete_referral_code_operation : public base_operation
{
  account_name_type   caller;
  referral_code_type  code = 0;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_MANAGER; }
};

struct set_global_supply_cap_operation : public base_operation
{
  account_name_type   caller;
  /// 0 - unlimited
  uint64_t            supply_cap = 0;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_MANAGER; }
};

/// Issues raw reward shares without payment.
struct issue_reward_shares_operation : public base_operation
{
  account_name_type   caller;
  account_name_type   account;
  uint64_t            shares = 0;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_MANAGER; }
};

struct withdraw_creator_funds_operation : public base_operation
{
  account_name_type   caller;
  account_name_type   to;
  share_type          amount = 0;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_MANAGER; }
};

/**
  * Hands a fee leg over to another recipient. Only the current recipient of the leg can do it.
  * An empty new recipient switches the leg off.
  */
struct update_fee_recipient_operation : public base_operation
{
  account_name_type   caller;
  fee_leg             leg = protocol_fee_leg;
  account_name_type   new_recipient;

  void validate()const;
};

/// Applied by the identity layer right before a subscription token changes hands.
struct transfer_subscription_operation : public base_operation
{
  /// the identity layer account
  account_name_type   caller;
  account_name_type   from;
  account_name_type   to;

  void validate()const;

  void get_required_roles( flat_map< account_name_type, role_mask_type >& a )const { a[ caller ] |= TEMPO_ROLE_IDENTITY; }
};

} } // tempo::protocol

FC_REFLECT( tempo::protocol::purchase_operation, (payer)(account)(tier_id)(amount)(attached_value)(referral_code)(referrer) )
FC_REFLECT( tempo::protocol::grant_time_operation, (caller)(account)(seconds)(tier_id) )
FC_REFLECT( tempo::protocol::revoke_time_operation, (caller)(account) )
FC_REFLECT( tempo::protocol::refund_subscription_operation, (caller)(account)(amount) )
FC_REFLECT( tempo::protocol::deactivate_subscription_operation, (account) )
FC_REFLECT( tempo::protocol::yield_rewards_operation, (payer)(amount)(attached_value) )
FC_REFLECT( tempo::protocol::claim_rewards_operation, (account) )
FC_REFLECT( tempo::protocol::slash_operation, (account) )
FC_REFLECT( tempo::protocol::create_tier_operation, (caller)(params) )
FC_REFLECT( tempo::protocol::update_tier_operation, (caller)(tier_id)(params) )
FC_REFLECT( tempo::protocol::set_tier_paused_operation, (caller)(tier_id)(paused) )
FC_REFLECT( tempo::protocol::create_reward_curve_operation, (caller)(params) )
FC_REFLECT( tempo::protocol::set_referral_code_operation, (caller)(code)(bps)(permanent)(restricted_account) )
FC_REFLECT( tempo::protocol::delete_referral_code_operation, (caller)(code) )
FC_REFLECT( tempo::protocol::set_global_supply_cap_operation, (caller)(supply_cap) )
FC_REFLECT( tempo::protocol::issue_reward_shares_operation, (caller)(account)(shares) )
FC_REFLECT( tempo::protocol::withdraw_creator_funds_operation, (caller)(to)(amount) )
FC_REFLECT( tempo::protocol::update_fee_recipient_operation, (caller)(leg)(new_recipient) )
FC_REFLECT( tempo::protocol::transfer_subscription_operation, (caller)(from)(to) )
