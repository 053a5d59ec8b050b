#pragma once
#include <tempo/protocol/base.hpp>
#include <tempo/protocol/ledger_parameters.hpp>

namespace tempo { namespace protocol {

  /// Related to purchase_operation. Carries the outcome of the purchase.
  struct subscription_purchased_operation : public virtual_operation
  {
    subscription_purchased_operation() {}
    subscription_purchased_operation( const account_name_type& p, const account_name_type& a, tier_id_type t, token_id_type id,
      const share_type& amt, const share_type& net, const share_type& r, uint64_t s, const time_point_sec& exp )
      : payer( p ), account( a ), tier_id( t ), token_id( id ), amount( amt ), net_amount( net ), rewards( r ),
        seconds( s ), expires_at( exp ) {}

    account_name_type payer;
    account_name_type account;
    tier_id_type      tier_id = 0;
    token_id_type     token_id = 0;
    share_type        amount;
    /// amount left after protocol, client and referral fees
    share_type        net_amount;
    /// part of net_amount sent to the reward pool
    share_type        rewards;
    uint64_t          seconds = 0;
    time_point_sec    expires_at;
  };

  /// Related to purchase_operation. Generated for every nonzero fee leg.
  struct fee_transferred_operation : public virtual_operation
  {
    fee_transferred_operation() {}
    fee_transferred_operation( const account_name_type& a, const account_name_type& r, fee_leg l, const share_type& amt )
      : account( a ), recipient( r ), leg( l ), amount( amt ) {}

    account_name_type account; //(subscriber)
    account_name_type recipient;
    fee_leg           leg = protocol_fee_leg;
    share_type        amount;
  };

  /// Related to purchase_operation. Generated when a referrer receives a cut of the client fee.
  struct referral_paid_operation : public virtual_operation
  {
    referral_paid_operation() {}
    referral_paid_operation( const account_name_type& a, const account_name_type& r, referral_code_type c, const share_type& amt )
      : account( a ), referrer( r ), referral_code( c ), amount( amt ) {}

    account_name_type   account; //(subscriber)
    account_name_type   referrer;
    referral_code_type  referral_code = 0;
    share_type          amount;
  };

  /// Related to purchase_operation and grant_time_operation. Generated when an account gets its first token.
  struct subscription_minted_operation : public virtual_operation
  {
    subscription_minted_operation() {}
    subscription_minted_operation( const account_name_type& a, token_id_type id )
      : account( a ), token_id( id ) {}

    account_name_type account;
    token_id_type     token_id = 0;
  };

  struct time_granted_operation : public virtual_operation
  {
    time_granted_operation() {}
    time_granted_operation( const account_name_type& a, tier_id_type t, uint32_t s, const time_point_sec& exp )
      : account( a ), tier_id( t ), seconds( s ), expires_at( exp ) {}

    account_name_type account;
    tier_id_type      tier_id = 0;
    uint32_t          seconds = 0;
    time_point_sec    expires_at;
  };

  struct time_revoked_operation : public virtual_operation
  {
    time_revoked_operation() {}
    time_revoked_operation( const account_name_type& a, uint64_t s, const time_point_sec& exp )
      : account( a ), seconds( s ), expires_at( exp ) {}

    account_name_type account;
    /// time actually taken away, can be less than granted when part of it already elapsed
    uint64_t          seconds = 0;
    time_point_sec    expires_at;
  };

  struct subscription_refunded_operation : public virtual_operation
  {
    subscription_refunded_operation() {}
    subscription_refunded_operation( const account_name_type& a, const share_type& amt, uint64_t s, const time_point_sec& exp )
      : account( a ), amount( amt ), seconds( s ), expires_at( exp ) {}

    account_name_type account;
    share_type        amount;
    uint64_t          seconds = 0;
    time_point_sec    expires_at;
  };

  struct subscription_deactivated_operation : public virtual_operation
  {
    subscription_deactivated_operation() {}
    subscription_deactivated_operation( const account_name_type& a, tier_id_type t )
      : account( a ), tier_id( t ) {}

    account_name_type account;
    /// tier the subscription has left
    tier_id_type      tier_id = 0;
  };

  /// Related to transfer_subscription_operation.
  struct subscription_transferred_operation : public virtual_operation
  {
    subscription_transferred_operation() {}
    subscription_transferred_operation( const account_name_type& f, const account_name_type& t, token_id_type id )
      : from( f ), to( t ), token_id( id ) {}

    account_name_type from;
    account_name_type to;
    token_id_type     token_id = 0;
  };

  /// Related to purchase_operation and yield_rewards_operation. Generated when funds are spread over reward shares.
  struct rewards_allocated_operation : public virtual_operation
  {
    rewards_allocated_operation() {}
    rewards_allocated_operation( const account_name_type& p, const share_type& amt )
      : payer( p ), amount( amt ) {}

    account_name_type payer;
    share_type        amount;
  };

  struct reward_shares_issued_operation : public virtual_operation
  {
    reward_shares_issued_operation() {}
    reward_shares_issued_operation( const account_name_type& a, const share_type& amt, const uint128_t& s )
      : account( a ), amount( amt ), shares( s ) {}

    account_name_type account;
    /// amount the shares were issued for, 0 for raw issuance
    share_type        amount;
    uint128_t         shares = 0;
  };

  struct rewards_claimed_operation : public virtual_operation
  {
    rewards_claimed_operation() {}
    rewards_claimed_operation( const account_name_type& a, const share_type& amt )
      : account( a ), amount( amt ) {}

    account_name_type account;
    share_type        amount;
  };

  /// Related to slash_operation. Generated when the shares of a lapsed subscriber are burned.
  struct shares_slashed_operation : public virtual_operation
  {
    shares_slashed_operation() {}
    shares_slashed_operation( const account_name_type& a, const uint128_t& s, const share_type& amt )
      : account( a ), shares( s ), amount( amt ) {}

    account_name_type account;
    uint128_t         shares = 0;
    /// unclaimed rewards paid out together with the slash
    share_type        amount;
  };

  /// Related to slash_operation. Generated when the payout was rejected; the funds stay in the pool.
  struct slash_payout_failed_operation : public virtual_operation
  {
    slash_payout_failed_operation() {}
    slash_payout_failed_operation( const account_name_type& a, const share_type& amt )
      : account( a ), amount( amt ) {}

    account_name_type account;
    share_type        amount;
  };

  struct tier_created_operation : public virtual_operation
  {
    tier_created_operation() {}
    tier_created_operation( tier_id_type t, const tier_parameters& p )
      : tier_id( t ), params( p ) {}

    tier_id_type    tier_id = 0;
    tier_parameters params;
  };

  /// Related to update_tier_operation and set_tier_paused_operation.
  struct tier_updated_operation : public virtual_operation
  {
    tier_updated_operation() {}
    tier_updated_operation( tier_id_type t, const tier_parameters& p )
      : tier_id( t ), params( p ) {}

    tier_id_type    tier_id = 0;
    tier_parameters params;
  };

  struct reward_curve_created_operation : public virtual_operation
  {
    reward_curve_created_operation() {}
    reward_curve_created_operation( curve_id_type c, const curve_parameters& p )
      : curve_id( c ), params( p ) {}

    curve_id_type     curve_id = 0;
    curve_parameters  params;
  };

  struct referral_code_set_operation : public virtual_operation
  {
    referral_code_set_operation() {}
    referral_code_set_operation( referral_code_type c, uint16_t b, bool p, const account_name_type& r )
      : code( c ), bps( b ), permanent( p ), restricted_account( r ) {}

    referral_code_type  code = 0;
    uint16_t            bps = 0;
    bool                permanent = false;
    account_name_type   restricted_account;
  };

  struct referral_code_deleted_operation : public virtual_operation
  {
    referral_code_deleted_operation() {}
    referral_code_deleted_operation( referral_code_type c )
      : code( c ) {}

    referral_code_type  code = 0;
  };

  struct global_supply_cap_changed_operation : public virtual_operation
  {
    global_supply_cap_changed_operation() {}
    global_supply_cap_changed_operation( uint64_t c )
      : supply_cap( c ) {}

    uint64_t supply_cap = 0;
  };

  struct fee_recipient_changed_operation : public virtual_operation
  {
    fee_recipient_changed_operation() {}
    fee_recipient_changed_operation( fee_leg l, const account_name_type& o, const account_name_type& n )
      : leg( l ), old_recipient( o ), new_recipient( n ) {}

    fee_leg           leg = protocol_fee_leg;
    account_name_type old_recipient;
    account_name_type new_recipient;
  };

  struct creator_funds_withdrawn_operation : public virtual_operation
  {
    creator_funds_withdrawn_operation() {}
    creator_funds_withdrawn_operation( const account_name_type& t, const share_type& amt )
      : to( t ), amount( amt ) {}

    account_name_type to;
    share_type        amount;
  };

} } //tempo::protocol

FC_REFLECT( tempo::protocol::subscription_purchased_operation, (payer)(account)(tier_id)(token_id)(amount)(net_amount)(rewards)(seconds)(expires_at) )
FC_REFLECT( tempo::protocol::fee_transferred_operation, (account)(recipient)(leg)(amount) )
FC_REFLECT( tempo::protocol::referral_paid_operation, (account)(referrer)(referral_code)(amount) )
FC_REFLECT( tempo::protocol::subscription_minted_operation, (account)(token_id) )
FC_REFLECT( tempo::protocol::time_granted_operation, (account)(tier_id)(seconds)(expires_at) )
FC_REFLECT( tempo::protocol::time_revoked_operation, (account)(seconds)(expires_at) )
FC_REFLECT( tempo::protocol::subscription_refunded_operation, (account)(amount)(seconds)(expires_at) )
FC_REFLECT( tempo::protocol::subscription_deactivated_operation, (account)(tier_id) )
FC_REFLECT( tempo::protocol::subscription_transferred_operation, (from)(to)(token_id) )
FC_REFLECT( tempo::protocol::rewards_allocated_operation, (payer)(amount) )
FC_REFLECT( tempo::protocol::reward_shares_issued_operation, (account)(amount)(shares) )
FC_REFLECT( tempo::protocol::rewards_claimed_operation, (account)(amount) )
FC_REFLECT( tempo::protocol::shares_slashed_operation, (account)(shares)(amount) )
FC_REFLECT( tempo::protocol::slash_payout_failed_operation, (account)(amount) )
FC_REFLECT( tempo::protocol::tier_created_operation, (tier_id)(params) )
FC_REFLECT( tempo::protocol::tier_updated_operation, (tier_id)(params) )
FC_REFLECT( tempo::protocol::reward_curve_created_operation, (curve_id)(params) )
FC_REFLECT( tempo::protocol::referral_code_set_operation, (code)(bps)(permanent)(restricted_account) )
FC_REFLECT( tempo::protocol::referral_code_deleted_operation, (code) )
FC_REFLECT( tempo::protocol::global_supply_cap_changed_operation, (supply_cap) )
FC_REFLECT( tempo::protocol::fee_recipient_changed_operation, (leg)(old_recipient)(new_recipient) )
FC_REFLECT( tempo::protocol::creator_funds_withdrawn_operation, (to)(amount) )
