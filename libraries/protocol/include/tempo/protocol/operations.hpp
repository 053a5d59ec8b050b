#pragma once

#include <tempo/protocol/types.hpp>

#include <tempo/protocol/operation_util.hpp>
#include <tempo/protocol/ledger_operations.hpp>
#include <tempo/protocol/ledger_virtual_operations.hpp>

namespace tempo { namespace protocol {

  /// NOTE: the position in the variant is the serialized tag, do not reorder
  typedef fc::static_variant<
        purchase_operation,
        grant_time_operation,
        revoke_time_operation,
        refund_subscription_operation,
        deactivate_subscription_operation,
        yield_rewards_operation,
        claim_rewards_operation,
        slash_operation,
        create_tier_operation,
        update_tier_operation,
        set_tier_paused_operation,
        create_reward_curve_operation,
        set_referral_code_operation,
        delete_referral_code_operation,
        set_global_supply_cap_operation,
        issue_reward_shares_operation,
        withdraw_creator_funds_operation,
        update_fee_recipient_operation,
        transfer_subscription_operation,

        /// virtual operations below this point
        subscription_purchased_operation, // last_regular + 1
        fee_transferred_operation,
        referral_paid_operation,
        subscription_minted_operation,
        time_granted_operation, // last_regular + 5
        time_revoked_operation,
        subscription_refunded_operation,
        subscription_deactivated_operation,
        subscription_transferred_operation,
        rewards_allocated_operation, // last_regular + 10
        reward_shares_issued_operation,
        rewards_claimed_operation,
        shares_slashed_operation,
        slash_payout_failed_operation,
        tier_created_operation, // last_regular + 15
        tier_updated_operation,
        reward_curve_created_operation,
        referral_code_set_operation,
        referral_code_deleted_operation,
        global_supply_cap_changed_operation, // last_regular + 20
        fee_recipient_changed_operation,
        creator_funds_withdrawn_operation
      > operation;

  bool is_virtual_operation( const operation& op );

} } // tempo::protocol

TEMPO_DECLARE_OPERATION_TYPE( tempo::protocol::operation )
FC_REFLECT_TYPENAME( tempo::protocol::operation )
