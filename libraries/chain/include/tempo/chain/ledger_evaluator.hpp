#pragma once

#include <tempo/protocol/ledger_operations.hpp>

#include <tempo/chain/evaluator.hpp>

namespace tempo { namespace chain {

using namespace tempo::protocol;

TEMPO_DEFINE_EVALUATOR( purchase )
TEMPO_DEFINE_EVALUATOR( grant_time )
TEMPO_DEFINE_EVALUATOR( revoke_time )
TEMPO_DEFINE_EVALUATOR( refund_subscription )
TEMPO_DEFINE_EVALUATOR( deactivate_subscription )
TEMPO_DEFINE_EVALUATOR( yield_rewards )
TEMPO_DEFINE_EVALUATOR( claim_rewards )
TEMPO_DEFINE_EVALUATOR( slash )
TEMPO_DEFINE_EVALUATOR( create_tier )
TEMPO_DEFINE_EVALUATOR( update_tier )
TEMPO_DEFINE_EVALUATOR( set_tier_paused )
TEMPO_DEFINE_EVALUATOR( create_reward_curve )
TEMPO_DEFINE_EVALUATOR( set_referral_code )
TEMPO_DEFINE_EVALUATOR( delete_referral_code )
TEMPO_DEFINE_EVALUATOR( set_global_supply_cap )
TEMPO_DEFINE_EVALUATOR( issue_reward_shares )
TEMPO_DEFINE_EVALUATOR( withdraw_creator_funds )
TEMPO_DEFINE_EVALUATOR( update_fee_recipient )
TEMPO_DEFINE_EVALUATOR( transfer_subscription )

} } // tempo::chain
