#include <boost/test/unit_test.hpp>

#include <tempo/chain/database.hpp>
#include <tempo/chain/ledger_objects.hpp>

#include "../db_fixture/database_fixture.hpp"

using namespace tempo;
using namespace tempo::chain;
using namespace tempo::protocol;

namespace
{
  const uint32_t day = TEMPO_ONE_DAY_SECONDS;
}

BOOST_FIXTURE_TEST_SUITE( subscription_tests, database_fixture )

BOOST_AUTO_TEST_CASE( first_purchase_mints_and_buys_one_period )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: fresh account buying exactly one period" );

    purchase( "alice", 1000 );

    const auto& sub = get_subscription( "alice" );
    BOOST_REQUIRE_EQUAL( sub.tier_id, 1 );
    BOOST_REQUIRE_EQUAL( sub.token_id, 1u );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 30u * day );
    BOOST_REQUIRE( sub.expires_at == time_point_sec( genesis_timestamp + 30 * day ) );
    BOOST_REQUIRE( sub.purchase_expires == sub.expires_at );
    BOOST_REQUIRE_EQUAL( sub.granted_seconds, 0u );

    BOOST_REQUIRE_EQUAL( balance( "alice" ).value, 0 );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 1000 );
    BOOST_REQUIRE_EQUAL( db->get_creator_balance().value, 1000 );
    BOOST_REQUIRE_EQUAL( db->get_dynamic_global_properties().total_supply, 1u );
    BOOST_REQUIRE_EQUAL( db->get_tier( 1 ).subscriber_count, 1u );
    BOOST_REQUIRE( identities->minted[ 1 ] == "alice" );

    const auto minted = get_events< subscription_minted_operation >();
    BOOST_REQUIRE_EQUAL( minted.size(), 1u );
    BOOST_REQUIRE_EQUAL( minted[0].token_id, 1u );

    const auto purchased = get_events< subscription_purchased_operation >();
    BOOST_REQUIRE_EQUAL( purchased.size(), 1u );
    BOOST_REQUIRE( purchased[0].account == "alice" );
    BOOST_REQUIRE_EQUAL( purchased[0].seconds, 30u * day );
    BOOST_REQUIRE_EQUAL( purchased[0].net_amount.value, 1000 );
    BOOST_REQUIRE_EQUAL( purchased[0].rewards.value, 0 );
    BOOST_REQUIRE( purchased[0].expires_at == sub.expires_at );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( joining_requires_a_full_period )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: half a period is rejected instead of granted partially" );

    fund( "alice", 500 );
    TEMPO_REQUIRE_THROW( push( make_purchase( "alice", 500 ) ), insufficient_funds_exception );

    BOOST_REQUIRE( db->find_subscription( "alice" ) == nullptr );
    BOOST_REQUIRE_EQUAL( balance( "alice" ).value, 500 );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 0 );
    BOOST_REQUIRE_EQUAL( db->get_dynamic_global_properties().total_supply, 0u );
    BOOST_REQUIRE( events.empty() );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( renewal_extends_from_expiration )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: partial renewal of an active subscription" );

    purchase( "alice", 1000 );
    advance_time( 10 * day );

    purchase( "alice", 500 );

    const auto& sub = get_subscription( "alice" );
    BOOST_REQUIRE( sub.expires_at == time_point_sec( genesis_timestamp + 45 * day ) );
    BOOST_REQUIRE( sub.purchase_expires == sub.expires_at );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 35u * day );
    BOOST_REQUIRE_EQUAL( sub.token_id, 1u );
    BOOST_REQUIRE_EQUAL( db->get_dynamic_global_properties().total_supply, 1u );
    BOOST_REQUIRE_EQUAL( get_events< subscription_minted_operation >().size(), 1u );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( lapsed_renewal_starts_now )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: renewal of an expired subscription" );

    purchase( "alice", 1000 );
    advance_time( 31 * day );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 0u );

    fund( "alice", 500 );
    TEMPO_REQUIRE_THROW( push( make_purchase( "alice", 500 ) ), insufficient_funds_exception );

    fund( "alice", 500 );
    push( make_purchase( "alice", 1000 ) );

    const auto& sub = get_subscription( "alice" );
    BOOST_REQUIRE( sub.expires_at == now() + 30 * day );
    BOOST_REQUIRE_EQUAL( db->get_tier( 1 ).subscriber_count, 1u );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( mint_price_is_charged_once )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: initial mint price" );

    auto genesis = default_genesis();
    genesis.initial_tier.initial_mint_price = 500;
    reopen( genesis );

    fund( "bob", 400 );
    TEMPO_REQUIRE_THROW( push( make_purchase( "bob", 400 ) ), insufficient_funds_exception );
    fund( "bob", 600 );
    TEMPO_REQUIRE_THROW( push( make_purchase( "bob", 1000 ) ), insufficient_funds_exception );

    purchase( "alice", 1500 );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 30u * day );

    purchase( "alice", 1000 );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 60u * day );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 2500 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( max_commitment )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: committed time cannot exceed the tier limit" );

    auto genesis = default_genesis();
    genesis.initial_tier.max_commitment_seconds = 60 * day;
    reopen( genesis );

    fund( "alice", 3000 );
    TEMPO_REQUIRE_THROW( push( make_purchase( "alice", 3000 ) ), capacity_exceeded_exception );
    BOOST_REQUIRE( db->find_subscription( "alice" ) == nullptr );

    push( make_purchase( "alice", 2000 ) );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 60u * day );
    TEMPO_REQUIRE_THROW( push( make_purchase( "alice", 1000 ) ), capacity_exceeded_exception );

    advance_time( 30 * day );
    push( make_purchase( "alice", 1000 ) );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 60u * day );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( tier_switch_converts_remaining_time )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: switching to a more expensive tier" );

    const tier_id_type premium = create_tier( make_tier( 2000 ) );
    BOOST_REQUIRE_EQUAL( premium, 2 );

    purchase( "alice", 1000 );
    advance_time( 10 * day );

    // 20 days left on tier 1 are worth 10 days on tier 2
    purchase( "alice", 2000, premium );

    const auto& sub = get_subscription( "alice" );
    BOOST_REQUIRE_EQUAL( sub.tier_id, premium );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 40u * day );
    BOOST_REQUIRE( sub.purchase_expires == sub.expires_at );
    BOOST_REQUIRE_EQUAL( db->get_tier( 1 ).subscriber_count, 0u );
    BOOST_REQUIRE_EQUAL( db->get_tier( premium ).subscriber_count, 1u );

    BOOST_TEST_MESSAGE( "--- Switching back requires the owner" );
    fund( "bob", 1000 );
    auto op = make_purchase( "alice", 1000, 1 );
    op.payer = "bob";
    op.attached_value = 1000;
    TEMPO_REQUIRE_THROW( push( op ), tier_invalid_switch_exception );
    BOOST_REQUIRE_EQUAL( balance( "bob" ).value, 1000 );

    BOOST_TEST_MESSAGE( "--- Anyone can renew the current tier" );
    fund( "bob", 1000 );
    op = make_purchase( "alice", 2000, premium );
    op.payer = "bob";
    push( op );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 70u * day );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( grant_and_revoke )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: granted time is revocable, paid time is not" );

    grant( "alice", 10 * day );
    {
      const auto& sub = get_subscription( "alice" );
      BOOST_REQUIRE_EQUAL( sub.token_id, 1u );
      BOOST_REQUIRE_EQUAL( sub.tier_id, 1 );
      BOOST_REQUIRE_EQUAL( sub.granted_seconds, 10u * day );
      BOOST_REQUIRE( sub.purchase_expires == time_point_sec() );
      BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 10u * day );
    }
    BOOST_REQUIRE_EQUAL( get_events< time_granted_operation >().size(), 1u );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 0 );

    purchase( "alice", 1000 );
    {
      const auto& sub = get_subscription( "alice" );
      BOOST_REQUIRE( sub.expires_at == time_point_sec( genesis_timestamp + 40 * day ) );
      BOOST_REQUIRE( sub.purchase_expires == time_point_sec( genesis_timestamp + 30 * day ) );
    }

    revoke_time_operation op;
    op.caller = agent;
    op.account = "alice";
    push( op );

    const auto& sub = get_subscription( "alice" );
    BOOST_REQUIRE( sub.expires_at == time_point_sec( genesis_timestamp + 30 * day ) );
    BOOST_REQUIRE_EQUAL( sub.granted_seconds, 0u );

    const auto revoked = get_events< time_revoked_operation >();
    BOOST_REQUIRE_EQUAL( revoked.size(), 1u );
    BOOST_REQUIRE_EQUAL( revoked[0].seconds, 10u * day );

    BOOST_TEST_MESSAGE( "--- Second revoke removes nothing" );
    push( op );
    BOOST_REQUIRE( get_subscription( "alice" ).expires_at == time_point_sec( genesis_timestamp + 30 * day ) );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( revoke_after_partial_use )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: revoking a partially consumed grant" );

    grant( "alice", 10 * day );
    advance_time( 4 * day );

    revoke_time_operation op;
    op.caller = agent;
    op.account = "alice";
    push( op );

    BOOST_REQUIRE( get_subscription( "alice" ).expires_at == now() );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 0u );
    BOOST_REQUIRE_EQUAL( get_events< time_revoked_operation >()[0].seconds, 6u * day );

    BOOST_TEST_MESSAGE( "--- Revoking without a subscription" );
    op.account = "bob";
    TEMPO_REQUIRE_THROW( push( op ), state_conflict_exception );

    BOOST_TEST_MESSAGE( "--- Revoking requires the agent role" );
    op.account = "alice";
    op.caller = "alice";
    TEMPO_REQUIRE_THROW( push( op ), authorization_exception );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( grant_ignores_pause_and_sale_window )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: agents grant time on tiers closed for sale" );

    set_tier_paused_operation pause;
    pause.caller = manager;
    pause.tier_id = 1;
    push( pause );

    fund( "alice", 1000 );
    TEMPO_REQUIRE_THROW( push( make_purchase( "alice", 1000 ) ), state_conflict_exception );

    grant( "alice", 5 * day );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 5u * day );

    auto params = make_tier( 0 );
    params.end_time = now() + day;
    const tier_id_type grant_only = create_tier( params );
    advance_time( 2 * day );

    grant( "bob", 5 * day, grant_only );
    BOOST_REQUIRE_EQUAL( get_subscription( "bob" ).tier_id, grant_only );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( refund_removes_paid_time )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: refund" );

    purchase( "alice", 1000 );

    refund_subscription_operation op;
    op.caller = manager;
    op.account = "alice";
    op.amount = 500;
    push( op );

    const auto& sub = get_subscription( "alice" );
    BOOST_REQUIRE( sub.expires_at == time_point_sec( genesis_timestamp + 15 * day ) );
    BOOST_REQUIRE( sub.purchase_expires == time_point_sec( genesis_timestamp + 15 * day ) );
    BOOST_REQUIRE_EQUAL( balance( "alice" ).value, 500 );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 500 );

    const auto refunded = get_events< subscription_refunded_operation >();
    BOOST_REQUIRE_EQUAL( refunded.size(), 1u );
    BOOST_REQUIRE_EQUAL( refunded[0].seconds, 15u * day );

    BOOST_TEST_MESSAGE( "--- Creator balance limits the refund" );
    op.amount = 600;
    TEMPO_REQUIRE_THROW( push( op ), insufficient_funds_exception );

    BOOST_TEST_MESSAGE( "--- Agents can refund too, others cannot" );
    op.amount = 100;
    op.caller = agent;
    push( op );
    op.caller = "alice";
    TEMPO_REQUIRE_THROW( push( op ), authorization_exception );

    BOOST_TEST_MESSAGE( "--- Account without subscription" );
    op.caller = manager;
    op.account = "bob";
    TEMPO_REQUIRE_THROW( push( op ), state_conflict_exception );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( refund_keeps_granted_time )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: refund never exceeds the paid time" );

    grant( "alice", 10 * day );
    purchase( "alice", 1000 );
    fund( ledger_account, 1000 );

    refund_subscription_operation op;
    op.caller = manager;
    op.account = "alice";
    op.amount = 2000;
    push( op );

    const auto& sub = get_subscription( "alice" );
    BOOST_REQUIRE( sub.expires_at == time_point_sec( genesis_timestamp + 10 * day ) );
    BOOST_REQUIRE_EQUAL( get_events< subscription_refunded_operation >()[0].seconds, 30u * day );
    BOOST_REQUIRE_EQUAL( balance( "alice" ).value, 2000 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( deactivate_expired_subscription )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: deactivation frees the tier slot" );

    purchase( "alice", 1000 );

    deactivate_subscription_operation op;
    op.account = "alice";
    TEMPO_REQUIRE_THROW( push( op ), state_conflict_exception );

    advance_time( 30 * day );
    TEMPO_REQUIRE_THROW( push( op ), state_conflict_exception );

    advance_time( 1 );
    push( op );

    {
      const auto& sub = get_subscription( "alice" );
      BOOST_REQUIRE_EQUAL( sub.tier_id, 0 );
      BOOST_REQUIRE_EQUAL( sub.token_id, 1u );
      BOOST_REQUIRE_EQUAL( db->get_tier( 1 ).subscriber_count, 0u );
      BOOST_REQUIRE_EQUAL( db->get_dynamic_global_properties().total_supply, 1u );
    }
    BOOST_REQUIRE_EQUAL( get_events< subscription_deactivated_operation >().size(), 1u );

    BOOST_TEST_MESSAGE( "--- Deactivating again changes nothing" );
    push( op );
    BOOST_REQUIRE_EQUAL( get_events< subscription_deactivated_operation >().size(), 1u );

    op.account = "bob";
    push( op );

    BOOST_TEST_MESSAGE( "--- Coming back keeps the token" );
    purchase( "alice", 1000 );
    const auto& sub = get_subscription( "alice" );
    BOOST_REQUIRE_EQUAL( sub.tier_id, 1 );
    BOOST_REQUIRE_EQUAL( sub.token_id, 1u );
    BOOST_REQUIRE( sub.expires_at == now() + 30 * day );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( transfer_moves_the_subscription )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: subscription token transfer" );

    purchase( "alice", 1000 );
    const auto expires_at = get_subscription( "alice" ).expires_at;

    transfer_subscription_operation op;
    op.caller = identity;
    op.from = "alice";
    op.to = "bob";
    push( op );

    const auto& bob = get_subscription( "bob" );
    BOOST_REQUIRE_EQUAL( bob.token_id, 1u );
    BOOST_REQUIRE_EQUAL( bob.tier_id, 1 );
    BOOST_REQUIRE( bob.expires_at == expires_at );

    const auto* alice = db->find_subscription( "alice" );
    BOOST_REQUIRE( alice != nullptr );
    BOOST_REQUIRE( !alice->has_token() );
    BOOST_REQUIRE( !alice->in_tier() );
    BOOST_REQUIRE_EQUAL( db->get_remaining_seconds( "alice" ), 0u );
    TEMPO_REQUIRE_THROW( get_subscription( "alice" ), state_conflict_exception );

    BOOST_REQUIRE_EQUAL( db->get_dynamic_global_properties().total_supply, 1u );
    BOOST_REQUIRE_EQUAL( db->get_tier( 1 ).subscriber_count, 1u );
    BOOST_REQUIRE_EQUAL( get_events< subscription_transferred_operation >().size(), 1u );

    BOOST_TEST_MESSAGE( "--- Token ids are never reused" );
    purchase( "alice", 1000 );
    BOOST_REQUIRE_EQUAL( get_subscription( "alice" ).token_id, 2u );
    BOOST_REQUIRE_EQUAL( db->get_tier( 1 ).subscriber_count, 2u );

    BOOST_TEST_MESSAGE( "--- Receiver already holding a token" );
    TEMPO_REQUIRE_THROW( push( op ), state_conflict_exception );

    BOOST_TEST_MESSAGE( "--- Only the identity layer applies transfers" );
    op.caller = "alice";
    op.to = "carol";
    TEMPO_REQUIRE_THROW( push( op ), authorization_exception );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( transfer_of_bound_tier )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: non-transferable tier" );

    auto params = make_tier( 1000 );
    params.transferable = false;
    const tier_id_type bound = create_tier( params );

    purchase( "alice", 1000, bound );

    transfer_subscription_operation op;
    op.caller = identity;
    op.from = "alice";
    op.to = "bob";
    TEMPO_REQUIRE_THROW( push( op ), state_conflict_exception );
    BOOST_REQUIRE_EQUAL( get_subscription( "alice" ).token_id, 1u );
    BOOST_REQUIRE( db->find_subscription( "bob" ) == nullptr );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
