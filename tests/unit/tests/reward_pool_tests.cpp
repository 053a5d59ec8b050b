#include <boost/test/unit_test.hpp>

#include <tempo/chain/database.hpp>
#include <tempo/chain/detail_views.hpp>

#include "../db_fixture/database_fixture.hpp"

using namespace tempo;
using namespace tempo::chain;
using namespace tempo::protocol;

struct slashable_pool_fixture : public database_fixture
{
  slashable_pool_fixture()
  {
    auto genesis = default_genesis();
    genesis.rewards.slashable = true;
    genesis.rewards.slash_grace_period_seconds = 7 * TEMPO_ONE_DAY_SECONDS;
    reopen( genesis );
  }

  void slash( const account_name_type& account )
  {
    slash_operation op;
    op.account = account;
    push( op );
  }
};

BOOST_FIXTURE_TEST_SUITE( reward_pool_tests, database_fixture )

BOOST_AUTO_TEST_CASE( yield_requires_shares )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: yield with no outstanding shares" );

    fund( "sponsor", 100 );
    yield_rewards_operation op;
    op.payer = "sponsor";
    op.amount = 100;
    op.attached_value = 100;
    TEMPO_REQUIRE_THROW( push( op ), not_eligible_exception );

    BOOST_REQUIRE_EQUAL( balance( "sponsor" ).value, 100 );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 0 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( yield_is_split_by_shares )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: rewards proportional to shares" );

    issue_shares( "alice", 100 );
    issue_shares( "bob", 300 );
    yield( "sponsor", 400 );

    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "alice" ).value, 100 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "bob" ).value, 300 );
    BOOST_REQUIRE_EQUAL( db->get_reward_pool().get_balance().value, 400 );
    BOOST_REQUIRE_EQUAL( db->get_creator_balance().value, 0 );

    const auto allocated = get_events< rewards_allocated_operation >();
    BOOST_REQUIRE_EQUAL( allocated.size(), 1u );
    BOOST_REQUIRE( allocated[0].payer == "sponsor" );
    BOOST_REQUIRE_EQUAL( allocated[0].amount.value, 400 );

    claim( "alice" );
    BOOST_REQUIRE_EQUAL( balance( "alice" ).value, 100 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "alice" ).value, 0 );
    BOOST_REQUIRE_EQUAL( db->get_reward_pool().withdrawn.value, 100 );

    BOOST_TEST_MESSAGE( "--- Second claim pays nothing" );
    claim( "alice" );
    BOOST_REQUIRE_EQUAL( balance( "alice" ).value, 100 );
    BOOST_REQUIRE_EQUAL( get_events< rewards_claimed_operation >().size(), 1u );

    claim( "nobody" );

    claim( "bob" );
    BOOST_REQUIRE_EQUAL( balance( "bob" ).value, 300 );
    BOOST_REQUIRE_EQUAL( db->get_reward_pool().get_balance().value, 0 );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 0 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( late_holder_gets_only_new_rewards )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: shares do not earn rewards allocated before their issuance" );

    issue_shares( "alice", 100 );
    yield( "sponsor", 100 );

    issue_shares( "bob", 100 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "bob" ).value, 0 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "alice" ).value, 100 );

    yield( "sponsor", 100 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "alice" ).value, 150 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "bob" ).value, 50 );

    BOOST_TEST_MESSAGE( "--- Topping up keeps the earned part" );
    issue_shares( "alice", 200 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "alice" ).value, 150 );
    BOOST_REQUIRE( get_shares( "alice" ) == uint128_t( 300 ) );

    yield( "sponsor", 400 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "alice" ).value, 450 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "bob" ).value, 150 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( rounding_dust_stays_in_pool )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: entitlements never exceed the pool" );

    issue_shares( "alice", 1 );
    issue_shares( "bob", 1 );
    issue_shares( "carol", 1 );
    yield( "sponsor", 100 );

    for( const char* account : { "alice", "bob", "carol" } )
    {
      BOOST_REQUIRE_EQUAL( db->get_reward_balance( account ).value, 33 );
      claim( account );
      BOOST_REQUIRE_EQUAL( balance( account ).value, 33 );
    }

    BOOST_REQUIRE_EQUAL( db->get_reward_pool().get_balance().value, 1 );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 1 );
    BOOST_REQUIRE_EQUAL( db->get_creator_balance().value, 0 );

    BOOST_TEST_MESSAGE( "--- Many uneven yields" );
    issue_shares( "dave", 7 );
    for( int i = 1; i <= 20; ++i )
    {
      yield( "sponsor", i * 13 );
      validate_database();
    }
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( creator_balance_excludes_pool )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: creator balance and withdraw_creator_funds" );

    purchase( "alice", 1000 );
    issue_shares( "alice", 1 );
    yield( "sponsor", 500 );

    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 1500 );
    BOOST_REQUIRE_EQUAL( db->get_creator_balance().value, 1000 );
    BOOST_REQUIRE_EQUAL( creator_balance( *db ).value, 1000 );
    BOOST_REQUIRE_EQUAL( get_ledger_details( *db ).reward_pool_balance.value, 500 );

    withdraw_creator_funds_operation op;
    op.caller = manager;
    op.to = creator;
    op.amount = 1001;
    TEMPO_REQUIRE_THROW( push( op ), insufficient_funds_exception );

    op.amount = 600;
    op.caller = agent;
    TEMPO_REQUIRE_THROW( push( op ), authorization_exception );

    BOOST_TEST_MESSAGE( "--- Rejected transfer rolls back" );
    op.caller = manager;
    ledger->book.set_frozen( creator, true );
    TEMPO_REQUIRE_THROW( push( op ), transfer_failed_exception );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 1500 );
    ledger->book.set_frozen( creator, false );

    push( op );
    BOOST_REQUIRE_EQUAL( balance( creator ).value, 600 );
    BOOST_REQUIRE_EQUAL( db->get_creator_balance().value, 400 );
    BOOST_REQUIRE_EQUAL( get_events< creator_funds_withdrawn_operation >().size(), 1u );

    // the pool is never touched
    claim( "alice" );
    BOOST_REQUIRE_EQUAL( balance( "alice" ).value, 500 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( transfer_moves_reward_position )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: shares and unclaimed rewards follow the token" );

    purchase( "alice", 1000 );
    issue_shares( "alice", 100 );
    issue_shares( "carol", 100 );
    yield( "sponsor", 200 );

    transfer_subscription_operation op;
    op.caller = identity;
    op.from = "alice";
    op.to = "bob";
    push( op );

    BOOST_REQUIRE( get_shares( "alice" ) == uint128_t( 0 ) );
    BOOST_REQUIRE( get_shares( "bob" ) == uint128_t( 100 ) );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "alice" ).value, 0 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "bob" ).value, 100 );

    yield( "sponsor", 200 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "bob" ).value, 200 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "carol" ).value, 200 );

    const auto details = get_subscription_details( *db, "bob" );
    BOOST_REQUIRE( details.reward_shares == uint128_t( 100 ) );
    BOOST_REQUIRE_EQUAL( details.reward_balance.value, 200 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( slash_on_unslashable_pool )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: slash is disabled unless configured" );

    issue_shares( "alice", 100 );
    advance_time( 365 * TEMPO_ONE_DAY_SECONDS );

    slash_operation op;
    op.account = "alice";
    TEMPO_REQUIRE_THROW( push( op ), not_slashable_exception );
    BOOST_REQUIRE( get_shares( "alice" ) == uint128_t( 100 ) );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE( slash_tests, slashable_pool_fixture )

BOOST_AUTO_TEST_CASE( slash_after_grace_period )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: lapsed subscriber loses shares after the grace period" );

    purchase( "alice", 1000 );
    issue_shares( "alice", 100 );
    issue_shares( "bob", 100 );
    yield( "sponsor", 200 );

    advance_time( thirty_days + 6 * TEMPO_ONE_DAY_SECONDS );
    TEMPO_REQUIRE_THROW( slash( "alice" ), not_slashable_exception );

    advance_time( 2 * TEMPO_ONE_DAY_SECONDS );
    slash( "alice" );

    BOOST_REQUIRE( get_shares( "alice" ) == uint128_t( 0 ) );
    BOOST_REQUIRE( db->get_reward_pool().total_shares == uint128_t( 100 ) );
    BOOST_REQUIRE_EQUAL( balance( "alice" ).value, 100 );
    BOOST_REQUIRE_EQUAL( db->get_reward_pool().get_balance().value, 100 );

    const auto slashed = get_events< shares_slashed_operation >();
    BOOST_REQUIRE_EQUAL( slashed.size(), 1u );
    BOOST_REQUIRE( slashed[0].shares == uint128_t( 100 ) );
    BOOST_REQUIRE_EQUAL( slashed[0].amount.value, 100 );
    BOOST_REQUIRE( get_events< slash_payout_failed_operation >().empty() );

    BOOST_TEST_MESSAGE( "--- Nothing left to slash" );
    TEMPO_REQUIRE_THROW( slash( "alice" ), not_slashable_exception );

    BOOST_TEST_MESSAGE( "--- Remaining holder takes all new rewards" );
    yield( "sponsor", 50 );
    BOOST_REQUIRE_EQUAL( db->get_reward_balance( "bob" ).value, 150 );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( slash_renewed_subscriber )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: renewal restarts the grace period" );

    purchase( "alice", 1000 );
    issue_shares( "alice", 100 );

    advance_time( thirty_days + 5 * TEMPO_ONE_DAY_SECONDS );
    fund( "alice", 1000 );
    push( make_purchase( "alice", 1000 ) );

    advance_time( 20 * TEMPO_ONE_DAY_SECONDS );
    TEMPO_REQUIRE_THROW( slash( "alice" ), not_slashable_exception );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( slash_holder_without_subscription )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: shares of an account that never subscribed" );

    TEMPO_REQUIRE_THROW( slash( "carol" ), not_slashable_exception );

    issue_shares( "carol", 10 );
    slash( "carol" );

    const auto slashed = get_events< shares_slashed_operation >();
    BOOST_REQUIRE_EQUAL( slashed.size(), 1u );
    BOOST_REQUIRE_EQUAL( slashed[0].amount.value, 0 );
    BOOST_REQUIRE( db->get_reward_pool().total_shares == uint128_t( 0 ) );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( slash_payout_failure_keeps_funds )
{
  try
  {
    BOOST_TEST_MESSAGE( "Testing: rejected slash payout is reported, not reverted" );

    purchase( "alice", 1000 );
    issue_shares( "alice", 100 );
    yield( "sponsor", 100 );

    advance_time( thirty_days + 8 * TEMPO_ONE_DAY_SECONDS );
    ledger->book.set_frozen( "alice", true );
    slash( "alice" );

    BOOST_REQUIRE( get_shares( "alice" ) == uint128_t( 0 ) );
    BOOST_REQUIRE_EQUAL( balance( "alice" ).value, 0 );
    BOOST_REQUIRE_EQUAL( db->get_reward_pool().get_balance().value, 100 );
    BOOST_REQUIRE_EQUAL( db->get_ledger_balance().value, 1100 );

    const auto failed = get_events< slash_payout_failed_operation >();
    BOOST_REQUIRE_EQUAL( failed.size(), 1u );
    BOOST_REQUIRE( failed[0].account == "alice" );
    BOOST_REQUIRE_EQUAL( failed[0].amount.value, 100 );
    BOOST_REQUIRE_EQUAL( get_events< shares_slashed_operation >().size(), 1u );
  }
  FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
