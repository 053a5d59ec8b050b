#include <tempo/chain/database.hpp>

#include <tempo/chain/asset_balance_object.hpp>
#include <tempo/chain/balance_book.hpp>
#include <tempo/chain/database_exceptions.hpp>
#include <tempo/chain/ledger_evaluator.hpp>

#include <tempo/chain/util/reward.hpp>
#include <tempo/chain/util/time.hpp>
#include <tempo/chain/util/uint256.hpp>

#include <fc/uint128.hpp>

#include <algorithm>
#include <limits>
#include <map>

namespace tempo { namespace chain {

using namespace tempo::protocol;

class database_impl
{
  public:
    database_impl( database& self );

    database&                                         _self;
    evaluator_registry                                _evaluator_registry;
};

database_impl::database_impl( database& self ) : _self(self), _evaluator_registry(self) {}

namespace {

/// marks the ledger busy for the lifetime of one apply_operation call
class applying_operation_guard
{
  public:
    explicit applying_operation_guard( bool& flag ) : _flag( flag ) { _flag = true; }
    ~applying_operation_guard() { _flag = false; }

  private:
    bool& _flag;
};

/// time bought on one tier expressed in time of another tier of the same value
uint64_t convert_seconds( uint64_t seconds, const tier_parameters& from, const tier_parameters& to )
{
  if( seconds == 0 || from.price_per_period == 0 || to.price_per_period == 0 )
    return seconds;

  u256 converted = u256( seconds ) * u256( from.price_per_period.value ) * u256( to.period_duration_seconds );
  converted /= u256( from.period_duration_seconds ) * u256( to.price_per_period.value );
  TEMPO_ASSERT( converted <= u256( std::numeric_limits< uint32_t >::max() ), capacity_exceeded_exception,
    "Converted time is out of range", ("seconds", seconds) );
  return static_cast< uint64_t >( converted );
}

} // namespace

database::database()
  : _my( new database_impl(*this) )
{}

database::~database() {}

void database::open( const open_args& args )
{
  try
  {
    chainbase::database::open( args.shared_mem_dir, args.chainbase_flags, args.shared_file_size );

    initialize_indexes();
    initialize_evaluators();

    if( args.asset_ledger )
      _asset_ledger = args.asset_ledger;
    else
      _asset_ledger = std::make_shared< balance_book >( *this );
    _authority = args.authority;
    _identity = args.identity;
    _validate_invariants = args.do_validate_invariants;

    if( !find< dynamic_global_property_object >() )
    {
      with_write_lock( [&]()
      {
        init_genesis( args.genesis );
      });
    }

    with_read_lock( [&]()
    {
      const auto& dgpo = get_dynamic_global_properties();
      ilog( "Opened ledger of ${l} at ${t}: ${tiers} tiers, ${supply} subscriptions",
        ("l", dgpo.ledger_account)("t", dgpo.time)("tiers", dgpo.tier_count)("supply", dgpo.total_supply) );

      if( args.do_validate_invariants )
        validate_invariants();
    });
  }
  FC_CAPTURE_LOG_AND_RETHROW( (args.data_dir)(args.shared_mem_dir)(args.shared_file_size) )
}

void database::wipe( const fc::path& shared_mem_dir )
{
  if( get_is_open() )
    close();
  chainbase::database::wipe( shared_mem_dir );
}

void database::close()
{
  try
  {
    if( get_is_open() == false )
      wlog( "database::close method is MISUSED since it is NOT opened atm..." );

    ilog( "Closing database" );

    chainbase::database::flush();
    chainbase::database::close();

    _asset_ledger.reset();
    _authority.reset();
    _identity.reset();
    _pending_virtual_operations.clear();
  }
  FC_CAPTURE_AND_RETHROW()
}

void database::init_genesis( const genesis_state& genesis )
{
  try
  {
    genesis.validate();

    ilog( "Creating ledger of ${l} (creator ${c}) at ${t}",
      ("l", genesis.ledger_account)("c", genesis.creator)("t", genesis.initial_time) );

    create< dynamic_global_property_object >( genesis.initial_time, genesis.ledger_account, genesis.creator,
      genesis.currency, genesis.global_supply_cap );
    create< fee_schedule_object >( genesis.fees );
    create< reward_pool_object >( genesis.rewards );

    const auto& curve = create_reward_curve( genesis.initial_curve );
    FC_ASSERT( curve.curve_id == 0 );
    const auto& tier = create_tier( genesis.initial_tier );
    FC_ASSERT( tier.tier_id == 1 );
  }
  FC_CAPTURE_AND_RETHROW( (genesis) )
}

void database::initialize_evaluators()
{
  _my->_evaluator_registry.register_evaluator< purchase_evaluator                >();
  _my->_evaluator_registry.register_evaluator< grant_time_evaluator              >();
  _my->_evaluator_registry.register_evaluator< revoke_time_evaluator             >();
  _my->_evaluator_registry.register_evaluator< refund_subscription_evaluator     >();
  _my->_evaluator_registry.register_evaluator< deactivate_subscription_evaluator >();
  _my->_evaluator_registry.register_evaluator< yield_rewards_evaluator           >();
  _my->_evaluator_registry.register_evaluator< claim_rewards_evaluator           >();
  _my->_evaluator_registry.register_evaluator< slash_evaluator                   >();
  _my->_evaluator_registry.register_evaluator< create_tier_evaluator             >();
  _my->_evaluator_registry.register_evaluator< update_tier_evaluator             >();
  _my->_evaluator_registry.register_evaluator< set_tier_paused_evaluator         >();
  _my->_evaluator_registry.register_evaluator< create_reward_curve_evaluator     >();
  _my->_evaluator_registry.register_evaluator< set_referral_code_evaluator       >();
  _my->_evaluator_registry.register_evaluator< delete_referral_code_evaluator    >();
  _my->_evaluator_registry.register_evaluator< set_global_supply_cap_evaluator   >();
  _my->_evaluator_registry.register_evaluator< issue_reward_shares_evaluator     >();
  _my->_evaluator_registry.register_evaluator< withdraw_creator_funds_evaluator  >();
  _my->_evaluator_registry.register_evaluator< update_fee_recipient_evaluator    >();
  _my->_evaluator_registry.register_evaluator< transfer_subscription_evaluator   >();
}

//////////////////// operations ////////////////////

operation_notification database::create_operation_notification( const operation& op )const
{
  operation_notification note( op );
  note.timestamp = head_time();
  note.virtual_op = is_virtual_operation( op );
  return note;
}

void database::apply_operation( const operation& op )
{
  TEMPO_ASSERT( !_applying_operation, reentrancy_exception,
    "Operation ${name} issued while another one is being applied", ("name", operation_name( op )) );
  applying_operation_guard guard( _applying_operation );
  _pending_virtual_operations.clear();
  _pending_mints.clear();

  operation_notification note = create_operation_notification( op );

  try
  {
    TEMPO_VALIDATION_ASSERT( !note.virtual_op, "Virtual operation ${name} cannot be applied", ("name", operation_name( op )) );
    operation_validate( op );

    flat_map< account_name_type, role_mask_type > required_roles;
    operation_get_required_roles( op, required_roles );
    for( const auto& required : required_roles )
    {
      TEMPO_ASSERT( has_role( required.first, required.second ), authorization_exception,
        "Account ${a} lacks required role", ("a", required.first)("roles", required.second) );
    }

    notify_pre_apply_operation( note );

    auto session = start_undo_session();
    _my->_evaluator_registry.get_evaluator( op ).apply( op );
    if( _validate_invariants )
      validate_invariants();
    session.squash();
  }
  catch( const fc::exception& e )
  {
    _pending_virtual_operations.clear();
    _pending_mints.clear();
    dlog( "Operation ${name} failed: ${e}", ("name", operation_name( op ))("e", e.to_detail_string()) );
    throw;
  }

  // the operation is committed, nothing below may report it as failed
  std::vector< std::pair< account_name_type, token_id_type > > mints;
  mints.swap( _pending_mints );
  for( const auto& minted : mints )
    notify_identity_mint( minted.first, minted.second );

  std::vector< operation > virtual_ops;
  virtual_ops.swap( _pending_virtual_operations );
  for( const auto& vop : virtual_ops )
  {
    operation_notification vnote = create_operation_notification( vop );
    notify_committed_operation( _pre_apply_operation_signal, vnote );
    notify_committed_operation( _post_apply_operation_signal, vnote );
  }

  notify_committed_operation( _post_apply_operation_signal, note );
}

void database::notify_identity_mint( const account_name_type& account, token_id_type token_id )
{
  try
  {
    _identity->mint( account, token_id );
  }
  catch( const fc::exception& e )
  {
    elog( "Identity layer rejected token ${id} of ${a}: ${e}", ("id", token_id)("a", account)("e", e.to_detail_string()) );
  }
  catch( const std::exception& e )
  {
    elog( "Identity layer rejected token ${id} of ${a}: ${e}", ("id", token_id)("a", account)("e", e.what()) );
  }
}

void database::notify_committed_operation( operation_signal_t& signal, const operation_notification& note )
{
  TEMPO_TRY_NOTIFY_AND_LOG( signal, note )
}

void database::push_virtual_operation( const operation& op )
{
  FC_ASSERT( is_virtual_operation( op ) );
  FC_ASSERT( _applying_operation, "Virtual operations are generated only while applying an operation" );
  _pending_virtual_operations.push_back( op );
}

void database::notify_pre_apply_operation( const operation_notification& note )
{
  TEMPO_TRY_NOTIFY( _pre_apply_operation_signal, note )
}

boost::signals2::connection database::add_pre_apply_operation_handler( const apply_operation_handler_t& func, int32_t group )
{
  return _pre_apply_operation_signal.connect( group, func );
}

boost::signals2::connection database::add_post_apply_operation_handler( const apply_operation_handler_t& func, int32_t group )
{
  return _post_apply_operation_signal.connect( group, func );
}

//////////////////// time ////////////////////

time_point_sec database::head_time()const
{
  return get_dynamic_global_properties().time;
}

void database::set_head_time( const time_point_sec& t )
{
  const auto& dgpo = get_dynamic_global_properties();
  FC_ASSERT( t >= dgpo.time, "Ledger time cannot go back", ("now", dgpo.time)("new", t) );
  modify( dgpo, [&]( dynamic_global_property_object& p )
  {
    p.time = t;
  } );
}

//////////////////// collaborators ////////////////////

asset_ledger_interface& database::get_asset_ledger()
{
  FC_ASSERT( _asset_ledger, "Database is not open" );
  return *_asset_ledger;
}

util::currency database::get_currency()
{
  const auto& dgpo = get_dynamic_global_properties();
  return util::currency( get_asset_ledger(), dgpo.currency, dgpo.ledger_account );
}

bool database::has_role( const account_name_type& account, role_mask_type roles )const
{
  return _authority && _authority->has_role( account, roles );
}

//////////////////// state access ////////////////////

const dynamic_global_property_object& database::get_dynamic_global_properties()const
{ try {
  return get< dynamic_global_property_object >();
} FC_CAPTURE_AND_RETHROW() }

const fee_schedule_object& database::get_fee_schedule()const
{ try {
  return get< fee_schedule_object >();
} FC_CAPTURE_AND_RETHROW() }

const reward_pool_object& database::get_reward_pool()const
{ try {
  return get< reward_pool_object >();
} FC_CAPTURE_AND_RETHROW() }

const tier_object& database::get_tier( tier_id_type tier_id )const
{
  const auto* tier = find_tier( tier_id );
  TEMPO_VALIDATION_ASSERT( tier != nullptr, "Unknown tier ${t}", ("t", tier_id) );
  return *tier;
}

const tier_object* database::find_tier( tier_id_type tier_id )const
{
  return find< tier_object, by_tier >( tier_id );
}

const reward_curve_object& database::get_reward_curve( curve_id_type curve_id )const
{
  const auto* curve = find_reward_curve( curve_id );
  TEMPO_VALIDATION_ASSERT( curve != nullptr, "Unknown reward curve ${c}", ("c", curve_id) );
  return *curve;
}

const reward_curve_object* database::find_reward_curve( curve_id_type curve_id )const
{
  return find< reward_curve_object, by_curve >( curve_id );
}

const subscription_object& database::get_subscription( const account_name_type& account )const
{
  const auto* sub = find_subscription( account );
  TEMPO_ASSERT( sub != nullptr && sub->has_token(), state_conflict_exception,
    "Account ${a} holds no subscription", ("a", account) );
  return *sub;
}

const subscription_object* database::find_subscription( const account_name_type& account )const
{
  return find< subscription_object, by_account >( account );
}

const reward_holder_object* database::find_reward_holder( const account_name_type& account )const
{
  return find< reward_holder_object, by_account >( account );
}

const referral_code_object* database::find_referral_code( referral_code_type code )const
{
  return find< referral_code_object, by_code >( code );
}

share_type database::get_ledger_balance()const
{
  const auto& dgpo = get_dynamic_global_properties();
  FC_ASSERT( _asset_ledger, "Database is not open" );
  return _asset_ledger->balance_of( dgpo.currency, dgpo.ledger_account );
}

share_type database::get_creator_balance()const
{
  return get_ledger_balance() - get_reward_pool().get_balance();
}

share_type database::get_reward_balance( const account_name_type& account )const
{
  const auto* holder = find_reward_holder( account );
  if( holder == nullptr )
    return 0;

  const auto& pool = get_reward_pool();
  uint128_t owed = util::rewards_since( holder->shares, pool.points_per_share, holder->reward_debt );
  return holder->pending + fc::uint128_to_int64( owed );
}

uint64_t database::get_remaining_seconds( const account_name_type& account )const
{
  const auto* sub = find_subscription( account );
  return sub == nullptr ? 0 : sub->get_remaining_seconds( head_time() );
}

//////////////////// subscriptions ////////////////////

const subscription_object& database::mint_subscription( const account_name_type& account )
{
  const auto* sub = find_subscription( account );
  if( sub != nullptr && sub->has_token() )
    return *sub;

  const auto& dgpo = get_dynamic_global_properties();
  TEMPO_ASSERT( dgpo.global_supply_cap == 0 || dgpo.total_supply < dgpo.global_supply_cap, capacity_exceeded_exception,
    "Global supply cap of ${c} subscriptions reached", ("c", dgpo.global_supply_cap) );

  const token_id_type token_id = dgpo.next_token_id;
  modify( dgpo, [&]( dynamic_global_property_object& p )
  {
    ++p.next_token_id;
    ++p.total_supply;
  } );

  if( sub == nullptr )
    sub = &create< subscription_object >( account );
  modify( *sub, [&]( subscription_object& s )
  {
    s.token_id = token_id;
  } );

  if( _identity )
    _pending_mints.emplace_back( account, token_id );

  push_virtual_operation( subscription_minted_operation( account, token_id ) );
  return *sub;
}

void database::join_tier( const subscription_object& sub, const tier_object& tier )
{
  FC_ASSERT( !sub.in_tier(), "Account ${a} is already in tier ${t}", ("a", sub.account)("t", sub.tier_id) );
  TEMPO_ASSERT( tier.has_room(), capacity_exceeded_exception,
    "Tier ${t} is full (${c} subscribers)", ("t", tier.tier_id)("c", tier.params.supply_cap) );

  modify( tier, [&]( tier_object& t )
  {
    ++t.subscriber_count;
  } );
  modify( sub, [&]( subscription_object& s )
  {
    s.tier_id = tier.tier_id;
  } );
}

void database::leave_tier( const subscription_object& sub )
{
  if( !sub.in_tier() )
    return;

  const auto& tier = get_tier( sub.tier_id );
  FC_ASSERT( tier.subscriber_count > 0 );
  modify( tier, [&]( tier_object& t )
  {
    --t.subscriber_count;
  } );
  modify( sub, [&]( subscription_object& s )
  {
    s.tier_id = 0;
  } );
}

void database::switch_tier( const subscription_object& sub, const tier_object& new_tier )
{
  FC_ASSERT( sub.in_tier() && sub.tier_id != new_tier.tier_id );

  const auto& old_params = get_tier( sub.tier_id ).params;
  const auto now = head_time();

  const uint64_t remaining = convert_seconds( sub.get_remaining_seconds( now ), old_params, new_tier.params );
  const uint64_t paid_remaining = convert_seconds( sub.get_paid_remaining_seconds( now ), old_params, new_tier.params );
  const uint64_t granted = convert_seconds( sub.granted_seconds, old_params, new_tier.params );

  leave_tier( sub );
  join_tier( sub, new_tier );

  modify( sub, [&]( subscription_object& s )
  {
    if( s.expires_at > now )
      s.expires_at = util::add_seconds( now, remaining );
    if( s.purchase_expires > now )
      s.purchase_expires = util::add_seconds( now, paid_remaining );
    s.granted_seconds = granted;
  } );
}

void database::extend_subscription( const subscription_object& sub, uint64_t seconds, bool paid )
{
  const auto now = head_time();
  const time_point_sec expires_at = util::add_seconds( std::max( now, sub.expires_at ), seconds );
  const time_point_sec purchase_expires = paid ? util::add_seconds( std::max( now, sub.purchase_expires ), seconds ) : sub.purchase_expires;

  modify( sub, [&]( subscription_object& s )
  {
    s.expires_at = expires_at;
    if( paid )
      s.purchase_expires = purchase_expires;
    else
      s.granted_seconds += seconds;
  } );
}

//////////////////// reward pool ////////////////////

const reward_holder_object& database::get_or_create_reward_holder( const account_name_type& account )
{
  const auto* holder = find_reward_holder( account );
  if( holder == nullptr )
    holder = &create< reward_holder_object >( account );
  return *holder;
}

void database::settle_reward_holder( const reward_holder_object& holder )
{
  const auto& pool = get_reward_pool();
  const uint128_t owed = util::rewards_since( holder.shares, pool.points_per_share, holder.reward_debt );
  const uint128_t checkpoint = util::reward_checkpoint( holder.shares, pool.points_per_share );

  modify( holder, [&]( reward_holder_object& h )
  {
    h.pending += fc::uint128_to_int64( owed );
    h.reward_debt = checkpoint;
  } );
}

uint128_t database::issue_reward_shares( const account_name_type& account, const share_type& amount, curve_id_type curve_id )
{ try {
  const auto& curve = get_reward_curve( curve_id );
  const uint64_t multiplier = util::curve_multiplier( curve.params, head_time() );
  const uint128_t shares = util::shares_for_amount( amount, multiplier );
  if( shares > 0 )
    issue_raw_reward_shares( account, shares, amount );
  return shares;
} FC_CAPTURE_AND_RETHROW( (account)(amount)(curve_id) ) }

void database::issue_raw_reward_shares( const account_name_type& account, const uint128_t& shares, const share_type& amount )
{
  if( shares == 0 )
    return;

  const auto& pool = get_reward_pool();
  TEMPO_ASSERT( pool.total_shares <= fc::uint128_max_value() - shares, capacity_exceeded_exception,
    "Too many reward shares", ("total_shares", pool.total_shares)("shares", shares) );

  const auto& holder = get_or_create_reward_holder( account );
  settle_reward_holder( holder );

  const uint128_t checkpoint = util::reward_checkpoint( holder.shares + shares, pool.points_per_share );
  modify( holder, [&]( reward_holder_object& h )
  {
    h.shares += shares;
    h.reward_debt = checkpoint;
  } );
  modify( pool, [&]( reward_pool_object& p )
  {
    p.total_shares += shares;
  } );

  push_virtual_operation( reward_shares_issued_operation( account, amount, shares ) );
}

void database::allocate_rewards( const account_name_type& payer, const share_type& amount )
{
  const auto& pool = get_reward_pool();
  TEMPO_ASSERT( pool.total_shares > 0, not_eligible_exception, "No reward shares to allocate ${a} to", ("a", amount) );
  FC_ASSERT( amount >= 0 );
  if( amount == 0 )
    return;

  const uint128_t increment = util::points_increment( amount, pool.total_shares );
  TEMPO_ASSERT( pool.points_per_share <= fc::uint128_max_value() - increment, capacity_exceeded_exception,
    "Reward accumulator overflow", ("points_per_share", pool.points_per_share)("increment", increment) );

  modify( pool, [&]( reward_pool_object& p )
  {
    p.points_per_share += increment;
    p.allocated += amount;
  } );

  push_virtual_operation( rewards_allocated_operation( payer, amount ) );
}

share_type database::claim_rewards( const account_name_type& account )
{
  const auto* holder = find_reward_holder( account );
  if( holder == nullptr )
    return 0;

  settle_reward_holder( *holder );
  const share_type amount = holder->pending;
  if( amount == 0 )
    return 0;

  modify( *holder, [&]( reward_holder_object& h )
  {
    h.pending = 0;
  } );
  withdraw_from_reward_pool( amount );

  get_currency().transfer( account, amount );

  push_virtual_operation( rewards_claimed_operation( account, amount ) );
  return amount;
}

share_type database::burn_reward_shares( const account_name_type& account )
{
  const auto* holder = find_reward_holder( account );
  if( holder == nullptr )
    return 0;

  settle_reward_holder( *holder );
  const share_type amount = holder->pending;
  const uint128_t shares = holder->shares;

  const auto& pool = get_reward_pool();
  FC_ASSERT( pool.total_shares >= shares );
  modify( pool, [&]( reward_pool_object& p )
  {
    p.total_shares -= shares;
  } );
  modify( *holder, [&]( reward_holder_object& h )
  {
    h.shares = 0;
    h.reward_debt = 0;
    h.pending = 0;
  } );

  return amount;
}

void database::move_reward_holder( const account_name_type& from, const account_name_type& to )
{
  const auto* source = find_reward_holder( from );
  if( source == nullptr || from == to )
    return;

  settle_reward_holder( *source );
  const auto& target = get_or_create_reward_holder( to );
  settle_reward_holder( target );

  const auto& pool = get_reward_pool();
  const uint128_t shares = target.shares + source->shares;
  const share_type pending = target.pending + source->pending;
  const uint128_t checkpoint = util::reward_checkpoint( shares, pool.points_per_share );

  modify( target, [&]( reward_holder_object& h )
  {
    h.shares = shares;
    h.pending = pending;
    h.reward_debt = checkpoint;
  } );
  modify( *source, [&]( reward_holder_object& h )
  {
    h.shares = 0;
    h.reward_debt = 0;
    h.pending = 0;
  } );
}

void database::withdraw_from_reward_pool( const share_type& amount )
{
  const auto& pool = get_reward_pool();
  FC_ASSERT( amount >= 0 && amount <= pool.get_balance(), "Reward pool cannot cover ${a}",
    ("a", amount)("balance", pool.get_balance()) );
  modify( pool, [&]( reward_pool_object& p )
  {
    p.withdrawn += amount;
  } );
}

//////////////////// registry ////////////////////

void database::validate_tier_parameters( const tier_parameters& params )const
{
  params.validate();
  TEMPO_VALIDATION_ASSERT( find_reward_curve( params.reward_curve_id ) != nullptr,
    "Unknown reward curve ${c}", ("c", params.reward_curve_id) );
}

const tier_object& database::create_tier( const tier_parameters& params )
{
  validate_tier_parameters( params );

  const auto& dgpo = get_dynamic_global_properties();
  TEMPO_ASSERT( dgpo.tier_count < TEMPO_MAX_TIERS, capacity_exceeded_exception,
    "Maximum number of tiers reached", ("max", TEMPO_MAX_TIERS) );

  const tier_id_type tier_id = static_cast< tier_id_type >( dgpo.tier_count + 1 );
  modify( dgpo, [&]( dynamic_global_property_object& p )
  {
    p.tier_count = tier_id;
  } );

  return create< tier_object >( tier_id, params );
}

const reward_curve_object& database::create_reward_curve( const curve_parameters& params )
{
  params.validate();

  const auto& pool = get_reward_pool();
  TEMPO_ASSERT( pool.curve_count < TEMPO_MAX_REWARD_CURVES, capacity_exceeded_exception,
    "Maximum number of reward curves reached", ("max", TEMPO_MAX_REWARD_CURVES) );

  curve_parameters stored = params;
  if( stored.start_time == time_point_sec() )
    stored.start_time = head_time();

  const curve_id_type curve_id = pool.curve_count;
  modify( pool, [&]( reward_pool_object& p )
  {
    ++p.curve_count;
  } );

  return create< reward_curve_object >( curve_id, stored );
}

void database::validate_invariants()const
{
  try
  {
    const auto& pool = get_reward_pool();
    const auto& dgpo = get_dynamic_global_properties();

    /// shares and entitlements
    uint128_t total_shares = 0;
    u256 total_owed = 0;
    const auto& holder_idx = get_index< reward_holder_index >().indices();
    for( auto itr = holder_idx.begin(); itr != holder_idx.end(); ++itr )
    {
      total_shares += itr->shares;
      FC_ASSERT( itr->pending >= 0, "", ("holder", *itr) );
      total_owed += u256( itr->pending.value );
      total_owed += util::to256( util::rewards_since( itr->shares, pool.points_per_share, itr->reward_debt ) );
    }
    FC_ASSERT( total_shares == pool.total_shares, "",
      ("total_shares", total_shares)("pool.total_shares", pool.total_shares) );

    FC_ASSERT( pool.withdrawn >= 0 && pool.allocated >= pool.withdrawn, "",
      ("allocated", pool.allocated)("withdrawn", pool.withdrawn) );
    FC_ASSERT( total_owed <= u256( pool.get_balance().value ), "Reward entitlements exceed the pool",
      ("pool_balance", pool.get_balance()) );
    FC_ASSERT( get_ledger_balance() >= pool.get_balance(), "Ledger holds less than the reward pool",
      ("ledger_balance", get_ledger_balance())("pool_balance", pool.get_balance()) );

    /// tiers and supply
    std::map< tier_id_type, uint32_t > tier_members;
    uint64_t token_holders = 0;
    const auto& sub_idx = get_index< subscription_index, by_account >();
    for( auto itr = sub_idx.begin(); itr != sub_idx.end(); ++itr )
    {
      if( itr->has_token() )
      {
        ++token_holders;
        FC_ASSERT( itr->token_id < dgpo.next_token_id, "", ("sub", *itr) );
      }
      else
      {
        FC_ASSERT( !itr->in_tier(), "Tier member without a token", ("sub", *itr) );
      }
      FC_ASSERT( itr->purchase_expires <= itr->expires_at || itr->purchase_expires == time_point_sec(), "",
        ("sub", *itr) );
      if( itr->in_tier() )
        ++tier_members[ itr->tier_id ];
    }
    FC_ASSERT( token_holders == dgpo.total_supply, "", ("token_holders", token_holders)("total_supply", dgpo.total_supply) );
    FC_ASSERT( dgpo.global_supply_cap == 0 || dgpo.total_supply <= dgpo.global_supply_cap, "",
      ("total_supply", dgpo.total_supply)("global_supply_cap", dgpo.global_supply_cap) );

    uint32_t tier_no = 0;
    const auto& tier_idx = get_index< tier_index, by_tier >();
    for( auto itr = tier_idx.begin(); itr != tier_idx.end(); ++itr )
    {
      ++tier_no;
      FC_ASSERT( itr->tier_id == tier_no, "Tier ids are not contiguous", ("tier", *itr) );
      FC_ASSERT( itr->subscriber_count == tier_members[ itr->tier_id ], "",
        ("tier", *itr)("members", tier_members[ itr->tier_id ]) );
      FC_ASSERT( itr->params.supply_cap == 0 || itr->subscriber_count <= itr->params.supply_cap, "", ("tier", *itr) );
      FC_ASSERT( itr->params.reward_bps <= TEMPO_MAX_REWARD_BPS, "", ("tier", *itr) );
    }
    FC_ASSERT( tier_no == dgpo.tier_count, "", ("tiers", tier_no)("tier_count", dgpo.tier_count) );
    FC_ASSERT( count< reward_curve_object >() == pool.curve_count, "", ("curve_count", pool.curve_count) );

    /// fees and referral codes
    const auto& fees = get_fee_schedule().schedule;
    fees.validate();
    const auto& code_idx = get_index< referral_code_index, by_code >();
    for( auto itr = code_idx.begin(); itr != code_idx.end(); ++itr )
      FC_ASSERT( itr->bps <= TEMPO_100_PERCENT, "", ("code", *itr) );
  }
  FC_CAPTURE_LOG_AND_RETHROW( (head_time()) );
}

} } // tempo::chain
