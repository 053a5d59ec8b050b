#pragma once

#include <tempo/chain/ledger_object_types.hpp>

#include <fc/uint128.hpp>

namespace tempo { namespace chain {

  using fc::uint128_t;

  /**
    * Split of every purchase between the protocol, the client (and its referrers) and the ledger.
    * Single instance created at genesis.
    */
  class fee_schedule_object : public object< fee_schedule_object_type, fee_schedule_object >
  {
    CHAINBASE_OBJECT( fee_schedule_object );
    public:
      template< typename Allocator >
      fee_schedule_object( allocator< Allocator > a, uint64_t _id, const fee_schedule& _schedule )
        : id( _id ), schedule( _schedule )
      {}

      const account_name_type& get_recipient( protocol::fee_leg leg )const
      {
        return leg == protocol::protocol_fee_leg ? schedule.protocol_recipient : schedule.client_recipient;
      }

      fee_schedule schedule;

    CHAINBASE_UNPACK_CONSTRUCTOR(fee_schedule_object);
  };

  /**
    * Accounting of the reward pool. Shares are issued to subscribers, rewards are spread over
    * all shares by growing points_per_share (magnified by 2^TEMPO_POINTS_MAGNITUDE_BITS).
    * Single instance created at genesis.
    */
  class reward_pool_object : public object< reward_pool_object_type, reward_pool_object >
  {
    CHAINBASE_OBJECT( reward_pool_object );
    public:
      template< typename Allocator >
      reward_pool_object( allocator< Allocator > a, uint64_t _id, const protocol::reward_parameters& _params )
        : id( _id ), slashable( _params.slashable ), slash_grace_period_seconds( _params.slash_grace_period_seconds )
      {}

      //funds allocated to holders and not yet paid out
      share_type get_balance()const { return allocated - withdrawn; }

      uint128_t         total_shares = 0;
      uint128_t         points_per_share = 0;
      //sum of all rewards ever allocated
      share_type        allocated = 0;
      //sum of all rewards ever paid out
      share_type        withdrawn = 0;
      //number of created curves, also the id of the next one
      uint16_t          curve_count = 0;
      bool              slashable = false;
      uint32_t          slash_grace_period_seconds = 0;

    CHAINBASE_UNPACK_CONSTRUCTOR(reward_pool_object);
  };

  class tier_object : public object< tier_object_type, tier_object >
  {
    CHAINBASE_OBJECT( tier_object );
    public:
      template< typename Allocator >
      tier_object( allocator< Allocator > a, uint64_t _id, tier_id_type _tier_id, const tier_parameters& _params )
        : id( _id ), tier_id( _tier_id ), params( _params )
      {}

      bool is_purchasable()const { return params.price_per_period > 0; }

      //inside [start_time, end_time) window, unbounded ends are open
      bool is_on_sale( const time_point_sec& now )const
      {
        if( now < params.start_time )
          return false;
        return params.end_time == time_point_sec() || now < params.end_time;
      }

      bool has_room()const { return params.supply_cap == 0 || subscriber_count < params.supply_cap; }

      tier_id_type      tier_id = 0;
      tier_parameters   params;
      uint32_t          subscriber_count = 0;

    CHAINBASE_UNPACK_CONSTRUCTOR(tier_object);
  };

  class reward_curve_object : public object< reward_curve_object_type, reward_curve_object >
  {
    CHAINBASE_OBJECT( reward_curve_object );
    public:
      template< typename Allocator >
      reward_curve_object( allocator< Allocator > a, uint64_t _id, curve_id_type _curve_id, const curve_parameters& _params )
        : id( _id ), curve_id( _curve_id ), params( _params )
      {}

      curve_id_type     curve_id = 0;
      curve_parameters  params;

    CHAINBASE_UNPACK_CONSTRUCTOR(reward_curve_object);
  };

  /**
    * Time ledger of a single account. Record stays after expiration and deactivation, it only goes
    * back to an empty state when its token is transferred away.
    */
  class subscription_object : public object< subscription_object_type, subscription_object >
  {
    CHAINBASE_OBJECT( subscription_object );
    public:
      template< typename Allocator >
      subscription_object( allocator< Allocator > a, uint64_t _id, const account_name_type& _account )
        : id( _id ), account( _account )
      {}

      bool has_token()const { return token_id != 0; }
      bool in_tier()const { return tier_id != 0; }
      bool is_active( const time_point_sec& now )const { return in_tier() && expires_at >= now; }

      uint64_t get_remaining_seconds( const time_point_sec& now )const
      {
        return expires_at > now ? ( expires_at - now ).to_seconds() : 0;
      }

      //remaining time that was paid for, granted time excluded
      uint64_t get_paid_remaining_seconds( const time_point_sec& now )const
      {
        return purchase_expires > now ? ( purchase_expires - now ).to_seconds() : 0;
      }

      account_name_type account;
      token_id_type     token_id = 0;
      //0 - not a member of any tier
      tier_id_type      tier_id = 0;
      time_point_sec    expires_at;
      //time given by agents and not revoked yet
      uint64_t          granted_seconds = 0;
      //end of the paid time, epoch when the account never paid
      time_point_sec    purchase_expires;

    CHAINBASE_UNPACK_CONSTRUCTOR(subscription_object);
  };

  /**
    * Reward pool position of an account. Entitlement is
    * pending + shares * points_per_share / 2^64 - reward_debt
    * where reward_debt is moved to the current accumulator on every settlement, rounded up, so rewards
    * allocated before the shares were issued are not claimable.
    */
  class reward_holder_object : public object< reward_holder_object_type, reward_holder_object >
  {
    CHAINBASE_OBJECT( reward_holder_object );
    public:
      template< typename Allocator >
      reward_holder_object( allocator< Allocator > a, uint64_t _id, const account_name_type& _account )
        : id( _id ), account( _account )
      {}

      account_name_type account;
      uint128_t         shares = 0;
      uint128_t         reward_debt = 0;
      //settled and not yet paid out
      share_type        pending = 0;

    CHAINBASE_UNPACK_CONSTRUCTOR(reward_holder_object);
  };

  class referral_code_object : public object< referral_code_object_type, referral_code_object >
  {
    CHAINBASE_OBJECT( referral_code_object );
    public:
      template< typename Allocator >
      referral_code_object( allocator< Allocator > a, uint64_t _id, referral_code_type _code )
        : id( _id ), code( _code )
      {}

      bool is_restricted()const { return !restricted_account.empty(); }

      referral_code_type  code = 0;
      uint16_t            bps = 0;
      bool                permanent = false;
      account_name_type   restricted_account;

    CHAINBASE_UNPACK_CONSTRUCTOR(referral_code_object);
  };

  typedef multi_index_container<
    fee_schedule_object,
    indexed_by<
      ordered_unique< tag< by_id >,
        const_mem_fun< fee_schedule_object, fee_schedule_object::id_type, &fee_schedule_object::get_id > >
    >,
    allocator< fee_schedule_object >
  > fee_schedule_index;

  typedef multi_index_container<
    reward_pool_object,
    indexed_by<
      ordered_unique< tag< by_id >,
        const_mem_fun< reward_pool_object, reward_pool_object::id_type, &reward_pool_object::get_id > >
    >,
    allocator< reward_pool_object >
  > reward_pool_index;

  typedef multi_index_container<
    tier_object,
    indexed_by<
      ordered_unique< tag< by_id >,
        const_mem_fun< tier_object, tier_object::id_type, &tier_object::get_id > >,
      ordered_unique< tag< by_tier >,
        member< tier_object, tier_id_type, &tier_object::tier_id > >
    >,
    allocator< tier_object >
  > tier_index;

  typedef multi_index_container<
    reward_curve_object,
    indexed_by<
      ordered_unique< tag< by_id >,
        const_mem_fun< reward_curve_object, reward_curve_object::id_type, &reward_curve_object::get_id > >,
      ordered_unique< tag< by_curve >,
        member< reward_curve_object, curve_id_type, &reward_curve_object::curve_id > >
    >,
    allocator< reward_curve_object >
  > reward_curve_index;

  typedef multi_index_container<
    subscription_object,
    indexed_by<
      ordered_unique< tag< by_id >,
        const_mem_fun< subscription_object, subscription_object::id_type, &subscription_object::get_id > >,
      ordered_unique< tag< by_account >,
        member< subscription_object, account_name_type, &subscription_object::account > >,
      ordered_unique< tag< by_token >,
        composite_key< subscription_object,
          member< subscription_object, token_id_type, &subscription_object::token_id >,
          const_mem_fun< subscription_object, subscription_object::id_type, &subscription_object::get_id >
        >
      >,
      ordered_unique< tag< by_tier >,
        composite_key< subscription_object,
          member< subscription_object, tier_id_type, &subscription_object::tier_id >,
          const_mem_fun< subscription_object, subscription_object::id_type, &subscription_object::get_id >
        >
      >
    >,
    allocator< subscription_object >
  > subscription_index;

  typedef multi_index_container<
    reward_holder_object,
    indexed_by<
      ordered_unique< tag< by_id >,
        const_mem_fun< reward_holder_object, reward_holder_object::id_type, &reward_holder_object::get_id > >,
      ordered_unique< tag< by_account >,
        member< reward_holder_object, account_name_type, &reward_holder_object::account > >
    >,
    allocator< reward_holder_object >
  > reward_holder_index;

  typedef multi_index_container<
    referral_code_object,
    indexed_by<
      ordered_unique< tag< by_id >,
        const_mem_fun< referral_code_object, referral_code_object::id_type, &referral_code_object::get_id > >,
      ordered_unique< tag< by_code >,
        member< referral_code_object, referral_code_type, &referral_code_object::code > >
    >,
    allocator< referral_code_object >
  > referral_code_index;

} } // tempo::chain

FC_REFLECT( tempo::chain::fee_schedule_object, (id)(schedule) )
CHAINBASE_SET_INDEX_TYPE( tempo::chain::fee_schedule_object, tempo::chain::fee_schedule_index )

FC_REFLECT( tempo::chain::reward_pool_object,
          (id)
          (total_shares)
          (points_per_share)
          (allocated)
          (withdrawn)
          (curve_count)
          (slashable)
          (slash_grace_period_seconds)
        )
CHAINBASE_SET_INDEX_TYPE( tempo::chain::reward_pool_object, tempo::chain::reward_pool_index )

FC_REFLECT( tempo::chain::tier_object, (id)(tier_id)(params)(subscriber_count) )
CHAINBASE_SET_INDEX_TYPE( tempo::chain::tier_object, tempo::chain::tier_index )

FC_REFLECT( tempo::chain::reward_curve_object, (id)(curve_id)(params) )
CHAINBASE_SET_INDEX_TYPE( tempo::chain::reward_curve_object, tempo::chain::reward_curve_index )

FC_REFLECT( tempo::chain::subscription_object,
          (id)(account)(token_id)(tier_id)(expires_at)(granted_seconds)(purchase_expires) )
CHAINBASE_SET_INDEX_TYPE( tempo::chain::subscription_object, tempo::chain::subscription_index )

FC_REFLECT( tempo::chain::reward_holder_object, (id)(account)(shares)(reward_debt)(pending) )
CHAINBASE_SET_INDEX_TYPE( tempo::chain::reward_holder_object, tempo::chain::reward_holder_index )

FC_REFLECT( tempo::chain::referral_code_object, (id)(code)(bps)(permanent)(restricted_account) )
CHAINBASE_SET_INDEX_TYPE( tempo::chain::referral_code_object, tempo::chain::referral_code_index )
