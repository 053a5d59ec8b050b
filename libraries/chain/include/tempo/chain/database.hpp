#pragma once

#include <tempo/chain/external_interfaces.hpp>
#include <tempo/chain/global_property_object.hpp>
#include <tempo/chain/ledger_objects.hpp>
#include <tempo/chain/notifications.hpp>
#include <tempo/chain/util/currency.hpp>

#include <tempo/protocol/operations.hpp>

#include <fc/filesystem.hpp>
#include <fc/signals.hpp>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace tempo { namespace chain {

  using tempo::protocol::operation;
  using tempo::protocol::genesis_state;

  class database_impl;

  struct open_args
    {
    fc::path data_dir;
    fc::path shared_mem_dir;
    uint64_t shared_file_size = TEMPO_DEFAULT_SHARED_FILE_SIZE;
    uint32_t chainbase_flags = 0;
    bool do_validate_invariants = false;

    // only used when the shared memory file holds no ledger yet
    genesis_state genesis;

    // null - balances are kept in the built-in balance_book
    std::shared_ptr< asset_ledger_interface > asset_ledger;
    // null - every role check fails
    std::shared_ptr< authority_interface >    authority;
    // null - token ids are assigned without telling anyone
    std::shared_ptr< identity_interface >     identity;
    };

  /**
    *   @class database
    *   @brief tracks the state of the ledger
    *
    *   All changes go through apply_operation. Every operation runs inside its own undo session,
    *   so a failure anywhere leaves no trace, payments included when the balances live in the
    *   same database. Virtual operations generated on the way are delivered to observers, and new
    *   token ids to the identity layer, only after the operation committed.
    */
  class database : public chainbase::database
  {
    public:
      database();
      ~database();

      /**
        * @brief Open a database, creating a new ledger from open_args::genesis if needed
        */
      void open( const open_args& args );

      /**
        * @brief wipe Delete database from disk
        */
      void wipe( const fc::path& shared_mem_dir );
      void close();

      //////////////////// operations ////////////////////

      /**
        * Checks the operation, the roles of its signers and applies it. Nested calls (from
        * observers or from the asset ledger) are rejected with reentrancy_exception.
        */
      void apply_operation( const operation& op );

      /// queues a virtual operation, delivered after the current operation commits
      void push_virtual_operation( const operation& op );

      bool is_applying_operation()const { return _applying_operation; }

      using apply_operation_handler_t = std::function< void(const operation_notification&) >;

      boost::signals2::connection add_pre_apply_operation_handler ( const apply_operation_handler_t& func, int32_t group = -1 );
      boost::signals2::connection add_post_apply_operation_handler( const apply_operation_handler_t& func, int32_t group = -1 );

      //////////////////// time ////////////////////

      time_point_sec head_time()const;
      /// moves the ledger clock, it never goes back
      void set_head_time( const time_point_sec& t );

      //////////////////// collaborators ////////////////////

      asset_ledger_interface& get_asset_ledger();
      util::currency get_currency();
      bool has_role( const account_name_type& account, role_mask_type roles )const;
      bool has_identity()const { return static_cast< bool >( _identity ); }

      //////////////////// state access ////////////////////

      const dynamic_global_property_object& get_dynamic_global_properties()const;
      const fee_schedule_object&            get_fee_schedule()const;
      const reward_pool_object&             get_reward_pool()const;

      const tier_object&  get_tier( tier_id_type tier_id )const;
      const tier_object*  find_tier( tier_id_type tier_id )const;

      const reward_curve_object&  get_reward_curve( curve_id_type curve_id )const;
      const reward_curve_object*  find_reward_curve( curve_id_type curve_id )const;

      const subscription_object&  get_subscription( const account_name_type& account )const;
      const subscription_object*  find_subscription( const account_name_type& account )const;

      const reward_holder_object* find_reward_holder( const account_name_type& account )const;
      const referral_code_object* find_referral_code( referral_code_type code )const;

      /// amount of the ledger currency held by the ledger account
      share_type get_ledger_balance()const;
      /// part of the ledger balance not owed to reward holders
      share_type get_creator_balance()const;
      /// rewards the account can claim right now
      share_type get_reward_balance( const account_name_type& account )const;
      uint64_t   get_remaining_seconds( const account_name_type& account )const;

      //////////////////// subscriptions ////////////////////

      /// assigns a new token id to the account unless it already holds one, the identity layer hears of it on commit
      const subscription_object& mint_subscription( const account_name_type& account );

      /// makes the subscription a member of the tier, checking the tier supply cap
      void join_tier( const subscription_object& sub, const tier_object& tier );
      void leave_tier( const subscription_object& sub );
      /// moves the subscription to another tier converting its remaining time by value
      void switch_tier( const subscription_object& sub, const tier_object& new_tier );

      /**
        * Adds time to the subscription, counted from now for a lapsed one. Paid time moves
        * purchase_expires too, granted time is accumulated in granted_seconds.
        */
      void extend_subscription( const subscription_object& sub, uint64_t seconds, bool paid );

      //////////////////// reward pool ////////////////////

      /// moves rewards allocated since the last checkpoint of the holder to its pending balance
      void settle_reward_holder( const reward_holder_object& holder );

      /// issues shares worth `amount` at the current multiplier of the curve, returns the shares
      uint128_t issue_reward_shares( const account_name_type& account, const share_type& amount, curve_id_type curve_id );
      void issue_raw_reward_shares( const account_name_type& account, const uint128_t& shares, const share_type& amount );

      /// spreads `amount` over all outstanding shares, the funds must already be held by the ledger
      void allocate_rewards( const account_name_type& payer, const share_type& amount );

      /// pays out the whole entitlement of the account, returns the amount paid
      share_type claim_rewards( const account_name_type& account );

      /**
        * Removes all shares of the account and its entitlement from the pool accounting.
        * Returns the entitlement, the caller pays it out.
        */
      share_type burn_reward_shares( const account_name_type& account );

      /// hands the whole position of `from` (shares and unclaimed rewards) over to `to`
      void move_reward_holder( const account_name_type& from, const account_name_type& to );

      /// books a payout from the pool
      void withdraw_from_reward_pool( const share_type& amount );

      //////////////////// registry ////////////////////

      const tier_object&          create_tier( const tier_parameters& params );
      const reward_curve_object&  create_reward_curve( const curve_parameters& params );

      /// checks tier parameters against the current state (curves, subscribers)
      void validate_tier_parameters( const tier_parameters& params )const;

      void validate_invariants()const;

    protected:
      void init_genesis( const genesis_state& genesis );

      void initialize_indexes();
      void initialize_evaluators();

      typedef fc::signal<void(const operation_notification&)> operation_signal_t;

      /// may throw, the operation is still pending
      void notify_pre_apply_operation( const operation_notification& note );
      /// logs failures, the operation already committed
      void notify_committed_operation( operation_signal_t& signal, const operation_notification& note );
      void notify_identity_mint( const account_name_type& account, token_id_type token_id );

    private:
      const reward_holder_object& get_or_create_reward_holder( const account_name_type& account );

      operation_notification create_operation_notification( const operation& op )const;

      std::unique_ptr< database_impl > _my;

      std::shared_ptr< asset_ledger_interface > _asset_ledger;
      std::shared_ptr< authority_interface >    _authority;
      std::shared_ptr< identity_interface >     _identity;

      std::vector< operation >                  _pending_virtual_operations;
      std::vector< std::pair< account_name_type, token_id_type > > _pending_mints;
      bool                                      _applying_operation = false;
      bool                                      _validate_invariants = false;

      /**
        *  This signal is emitted for observers to process every operation before it gets applied.
        */
      operation_signal_t                                    _pre_apply_operation_signal;
      /**
        *  This signal is emitted for observers to process every operation after it has been fully applied.
        */
      operation_signal_t                                    _post_apply_operation_signal;
  };

} }
