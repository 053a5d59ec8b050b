#pragma once

#include <tempo/protocol/types.hpp>
#include <tempo/protocol/config.hpp>

namespace tempo { namespace protocol {

  enum currency_kind : uint8_t
  {
    native_currency,
    fungible_currency
  };

  /**
    * Which asset the ledger is denominated in. The native asset travels attached to the call,
    * a fungible token is pulled from the payer by the ledger account.
    */
  struct currency_type
  {
    currency_type() = default;
    currency_type( currency_kind k, const account_name_type& t = account_name_type() )
      : kind( k ), token( t ) {}

    currency_kind       kind = native_currency;
    account_name_type   token; //token contract, empty for the native asset

    bool is_native()const { return kind == native_currency; }

    void validate()const;

    friend bool operator == ( const currency_type& a, const currency_type& b )
    {
      return std::tie( a.kind, a.token ) == std::tie( b.kind, b.token );
    }
    friend bool operator != ( const currency_type& a, const currency_type& b ) { return !( a == b ); }
    friend bool operator < ( const currency_type& a, const currency_type& b )
    {
      return std::tie( a.kind, a.token ) < std::tie( b.kind, b.token );
    }
  };

  struct tier_parameters
  {
    uint32_t          period_duration_seconds = 0;
    share_type        price_per_period = 0; //0 makes the tier grant-only
    share_type        initial_mint_price = 0; //charged once, on the first purchase of an account
    uint32_t          supply_cap = 0; //0 - unlimited
    time_point_sec    start_time; //epoch - open immediately
    time_point_sec    end_time; //epoch - never closes
    uint32_t          max_commitment_seconds = 0; //0 - unlimited
    curve_id_type     reward_curve_id = 0;
    uint16_t          reward_bps = 0;
    bool              paused = false;
    bool              transferable = true;

    void validate()const;
  };

  enum curve_kind : uint8_t
  {
    exponential_curve,
    linear_curve
  };

  /**
    * Decay schedule of the share multiplier. The multiplier starts at formula_base (or
    * formula_base^num_periods for the exponential kind) and reaches min_multiplier after
    * num_periods periods of period_seconds each, counted from start_time.
    */
  struct curve_parameters
  {
    curve_kind        kind = exponential_curve;
    uint8_t           num_periods = 0;
    uint32_t          period_seconds = 0;
    time_point_sec    start_time; //epoch - time of creation
    uint64_t          formula_base = 1;
    uint64_t          min_multiplier = 0;

    /// highest multiplier the curve can produce
    u256 peak_multiplier()const;

    void validate()const;
  };

  enum fee_leg : uint8_t
  {
    protocol_fee_leg,
    client_fee_leg
  };

  struct fee_schedule
  {
    account_name_type protocol_recipient;
    uint16_t          protocol_bps = 0;
    account_name_type client_recipient;
    uint16_t          client_bps = 0;
    uint16_t          client_referral_bps = 0; //used when a referrer comes without a code of its own

    void validate()const;
  };

  struct reward_parameters
  {
    bool              slashable = false;
    uint32_t          slash_grace_period_seconds = 0;
  };

  /**
    * Everything needed to bring a fresh ledger to life: tier 1, curve 0, the fee schedule and
    * the pool settings. Loaded from JSON by tools, passed to database::open through open_args.
    */
  struct genesis_state
  {
    time_point_sec    initial_time;
    account_name_type ledger_account;
    account_name_type creator;
    currency_type     currency;
    tier_parameters   initial_tier;
    curve_parameters  initial_curve;
    fee_schedule      fees;
    reward_parameters rewards;
    uint64_t          global_supply_cap = 0;

    void validate()const;
  };

} } // tempo::protocol

FC_REFLECT_ENUM( tempo::protocol::currency_kind, (native_currency)(fungible_currency) )
FC_REFLECT_ENUM( tempo::protocol::curve_kind, (exponential_curve)(linear_curve) )
FC_REFLECT_ENUM( tempo::protocol::fee_leg, (protocol_fee_leg)(client_fee_leg) )

FC_REFLECT( tempo::protocol::currency_type, (kind)(token) )

FC_REFLECT( tempo::protocol::tier_parameters,
          (period_duration_seconds)
          (price_per_period)
          (initial_mint_price)
          (supply_cap)
          (start_time)
          (end_time)
          (max_commitment_seconds)
          (reward_curve_id)
          (reward_bps)
          (paused)
          (transferable)
          )

FC_REFLECT( tempo::protocol::curve_parameters,
          (kind)(num_periods)(period_seconds)(start_time)(formula_base)(min_multiplier) )

FC_REFLECT( tempo::protocol::fee_schedule,
          (protocol_recipient)(protocol_bps)(client_recipient)(client_bps)(client_referral_bps) )

FC_REFLECT( tempo::protocol::reward_parameters, (slashable)(slash_grace_period_seconds) )

FC_REFLECT( tempo::protocol::genesis_state,
          (initial_time)
          (ledger_account)
          (creator)
          (currency)
          (initial_tier)
          (initial_curve)
          (fees)
          (rewards)
          (global_supply_cap)
          )
