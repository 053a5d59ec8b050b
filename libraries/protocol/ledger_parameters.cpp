#include <tempo/protocol/ledger_parameters.hpp>

#include <tempo/protocol/validation.hpp>

namespace tempo { namespace protocol {

void currency_type::validate()const
{
  if( is_native() )
    TEMPO_VALIDATION_ASSERT( token.empty(), "Native currency cannot name a token contract", ("token", token) );
  else
    TEMPO_VALIDATION_ASSERT( !token.empty(), "Fungible currency requires a token contract" );
}

void tier_parameters::validate()const
{
  TEMPO_VALIDATION_ASSERT( period_duration_seconds > 0, "Period duration must be positive" );
  TEMPO_VALIDATION_ASSERT( period_duration_seconds <= TEMPO_MAX_PERIOD_DURATION_SECONDS,
    "Period duration is too long. Value: ${v}, Max: ${max}",
    ("v", period_duration_seconds)("max", TEMPO_MAX_PERIOD_DURATION_SECONDS) );

  validate_amount_not_negative( price_per_period, "Price per period" );
  validate_amount_not_negative( initial_mint_price, "Initial mint price" );
  validate_number_in_100_percent_range( reward_bps, "Reward bps" );

  if( end_time != time_point_sec() )
    TEMPO_VALIDATION_ASSERT( end_time > start_time, "Sale window must end after it starts",
      ("start", start_time)("end", end_time) );
}

u256 curve_parameters::peak_multiplier()const
{
  if( kind == linear_curve )
    return u256( formula_base );

  // saturates right above the 64 bit range so a 255 period curve cannot overflow 256 bits
  const u256 limit = u256( TEMPO_MAX_CURVE_MULTIPLIER ) + 1;
  u256 result = 1;
  for( uint32_t i = 0; i < num_periods; ++i )
  {
    result *= formula_base;
    if( result >= limit )
      return limit;
  }
  return result;
}

void curve_parameters::validate()const
{
  TEMPO_VALIDATION_ASSERT( kind == exponential_curve || kind == linear_curve, "Unknown curve kind", ("kind", int( kind )) );
  TEMPO_VALIDATION_ASSERT( num_periods > 0, "Curve needs at least one period" );
  TEMPO_VALIDATION_ASSERT( period_seconds > 0, "Curve period must be positive" );
  TEMPO_VALIDATION_ASSERT( min_multiplier <= formula_base,
    "Minimal multiplier cannot exceed the formula base", ("min", min_multiplier)("base", formula_base) );
  TEMPO_VALIDATION_ASSERT( peak_multiplier() <= u256( TEMPO_MAX_CURVE_MULTIPLIER ),
    "Peak multiplier does not fit in 64 bits", ("base", formula_base)("periods", num_periods) );
}

void fee_schedule::validate()const
{
  TEMPO_VALIDATION_ASSERT( uint32_t( protocol_bps ) + client_bps <= TEMPO_MAX_FEE_BPS,
    "Combined fees exceed the ceiling. Protocol: ${p}, client: ${c}, max: ${max}",
    ("p", protocol_bps)("c", client_bps)("max", TEMPO_MAX_FEE_BPS) );
  TEMPO_VALIDATION_ASSERT( protocol_recipient.empty() == ( protocol_bps == 0 ),
    "Protocol fee needs a recipient and a recipient needs a fee", ("recipient", protocol_recipient)("bps", protocol_bps) );
  TEMPO_VALIDATION_ASSERT( client_recipient.empty() == ( client_bps == 0 ),
    "Client fee needs a recipient and a recipient needs a fee", ("recipient", client_recipient)("bps", client_bps) );
  TEMPO_VALIDATION_ASSERT( client_referral_bps <= client_bps,
    "Referral fallback cannot exceed the client fee", ("referral", client_referral_bps)("client", client_bps) );
}

void genesis_state::validate()const
{
  validate_account_not_null( ledger_account, "ledger account" );
  validate_account_not_null( creator, "creator" );
  currency.validate();
  initial_tier.validate();
  TEMPO_VALIDATION_ASSERT( initial_tier.reward_curve_id == 0,
    "Initial tier can only use the initial curve", ("curve", initial_tier.reward_curve_id) );
  initial_curve.validate();
  fees.validate();
}

} } // tempo::protocol
