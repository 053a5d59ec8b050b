#pragma once

#include <fc/exception/exception.hpp>

#define TEMPO_ASSERT( expr, exc_type, FORMAT, ... )             \
  FC_EXPAND_MACRO(                                              \
    FC_MULTILINE_MACRO_BEGIN                                    \
      if( UNLIKELY(!(expr)) )                                   \
      {                                                         \
        if( fc::enable_record_assert_trip )                     \
           fc::record_assert_trip( __FILE__, __LINE__, #expr ); \
        FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );    \
      }                                                         \
    FC_MULTILINE_MACRO_END                                      \
  )

#define TEMPO_VALIDATION_ASSERT( expr, ... ) \
  TEMPO_ASSERT( expr, tempo::protocol::validation_exception, __VA_ARGS__ )

namespace tempo { namespace protocol {

  FC_DECLARE_EXCEPTION( ledger_exception, 4000000, "ledger exception" )

  FC_DECLARE_DERIVED_EXCEPTION( validation_exception,          tempo::protocol::ledger_exception,             4010000, "invalid parameters" )
  FC_DECLARE_DERIVED_EXCEPTION( invalid_account_exception,     tempo::protocol::validation_exception,         4010100, "invalid account" )

  FC_DECLARE_DERIVED_EXCEPTION( authorization_exception,       tempo::protocol::ledger_exception,             4020000, "caller lacks required role" )

  FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds_exception,  tempo::protocol::ledger_exception,             4030000, "insufficient funds" )
  FC_DECLARE_DERIVED_EXCEPTION( invalid_capture_exception,     tempo::protocol::insufficient_funds_exception, 4030100, "invalid capture" )

  FC_DECLARE_DERIVED_EXCEPTION( capacity_exceeded_exception,   tempo::protocol::ledger_exception,             4040000, "capacity exceeded" )

  FC_DECLARE_DERIVED_EXCEPTION( state_conflict_exception,      tempo::protocol::ledger_exception,             4050000, "state conflict" )
  FC_DECLARE_DERIVED_EXCEPTION( tier_invalid_switch_exception, tempo::protocol::state_conflict_exception,     4050100, "invalid tier switch" )
  FC_DECLARE_DERIVED_EXCEPTION( reentrancy_exception,          tempo::protocol::state_conflict_exception,     4050200, "reentrant call" )

  FC_DECLARE_DERIVED_EXCEPTION( not_eligible_exception,        tempo::protocol::ledger_exception,             4060000, "not eligible" )
  FC_DECLARE_DERIVED_EXCEPTION( not_slashable_exception,       tempo::protocol::not_eligible_exception,       4060100, "not slashable" )

  FC_DECLARE_DERIVED_EXCEPTION( transfer_failed_exception,     tempo::protocol::ledger_exception,             4070000, "transfer failed" )

} } // tempo::protocol
