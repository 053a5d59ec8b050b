#pragma once

#include <tempo/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

#define TEMPO_TRY_NOTIFY( signal, ... )                                      \
  try                                                                        \
  {                                                                          \
    signal( __VA_ARGS__ );                                                   \
  }                                                                          \
  catch( const fc::exception& e )                                            \
  {                                                                          \
    elog( "Caught exception in ledger observer: ${e}", ("e", e.to_detail_string()) ); \
    throw;                                                                   \
  }                                                                          \
  catch( const std::exception& e )                                           \
  {                                                                          \
    elog( "Caught exception in ledger observer: ${e}", ("e", e.what()) );    \
    throw;                                                                   \
  }

// for notifications sent after the operation committed, a failing observer cannot undo it
#define TEMPO_TRY_NOTIFY_AND_LOG( signal, ... )                              \
  try                                                                        \
  {                                                                          \
    signal( __VA_ARGS__ );                                                   \
  }                                                                          \
  catch( const fc::exception& e )                                            \
  {                                                                          \
    elog( "Caught exception in ledger observer of a committed operation: ${e}", ("e", e.to_detail_string()) ); \
  }                                                                          \
  catch( const std::exception& e )                                           \
  {                                                                          \
    elog( "Caught exception in ledger observer of a committed operation: ${e}", ("e", e.what()) ); \
  }
