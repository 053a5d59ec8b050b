#pragma once

#include <tempo/protocol/base.hpp>

#include <fc/variant.hpp>

#include <boost/container/flat_map.hpp>

#include <string>

namespace tempo { namespace protocol {

struct get_required_roles_visitor
{
  typedef void result_type;

  flat_map< account_name_type, role_mask_type >& roles;

  get_required_roles_visitor( flat_map< account_name_type, role_mask_type >& r )
    : roles( r ) {}

  template< typename ...Ts >
  void operator()( const fc::static_variant< Ts... >& v )
  {
    v.visit( *this );
  }

  template< typename T >
  void operator()( const T& v )const
  {
    v.get_required_roles( roles );
  }
};

} } // tempo::protocol

//
// Place TEMPO_DECLARE_OPERATION_TYPE in a .hpp file to declare
// functions related to your operation type
//
#define TEMPO_DECLARE_OPERATION_TYPE( OperationType )                           \
                                                                                 \
namespace tempo { namespace protocol {                                           \
                                                                                 \
void operation_validate( const OperationType& o );                               \
void operation_get_required_roles( const OperationType& op,                      \
                      flat_map< account_name_type, role_mask_type >& roles );    \
std::string operation_name( const OperationType& op );                           \
                                                                                 \
} } /* tempo::protocol */
