#pragma once

#include <tempo/protocol/operation_util.hpp>

#include <fc/static_variant.hpp>

namespace tempo { namespace protocol {

/// "tempo::protocol::purchase_operation" -> "purchase"
inline std::string trim_operation_typename( const std::string& type_name )
{
  std::string name = type_name;
  auto start = name.rfind( "::" );
  if( start != std::string::npos )
    name = name.substr( start + 2 );
  const std::string suffix = "_operation";
  if( name.size() > suffix.size() && name.compare( name.size() - suffix.size(), suffix.size(), suffix ) == 0 )
    name.erase( name.size() - suffix.size() );
  return name;
}

struct operation_validate_visitor
{
  typedef void result_type;
  template<typename T>
  void operator()( const T& v )const { v.validate(); }
};

struct get_operation_name_visitor
{
  typedef std::string result_type;
  template<typename T>
  std::string operator()( const T& )const { return trim_operation_typename( fc::get_typename< T >::name() ); }
};

} } // tempo::protocol

//
// Place TEMPO_DEFINE_OPERATION_TYPE in a .cpp file to define
// functions related to your operation type
//
#define TEMPO_DEFINE_OPERATION_TYPE( OperationType )                      \
                                                                          \
namespace tempo { namespace protocol {                                    \
                                                                          \
void operation_validate( const OperationType& op )                        \
{                                                                         \
  op.visit( tempo::protocol::operation_validate_visitor() );              \
}                                                                         \
                                                                          \
void operation_get_required_roles( const OperationType& op,               \
                      flat_map< account_name_type, role_mask_type >& roles ) \
{                                                                         \
  op.visit( tempo::protocol::get_required_roles_visitor( roles ) );       \
}                                                                         \
                                                                          \
std::string operation_name( const OperationType& op )                     \
{                                                                         \
  return op.visit( tempo::protocol::get_operation_name_visitor() );       \
}                                                                         \
                                                                          \
} } /* tempo::protocol */
