#include <tempo/protocol/operations.hpp>

#include <tempo/protocol/operation_util_impl.hpp>

namespace tempo { namespace protocol {

struct is_vop_visitor
{
  typedef bool result_type;

  template< typename T >
  bool operator()( const T& v )const { return v.is_virtual(); }
};

bool is_virtual_operation( const operation& op )
{
  return op.visit( is_vop_visitor() );
}

} } // tempo::protocol

TEMPO_DEFINE_OPERATION_TYPE( tempo::protocol::operation )
