#pragma once

#include <tempo/protocol/operations.hpp>

namespace tempo { namespace chain {

struct operation_notification
{
  operation_notification( const tempo::protocol::operation& o ) : op(o) {}

  fc::time_point_sec                timestamp;
  const tempo::protocol::operation& op;
  bool                              virtual_op = false;
};

} }
