#pragma once

#include <tempo/protocol/types.hpp>
#include <tempo/protocol/config.hpp>
#include <tempo/protocol/exceptions.hpp>

#include <fc/time.hpp>

namespace tempo { namespace protocol {

  struct base_operation
  {
    /// roles are checked as "any of": the caller must hold at least one bit of the mask
    void get_required_roles( flat_map< account_name_type, role_mask_type >& )const {}

    bool is_virtual()const { return false; }
    void validate()const {}
  };

  struct virtual_operation : public base_operation
  {
    bool is_virtual()const { return true; }
    void validate()const { FC_ASSERT( false, "This is a virtual operation" ); }
  };

} } // tempo::protocol
