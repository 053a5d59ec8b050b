#pragma once

#include <chainbase/chainbase.hpp>
#include <chainbase/util/object_id_serialization.hpp>

#include <tempo/protocol/types.hpp>
#include <tempo/protocol/config.hpp>
#include <tempo/protocol/ledger_parameters.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace tempo { namespace chain {

using chainbase::object;
using chainbase::oid;
using chainbase::oid_ref;
using chainbase::allocator;

using tempo::protocol::account_name_type;
using tempo::protocol::share_type;
using tempo::protocol::ushare_type;
using tempo::protocol::tier_id_type;
using tempo::protocol::curve_id_type;
using tempo::protocol::token_id_type;
using tempo::protocol::referral_code_type;
using tempo::protocol::role_mask_type;
using tempo::protocol::currency_type;
using tempo::protocol::tier_parameters;
using tempo::protocol::curve_parameters;
using tempo::protocol::fee_schedule;
using tempo::protocol::time_point_sec;

using boost::multi_index::multi_index_container;
using boost::multi_index::indexed_by;
using boost::multi_index::ordered_unique;
using boost::multi_index::tag;
using boost::multi_index::member;
using boost::multi_index::composite_key;
using boost::multi_index::composite_key_compare;
using boost::multi_index::const_mem_fun;

using chainbase::by_id;
struct by_account;
struct by_tier;
struct by_curve;
struct by_token;
struct by_code;
struct by_currency_owner;

enum object_type
{
  dynamic_global_property_object_type,
  fee_schedule_object_type,
  reward_pool_object_type,
  tier_object_type,
  reward_curve_object_type,
  subscription_object_type,
  reward_holder_object_type,
  referral_code_object_type,
  asset_balance_object_type
};

class dynamic_global_property_object;
class fee_schedule_object;
class reward_pool_object;
class tier_object;
class reward_curve_object;
class subscription_object;
class reward_holder_object;
class referral_code_object;
class asset_balance_object;

typedef oid_ref< dynamic_global_property_object > dynamic_global_property_id_type;
typedef oid_ref< fee_schedule_object            > fee_schedule_id_type;
typedef oid_ref< reward_pool_object             > reward_pool_id_type;
typedef oid_ref< tier_object                    > tier_object_id_type;
typedef oid_ref< reward_curve_object            > reward_curve_object_id_type;
typedef oid_ref< subscription_object            > subscription_id_type;
typedef oid_ref< reward_holder_object           > reward_holder_id_type;
typedef oid_ref< referral_code_object           > referral_code_id_type;
typedef oid_ref< asset_balance_object           > asset_balance_id_type;

} } //tempo::chain

FC_REFLECT_ENUM( tempo::chain::object_type,
            (dynamic_global_property_object_type)
            (fee_schedule_object_type)
            (reward_pool_object_type)
            (tier_object_type)
            (reward_curve_object_type)
            (subscription_object_type)
            (reward_holder_object_type)
            (referral_code_object_type)
            (asset_balance_object_type)
          )
