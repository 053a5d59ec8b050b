#pragma once
#include <tempo/protocol/ledger_configuration.hpp>

#define TEMPO_LEDGER_VERSION "1.0.0"

////////// constexpresions

#define TEMPO_100_PERCENT tempo::protocol::ledger_configuration::tempo_100_percent
#define TEMPO_1_PERCENT tempo::protocol::ledger_configuration::tempo_1_percent
#define TEMPO_1_BASIS_POINT tempo::protocol::ledger_configuration::tempo_1_basis_point
#define TEMPO_MAX_FEE_BPS tempo::protocol::ledger_configuration::tempo_max_fee_bps
#define TEMPO_MAX_REWARD_BPS tempo::protocol::ledger_configuration::tempo_max_reward_bps
#define TEMPO_MAX_TIERS tempo::protocol::ledger_configuration::tempo_max_tiers
#define TEMPO_MAX_REWARD_CURVES tempo::protocol::ledger_configuration::tempo_max_reward_curves
#define TEMPO_MAX_CURVE_PERIODS tempo::protocol::ledger_configuration::tempo_max_curve_periods
#define TEMPO_MAX_CURVE_MULTIPLIER tempo::protocol::ledger_configuration::tempo_max_curve_multiplier
#define TEMPO_POINTS_MAGNITUDE_BITS tempo::protocol::ledger_configuration::tempo_points_magnitude_bits
#define TEMPO_ONE_DAY_SECONDS tempo::protocol::ledger_configuration::tempo_one_day_seconds
#define TEMPO_MAX_PERIOD_DURATION_SECONDS tempo::protocol::ledger_configuration::tempo_max_period_duration_seconds
#define TEMPO_DEFAULT_SHARED_FILE_SIZE tempo::protocol::ledger_configuration::tempo_default_shared_file_size

////////// strings

#define TEMPO_NULL_ACCOUNT ""

////////// roles

#define TEMPO_ROLE_MANAGER  0x01
#define TEMPO_ROLE_AGENT    0x02
#define TEMPO_ROLE_IDENTITY 0x04
