#pragma once

#include <cstdint>
#include <limits>

namespace tempo
{
  namespace protocol
  {
    namespace ledger_configuration
    {

      // has to be const, because they are used in static checks and as template parameters

      constexpr uint32_t tempo_100_percent{10'000u};
      constexpr uint32_t tempo_1_percent{tempo_100_percent / 100};
      constexpr uint32_t tempo_1_basis_point{tempo_100_percent / 10'000};

      // protocol + client fee ceiling, 12.5%
      constexpr uint32_t tempo_max_fee_bps{1'250u};
      constexpr uint32_t tempo_max_reward_bps{tempo_100_percent};

      constexpr uint32_t tempo_max_tiers{std::numeric_limits<uint16_t>::max()};
      constexpr uint32_t tempo_max_reward_curves{std::numeric_limits<uint8_t>::max()};

      constexpr uint32_t tempo_max_curve_periods{std::numeric_limits<uint8_t>::max()};
      constexpr uint64_t tempo_max_curve_multiplier{std::numeric_limits<uint64_t>::max()};

      // points per share are magnified by 2^64 before division by total shares
      constexpr uint32_t tempo_points_magnitude_bits{64u};

      constexpr uint32_t tempo_one_day_seconds{60u * 60 * 24};
      constexpr uint32_t tempo_max_period_duration_seconds{tempo_one_day_seconds * 365 * 100};

      constexpr uint64_t tempo_default_shared_file_size{64ull * 1024 * 1024};

    } // ledger_configuration
  } // protocol
} // tempo
