#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace taskq::sample::common
{
	/// @brief Uniformly distributed integer in [min, max] from a shared, randomly seeded generator.
	std::uint64_t random_between(std::uint64_t min, std::uint64_t max);

	/// @brief Uniformly distributed delay in [min, max].
	std::chrono::milliseconds random_delay(std::chrono::milliseconds min, std::chrono::milliseconds max);

	/// @brief Formats a byte count with a binary unit, e.g. "1.5 MiB".
	std::string format_bytes(std::uint64_t bytes);
} // namespace taskq::sample::common
