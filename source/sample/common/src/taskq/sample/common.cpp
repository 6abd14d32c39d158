#include "taskq/sample/common.hpp"

#include <array>
#include <format>
#include <mutex>
#include <random>
#include <string_view>

namespace taskq::sample::common
{
	namespace
	{
		std::uint64_t make_seed() noexcept
		{
			try
			{
				std::random_device rd;
				return (static_cast<std::uint64_t>(rd()) << 32) | rd();
			}
			catch (const std::exception&)
			{
				// No entropy source, the clock will do for a demo
				return static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()) ^ 0x9E3779B97F4A7C15ull;
			}
		}
	}

	std::uint64_t random_between(const std::uint64_t min, const std::uint64_t max)
	{
		static std::mutex gen_mutex;
		static std::mt19937_64 gen(make_seed());

		std::uniform_int_distribution<std::uint64_t> dist(min, max);
		std::lock_guard<std::mutex> lock(gen_mutex);
		return dist(gen);
	}

	std::chrono::milliseconds random_delay(const std::chrono::milliseconds min, const std::chrono::milliseconds max)
	{
		const auto value = random_between(static_cast<std::uint64_t>(min.count()), static_cast<std::uint64_t>(max.count()));
		return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
	}

	std::string format_bytes(const std::uint64_t bytes)
	{
		static constexpr std::array<std::string_view, 5> units {"B", "KiB", "MiB", "GiB", "TiB"};
		if (bytes < 1024u)
			return std::format("{} {}", bytes, units.front());

		auto value = static_cast<double>(bytes);
		std::size_t unit = 0u;
		for (; (value >= 1024.0) && (unit + 1u < units.size()); ++unit)
			value /= 1024.0;

		return std::format("{:.1f} {}", value, units[unit]);
	}
} // namespace taskq::sample::common
