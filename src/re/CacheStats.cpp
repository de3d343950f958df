#include <re/CacheStats.hpp>
#include <re/Logger.hpp>

namespace re
{

double CacheStats::hit_rate() const
{
	auto total = hits + misses;
	if (total == 0)
	{
		return 0.0;
	}
	return 100.0 * static_cast<double>(hits) / static_cast<double>(total);
}

std::chrono::duration<double> CacheStats::average_build_time() const
{
	if (build_times.empty())
	{
		return std::chrono::duration<double>::zero();
	}
	std::chrono::duration<double> total{0.0};
	for (auto time : build_times)
	{
		total += time;
	}
	return total / static_cast<double>(build_times.size());
}

void CacheStats::log(std::string_view cache, std::string_view pass) const
{
	Logger::instance().info("{} [{}] hits: {}, misses: {}, {:.1f}%, avg. build time: {:.3f}ms", cache, pass, hits,
							misses, hit_rate(), average_build_time().count() * 1000.0);
}

} // namespace re
