#ifndef RENDERENGINE_CACHESTATS_HPP
#define RENDERENGINE_CACHESTATS_HPP

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace re
{

/// Hit/miss counters shared by the pipeline and collection caches.
struct CacheStats
{
	uint64_t hits = 0;
	uint64_t misses = 0;
	/// Time spent building each missed entry.
	std::vector<std::chrono::duration<double>> build_times;

	/// Percentage of lookups served from the cache, 0 when there were none.
	[[nodiscard]] double hit_rate() const;
	[[nodiscard]] std::chrono::duration<double> average_build_time() const;

	void log(std::string_view cache, std::string_view pass) const;
};

} // namespace re

#endif // RENDERENGINE_CACHESTATS_HPP
