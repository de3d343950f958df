#ifndef RENDERENGINE_LOGGER_HPP
#define RENDERENGINE_LOGGER_HPP
#include <filesystem>
#include <source_location>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace re
{

class Logger : public spdlog::logger
{
	std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink;
	std::shared_ptr<spdlog::sinks::basic_file_sink_mt>	 file_sink;
	Logger()
		: logger("RenderEngine")
		, console_sink(std::make_shared<spdlog::sinks::stdout_color_sink_mt>())
		, file_sink(std::make_shared<spdlog::sinks::basic_file_sink_mt>(LOG_FILE, true))
	{
#ifndef NDEBUG
		console_sink->set_level(spdlog::level::trace);
#else
		console_sink->set_level(spdlog::level::warn);
#endif
		file_sink->set_level(spdlog::level::trace);
		sinks().push_back(console_sink);
		sinks().push_back(file_sink);
		set_level(spdlog::level::trace);
	}

public:
	/// Tag shown in place of the call site, e.g. "[VulkanDebug]" for validation output.
	static std::string tagged_pattern(std::string_view tag)
	{
		return fmt::format("[RenderEngine]{:<34}[%^%5l%$] %v", tag);
	}

	static Logger& instance(std::source_location loc = std::source_location::current())
	{
		static Logger logger;
		std::filesystem::path path = loc.file_name();
		logger.set_pattern(tagged_pattern(fmt::format("[{}:{}]", path.filename().string(), loc.line())));
		return logger;
	}
};

} // namespace re

#endif // RENDERENGINE_LOGGER_HPP
