//
// Created by chris on 1/7/26.
//

#ifndef ESTRENDER_LOGGER_HPP
#define ESTRENDER_LOGGER_HPP
#include <cstdlib>
#include <filesystem>
#include <source_location>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace est
{

/// Environment variable overriding the console level, e.g. ESTRENDER_LOG_LEVEL=debug.
constexpr const char* LOG_LEVEL_VARIABLE = "ESTRENDER_LOG_LEVEL";

/**
 * @brief Process wide logger writing to the console and to LOG_FILE
 *
 * Debug builds log everything to both sinks, release builds only warnings and above to
 * the console. The file always receives trace. instance() stamps the caller's file and
 * line into the pattern.
 */
class Logger : public spdlog::logger
{
	std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> m_console_sink;
	std::shared_ptr<spdlog::sinks::basic_file_sink_mt>	 m_file_sink;

	Logger()
		: logger("EstRender")
		, m_console_sink(std::make_shared<spdlog::sinks::stdout_color_sink_mt>())
		, m_file_sink(std::make_shared<spdlog::sinks::basic_file_sink_mt>(LOG_FILE, true))
	{
#ifndef NDEBUG
		m_console_sink->set_level(spdlog::level::trace);
#else
		m_console_sink->set_level(spdlog::level::warn);
#endif
		if (const char* requested = std::getenv(LOG_LEVEL_VARIABLE))
		{
			m_console_sink->set_level(spdlog::level::from_str(requested));
		}
		m_file_sink->set_level(spdlog::level::trace);
		set_level(spdlog::level::trace);
		flush_on(spdlog::level::err);
		sinks().push_back(m_console_sink);
		sinks().push_back(m_file_sink);
	}

public:
	static Logger& instance(std::source_location loc = std::source_location::current())
	{
		static Logger logger;
		std::filesystem::path path = loc.file_name();
		auto location = fmt::format("[{}:{}]", std::string{path.filename()}, loc.line());
		auto pattern  = fmt::format("[EstRender]{:<30}[%^%5l%$] %v", location);
		logger.set_pattern(pattern);
		return logger;
	}

	/// Level of the console sink only, the file keeps logging at trace.
	void set_console_level(spdlog::level::level_enum level) { m_console_sink->set_level(level); }
	[[nodiscard]] spdlog::level::level_enum console_level() const { return m_console_sink->level(); }
};

} // namespace est

#endif // ESTRENDER_LOGGER_HPP
