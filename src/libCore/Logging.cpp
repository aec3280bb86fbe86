#include "Logging.hpp"

#include "Logger/LogConfig.hpp"
#include "Logger/LogOutputConsole.hpp"
#include "Logger/LogOutputFile.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>

namespace shroom {

static Logging::LogConfig config;

#ifdef NDEBUG
constexpr auto kMinLogLevel = Logging::LogLevel::Info; //!< Session milestones and ignored misuse only.
#else
constexpr auto kMinLogLevel = Logging::LogLevel::Any; //!< Includes per-coin bookkeeping.
#endif

//! Session log file. Debug builds also mirror every entry to the console.
static void InitializeLogger() {
	config.SetLogEnabled(true);
	config.SetMinLogLevel(kMinLogLevel);

	// Get and create default logging dir
	const auto logPath = Logging::GetDefaultLogDir("Shroom/Core");

	std::error_code ec{};
	std::filesystem::create_directories(logPath, ec);
	if (!ec) {
		config.AddLogOutput(std::make_shared<Logging::LogOutputFile>(logPath / "session.log"));
	} else {
		std::cerr << std::format("[Logger] Could not create directory: {}\nApplication will not log to file.", logPath.string());
	}

#ifndef NDEBUG
	config.AddLogOutput(std::make_shared<Logging::LogOutputConsole>());
#endif

	Logging::Logger(config).Log(Logging::LogLevel::Info, "[Session] Logging started.");
}

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, InitializeLogger);

	return Logging::Logger(config);
}

} // namespace shroom
