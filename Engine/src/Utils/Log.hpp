#pragma once

#include <memory>
#include <string>

#include "spdlog/spdlog.h"
#include "spdlog/fmt/ostr.h"

namespace Spraynet
{
	class CLog
	{
	public:
		// Installs console + optional file sink. Safe to skip (loggers are created on first use).
		static void Init( const std::string& log_file = "" );
		static void Shutdown();

		static void SetLevel( spdlog::level::level_enum level );

		static std::shared_ptr<spdlog::logger>& GetNetLogger();
		static std::shared_ptr<spdlog::logger>& GetAppLogger();

	private:
		static std::shared_ptr<spdlog::logger> S_NetLogger;
		static std::shared_ptr<spdlog::logger> S_AppLogger;
	};
}

// Protocol core
#define LOG_NET_TRACE( ... ) ::Spraynet::CLog::GetNetLogger()->trace( __VA_ARGS__ )
#define LOG_NET_DEBUG( ... ) ::Spraynet::CLog::GetNetLogger()->debug( __VA_ARGS__ )
#define LOG_NET_INFO( ... )  ::Spraynet::CLog::GetNetLogger()->info( __VA_ARGS__ )
#define LOG_NET_WARN( ... )  ::Spraynet::CLog::GetNetLogger()->warn( __VA_ARGS__ )
#define LOG_NET_ERROR( ... ) ::Spraynet::CLog::GetNetLogger()->error( __VA_ARGS__ )

// Application and transport
#define LOG_APP_TRACE( ... ) ::Spraynet::CLog::GetAppLogger()->trace( __VA_ARGS__ )
#define LOG_APP_DEBUG( ... ) ::Spraynet::CLog::GetAppLogger()->debug( __VA_ARGS__ )
#define LOG_APP_INFO( ... )  ::Spraynet::CLog::GetAppLogger()->info( __VA_ARGS__ )
#define LOG_APP_WARN( ... )  ::Spraynet::CLog::GetAppLogger()->warn( __VA_ARGS__ )
#define LOG_APP_ERROR( ... ) ::Spraynet::CLog::GetAppLogger()->error( __VA_ARGS__ )
