#include "Log.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include <mutex>

#define SN_NetLoggerName "Net"
#define SN_AppLoggerName "Peer"

namespace Spraynet
{
	std::shared_ptr<spdlog::logger> CLog::S_NetLogger;
	std::shared_ptr<spdlog::logger> CLog::S_AppLogger;

	namespace
	{
		std::mutex s_logger_mutex;

		std::shared_ptr<spdlog::sinks::sink> ConsoleSink()
		{
			static auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
			return console_sink;
		}

		std::shared_ptr<spdlog::logger> MakeLogger( const char* name )
		{
			auto logger = std::make_shared<spdlog::logger>( name, spdlog::sinks_init_list { ConsoleSink() } );
			logger->set_pattern( "[%H:%M:%S.%e] [%n] [%^---%L---%$] [thread %t] %v" );
			logger->set_level( spdlog::level::info );
			return logger;
		}
	}

	void CLog::Init( const std::string& log_file )
	{
		std::lock_guard<std::mutex> lock( s_logger_mutex );
		S_NetLogger = MakeLogger( SN_NetLoggerName );
		S_AppLogger = MakeLogger( SN_AppLoggerName );

		// make it output to file
		if ( !log_file.empty() )
		{
			auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>( log_file, true );
			file_sink->set_pattern( "[%Y-%m-%d %H:%M:%S.%e] [%n] [%L] [thread %t] %v" );
			S_NetLogger->sinks().push_back( file_sink );
			S_AppLogger->sinks().push_back( file_sink );
		}
	}

	void CLog::Shutdown()
	{
		LOG_APP_TRACE( "Destroying Log" );

		if ( S_NetLogger ) S_NetLogger->flush();
		if ( S_AppLogger ) S_AppLogger->flush();

		spdlog::drop_all();
		spdlog::shutdown();
		S_NetLogger.reset();
		S_AppLogger.reset();
	}

	void CLog::SetLevel( spdlog::level::level_enum level )
	{
		GetNetLogger()->set_level( level );
		GetAppLogger()->set_level( level );
	}

	std::shared_ptr<spdlog::logger>& CLog::GetNetLogger()
	{
		std::lock_guard<std::mutex> lock( s_logger_mutex );
		if ( !S_NetLogger )
			S_NetLogger = MakeLogger( SN_NetLoggerName );
		return S_NetLogger;
	}

	std::shared_ptr<spdlog::logger>& CLog::GetAppLogger()
	{
		std::lock_guard<std::mutex> lock( s_logger_mutex );
		if ( !S_AppLogger )
			S_AppLogger = MakeLogger( SN_AppLoggerName );
		return S_AppLogger;
	}
}
