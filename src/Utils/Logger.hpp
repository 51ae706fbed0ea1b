/*
 * TrackShield - Tracker Blocking Engine
 * Copyright (C) 2026 TrackShield Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once
/**
 * @file Logger.hpp
 * @brief Process-wide logger used by every TrackShield module.
 *
 * Records go through a bounded queue to a worker thread (or straight to the
 * sinks in synchronous mode). Sinks are stderr and a size-rotated file, as
 * plain text or one JSON object per line. The matcher lookup path never logs.
 *
 * @warning Logging macros are no-ops until Initialize() has been called.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace TrackShield {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/// @brief Ascending severity; records below LoggerConfig::minimalLevel are dropped
		enum class LogLevel : uint8_t {
			Trace = 0,
			Debug,      ///< Rejected patterns, per-request decisions
			Info,       ///< Lifecycle: initialization, list loads, shutdown
			Warn,
			Error,
			Fatal       ///< Out of memory during bulk compilation
		};

		/// @brief Upper-case level name ("INFO", "WARN", ...)
		[[nodiscard]] const char* GetLogLevelName(LogLevel level) noexcept;

		/// @brief Parse a level name, case-insensitive ("info", "Warn", ...)
		[[nodiscard]] bool ParseLogLevel(std::string_view name, LogLevel& out) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Filled from the "logging" section of the configuration file;
		 *        queue and rotation sizes keep these defaults there.
		 */
		struct LoggerConfig {
			/// Pending records held for the worker
			size_t maxQueueSize = 1000;

			/// What Enqueue does once the queue holds maxQueueSize records
			enum class BackPressurePolicy {
				Block,
				DropOldest,
				DropNewest
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;              ///< Fixed by the first Initialize
			bool toConsole = true;          ///< stderr; stdout stays free for CLI verdicts
			bool toFile = false;
			bool jsonLines = false;         ///< Keys: ts, lvl, cat, pid, tid, file, line, func, msg
			bool includeSrcLocation = true;
			bool includeProcThreadId = true;

			std::string logDirectory = "logs";
			std::string baseFileName = "TrackShield";   ///< Active file is <logDirectory>/<baseFileName>.log
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;
			size_t maxFileCount = 10;                    ///< Rotated files kept as <baseFileName>.1.log and up

			LogLevel minimalLevel = LogLevel::Info;
			LogLevel flushLevel = LogLevel::Error;       ///< File is flushed after records at or above this level
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Singleton; all public methods may be called from any thread.
		 *
		 * @code
		 *   Logger::Instance().Initialize(config.logging.ToLoggerConfig());
		 *   TS_LOG_INFO("TrackerBlocker", "Loaded %zu patterns", count);
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 */
		class Logger {
		public:
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * Calling Initialize on a running logger only updates the configuration
			 * and the minimum level.
			 */
			void Initialize(const LoggerConfig& cfg);

			/// @brief Drains the queue, joins the worker and closes the file
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/// @brief printf-style; normally reached through the TS_LOG_* macros
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
				__attribute__((format(printf, 7, 8)))
#endif
				;


			void LogMessage(LogLevel level,
			                const char* category,
			                std::string message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr);

			/// @brief Writes queued records on the calling thread, then flushes the file
			void Flush();

			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/// @brief Logs "Enter" on construction and "Exit (N us)" on destruction
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger() = default;
			~Logger();

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				uint32_t pid = 0;
				uint64_t tid = 0;
				std::chrono::system_clock::time_point ts;
			};

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			[[nodiscard]] bool Dequeue(LogItem& out);
			void Dispatch(const LogItem& item);

			void WriteConsole(const LogItem& item);
			void WriteFile(const LogItem& item);

			[[nodiscard]] std::string FormatPrefix(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] std::string FormatLine(const LogItem& item) const;

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			[[nodiscard]] std::filesystem::path BaseLogPath() const;
			[[nodiscard]] std::filesystem::path RotatedLogPath(size_t index) const;

			[[nodiscard]] static std::string FormatIso8601UTC(std::chrono::system_clock::time_point ts);

			std::atomic<bool> m_accepting{ false };
			std::atomic<bool> m_initialized{ false };
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			LoggerConfig m_cfg{};
			mutable std::mutex m_cfgMutex;

			std::deque<LogItem> m_queue;
			mutable std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::condition_variable m_spaceCv;

			std::thread m_worker;
			std::atomic<bool> m_stop{ false };

			/// Serializes sink writes between the worker and Flush()/sync mode
			std::mutex m_sinkMutex;
			std::ofstream m_file;
			uint64_t m_currentSize{ 0 };
		};

	}  // namespace Utils
}  // namespace TrackShield

// ============================================================================
// LOGGING MACROS
// ============================================================================
//
// The category is the module name ("PatternMatcher", "TrackerBlocker",
// "Config", ...). Arguments are not evaluated when the level is filtered out.
//
//   TS_LOG_WARN("FilterList", "Skipping %s", path.c_str());
//   TS_LOG_SCOPE("TrackerBlocker");
// ============================================================================

#define TS_LOG_AT(level, category, fmt, ...) \
    do { \
        auto& _lg = ::TrackShield::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(level)) { \
            _lg.LogEx((level), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

#define TS_LOG_TRACE(category, fmt, ...) TS_LOG_AT(::TrackShield::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

#define TS_LOG_DEBUG(category, fmt, ...) TS_LOG_AT(::TrackShield::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

#define TS_LOG_INFO(category, fmt, ...)  TS_LOG_AT(::TrackShield::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

#define TS_LOG_WARN(category, fmt, ...)  TS_LOG_AT(::TrackShield::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

#define TS_LOG_ERROR(category, fmt, ...) TS_LOG_AT(::TrackShield::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

#define TS_LOG_FATAL(category, fmt, ...) TS_LOG_AT(::TrackShield::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define TS_LOG_CONCAT_INNER(a, b) a##b
#define TS_LOG_CONCAT(a, b) TS_LOG_CONCAT_INNER(a, b)

/// @brief Debug-level entry/exit records with the elapsed time
#define TS_LOG_SCOPE(category) \
    ::TrackShield::Utils::Logger::Scope TS_LOG_CONCAT(_ts_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __func__)
