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
#include "pch.h"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <functional>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace TrackShield {

	namespace Utils {

		const char* GetLogLevelName(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			default:              return "UNKNOWN";
			}
		}

		bool ParseLogLevel(std::string_view name, LogLevel& out) noexcept {
			std::string lower;
			lower.reserve(name.size());
			for (char c : name) {
				lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
			}

			if (lower == "trace") { out = LogLevel::Trace; return true; }
			if (lower == "debug") { out = LogLevel::Debug; return true; }
			if (lower == "info")  { out = LogLevel::Info;  return true; }
			if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
			if (lower == "error") { out = LogLevel::Error; return true; }
			if (lower == "fatal") { out = LogLevel::Fatal; return true; }
			return false;
		}

		Logger& Logger::Instance()
		{
			static Logger g_instance;
			return g_instance;
		}

		Logger::~Logger()
		{
			ShutDown();
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			const LogLevel minLevel = m_minLevel.load(std::memory_order_acquire);
			return static_cast<int>(level) >= static_cast<int>(minLevel);
		}

		bool Logger::IsInitialized() const noexcept
		{
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			bool expected = false;

			if (!m_initialized.compare_exchange_strong(expected, true)) {
				// Already running: only the configuration changes. The async mode is
				// fixed for the lifetime of the worker.
				{
					std::lock_guard<std::mutex> lk(m_cfgMutex);
					const bool async = m_cfg.async;
					m_cfg = cfg;
					m_cfg.async = async;
					m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
				}
				// Reopened lazily against the new directory and base name
				std::lock_guard<std::mutex> sk(m_sinkMutex);
				if (m_file.is_open()) {
					m_file.flush();
					m_file.close();
				}
				return;
			}

			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				m_cfg = cfg;
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			}

			if (m_cfg.toFile) {
				std::lock_guard<std::mutex> lk(m_sinkMutex);
				OpenLogFileIfNeeded();
			}

			m_stop.store(false, std::memory_order_release);

			// Worker must exist before log acceptance is enabled
			if (m_cfg.async) {
				try {
					m_worker = std::thread([this]() { WorkerLoop(); });
				}
				catch (const std::system_error& ex) {
					std::fprintf(stderr, "[Logger] Worker thread failed to start (%s), using synchronous mode\n", ex.what());
					std::lock_guard<std::mutex> lk(m_cfgMutex);
					m_cfg.async = false;
				}
			}

			m_accepting.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			bool expected = true;
			if (!m_initialized.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
				return;
			}

			m_accepting.store(false, std::memory_order_release);

			{
				std::lock_guard<std::mutex> lk(m_queueMutex);
				m_stop.store(true, std::memory_order_release);
			}
			m_queueCv.notify_all();
			m_spaceCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			// Worker has stopped; drain whatever is left synchronously
			LogItem item;
			while (Dequeue(item)) {
				Dispatch(item);
			}

			std::lock_guard<std::mutex> lk(m_sinkMutex);
			if (m_file.is_open()) {
				m_file.flush();
				m_file.close();
			}
			m_currentSize = 0;
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		void Logger::Enqueue(LogItem&& item) {
			if (!m_accepting.load(std::memory_order_acquire)) return;
			if (!IsEnabled(item.level)) return;

			bool async = false;
			size_t maxQueue = 0;
			LoggerConfig::BackPressurePolicy policy{};
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				async = m_cfg.async;
				maxQueue = std::max<size_t>(1, m_cfg.maxQueueSize);
				policy = m_cfg.bpPolicy;
			}

			if (!async) {
				Dispatch(item);
				return;
			}

			std::unique_lock<std::mutex> lk(m_queueMutex);
			if (m_queue.size() >= maxQueue) {
				switch (policy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_spaceCv.wait(lk, [&]() {
						return m_stop.load(std::memory_order_acquire) || m_queue.size() < maxQueue;
					});
					if (m_stop.load(std::memory_order_acquire)) return;
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					return;
				}
			}

			m_queue.emplace_back(std::move(item));
			lk.unlock();
			m_queueCv.notify_one();
		}

		bool Logger::Dequeue(LogItem& out) {
			std::lock_guard<std::mutex> lk(m_queueMutex);
			if (m_queue.empty()) return false;
			out = std::move(m_queue.front());
			m_queue.pop_front();
			m_spaceCv.notify_one();
			return true;
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lk(m_queueMutex);
					m_queueCv.wait_for(lk, std::chrono::seconds(1), [this]() {
						return m_stop.load(std::memory_order_acquire) || !m_queue.empty();
					});

					if (m_stop.load(std::memory_order_acquire) && m_queue.empty()) break;
					if (m_queue.empty()) continue;

					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_spaceCv.notify_one();

				// Sinks are written outside the queue lock
				Dispatch(item);
			}
		}

		void Logger::Dispatch(const LogItem& item) {
			bool toConsole = false;
			bool toFile = false;
			bool flush = false;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				toConsole = m_cfg.toConsole;
				toFile = m_cfg.toFile;
				flush = static_cast<int>(item.level) >= static_cast<int>(m_cfg.flushLevel);
			}

			std::lock_guard<std::mutex> lk(m_sinkMutex);
			if (toConsole) WriteConsole(item);
			if (toFile) {
				WriteFile(item);
				if (flush && m_file.is_open()) m_file.flush();
			}
		}

		void Logger::LogEx(LogLevel level,
			const char* category,
			const char* file,
			int line,
			const char* function,
			const char* format, ...) {

			if (!IsEnabled(level)) return;

			va_list args;
			va_start(args, format);
			std::string msg = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, std::move(msg), file, line, function);
		}

		void Logger::LogMessage(LogLevel level,
			const char* category,
			std::string message,
			const char* file,
			int line,
			const char* function) {

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = std::move(message);
			if (file) {
				// Keep only the file name, build paths are noise in log lines
				item.file = std::filesystem::path(file).filename().string();
			}
			item.function = function ? function : "";
			item.line = line;
			item.pid = static_cast<uint32_t>(::getpid());
			item.tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			item.ts = std::chrono::system_clock::now();

			Enqueue(std::move(item));
		}

		void Logger::Flush()
		{
			LogItem item;
			while (Dequeue(item)) {
				Dispatch(item);
			}

			std::lock_guard<std::mutex> lk(m_sinkMutex);
			if (m_file.is_open()) m_file.flush();
			std::fflush(stderr);
		}

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return {};

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);

			if (needed <= 0) return {};

			std::string out(static_cast<size_t>(needed) + 1, '\0');
			std::vsnprintf(out.data(), out.size(), fmt, args);
			out.resize(static_cast<size_t>(needed));
			return out;
		}

		std::string Logger::FormatIso8601UTC(std::chrono::system_clock::time_point ts) {
			const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(ts);
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts - secs).count();
			const std::time_t t = std::chrono::system_clock::to_time_t(secs);

			std::tm tmUtc{};
			::gmtime_r(&t, &tmUtc);

			char buf[40];
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
				tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
				tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, static_cast<int>(millis));
			return buf;
		}

		namespace {
			std::string EscapeJson(const std::string& s) {
				std::string out;
				out.reserve(s.size() + 8);
				for (char c : s) {
					switch (c) {
					case '"':  out += "\\\""; break;
					case '\\': out += "\\\\"; break;
					case '\n': out += "\\n"; break;
					case '\r': out += "\\r"; break;
					case '\t': out += "\\t"; break;
					default:
						if (static_cast<unsigned char>(c) < 0x20) {
							char buf[8];
							std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
							out += buf;
						}
						else {
							out += c;
						}
					}
				}
				return out;
			}
		}

		std::string Logger::FormatPrefix(const LogItem& item) const {
			std::string s;
			s.reserve(128);
			s += FormatIso8601UTC(item.ts);
			s += " [";
			s += GetLogLevelName(item.level);
			s += "]";

			if (!item.category.empty()) {
				s += " [";
				s += item.category;
				s += "]";
			}

			if (m_cfg.includeProcThreadId) {
				s += " (";
				s += std::to_string(item.pid);
				s += ":";
				s += std::to_string(item.tid);
				s += ")";
			}

			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				s += " ";
				s += item.file;
				s += ":";
				s += std::to_string(item.line);

				if (!item.function.empty()) {
					s += " ";
					s += item.function;
				}
			}

			s += " - ";
			return s;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::string s;
			s.reserve(128 + item.message.size());
			s += "{\"ts\":\"";
			s += FormatIso8601UTC(item.ts);
			s += "\",\"lvl\":\"";
			s += GetLogLevelName(item.level);
			s += "\"";

			if (!item.category.empty()) {
				s += ",\"cat\":\"";
				s += EscapeJson(item.category);
				s += "\"";
			}

			if (m_cfg.includeProcThreadId) {
				s += ",\"pid\":";
				s += std::to_string(item.pid);
				s += ",\"tid\":";
				s += std::to_string(item.tid);
			}

			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				s += ",\"file\":\"";
				s += EscapeJson(item.file);
				s += "\",\"line\":";
				s += std::to_string(item.line);

				if (!item.function.empty()) {
					s += ",\"func\":\"";
					s += EscapeJson(item.function);
					s += "\"";
				}
			}

			s += ",\"msg\":\"";
			s += EscapeJson(item.message);
			s += "\"}";
			return s;
		}

		std::string Logger::FormatLine(const LogItem& item) const {
			std::lock_guard<std::mutex> lk(m_cfgMutex);
			std::string line = m_cfg.jsonLines ? FormatAsJson(item) : (FormatPrefix(item) + item.message);
			line += '\n';
			return line;
		}

		// Sinks

		void Logger::WriteConsole(const LogItem& item) {
			const std::string line = FormatLine(item);
			std::fwrite(line.data(), 1, line.size(), stderr);
		}

		std::filesystem::path Logger::BaseLogPath() const
		{
			std::lock_guard<std::mutex> lk(m_cfgMutex);
			return std::filesystem::path(m_cfg.logDirectory) / (m_cfg.baseFileName + ".log");
		}

		std::filesystem::path Logger::RotatedLogPath(size_t index) const
		{
			std::lock_guard<std::mutex> lk(m_cfgMutex);
			return std::filesystem::path(m_cfg.logDirectory) /
				(m_cfg.baseFileName + "." + std::to_string(index) + ".log");
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file.is_open()) return;

			const std::filesystem::path path = BaseLogPath();
			std::error_code ec;
			if (path.has_parent_path()) {
				std::filesystem::create_directories(path.parent_path(), ec);
				if (ec) {
					std::fprintf(stderr, "[Logger] Cannot create log directory %s: %s\n",
						path.parent_path().string().c_str(), ec.message().c_str());
					return;
				}
			}

			m_file.open(path, std::ios::out | std::ios::app | std::ios::binary);
			if (!m_file.is_open()) {
				std::fprintf(stderr, "[Logger] Failed to open log file %s\n", path.string().c_str());
				return;
			}

			const auto size = std::filesystem::file_size(path, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			uint64_t maxBytes = 0;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				maxBytes = m_cfg.maxFileSizeBytes;
			}
			if (maxBytes == 0) return;
			if (m_currentSize + nextWriteBytes <= maxBytes) return;

			PerformRotation();
		}

		void Logger::PerformRotation()
		{
			size_t maxCount = 0;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				maxCount = m_cfg.maxFileCount;
			}

			if (m_file.is_open()) {
				m_file.flush();
				m_file.close();
			}

			std::error_code ec;
			if (maxCount > 0) {
				// TrackShield.N.log is the oldest; shift everything up by one
				std::filesystem::remove(RotatedLogPath(maxCount), ec);
				for (size_t i = maxCount; i > 1; --i) {
					const auto from = RotatedLogPath(i - 1);
					if (std::filesystem::exists(from, ec)) {
						std::filesystem::rename(from, RotatedLogPath(i), ec);
					}
				}
				std::filesystem::rename(BaseLogPath(), RotatedLogPath(1), ec);
			}
			else {
				std::filesystem::remove(BaseLogPath(), ec);
			}

			m_currentSize = 0;
			OpenLogFileIfNeeded();
		}

		void Logger::WriteFile(const LogItem& item)
		{
			OpenLogFileIfNeeded();
			if (!m_file.is_open()) return;

			const std::string line = FormatLine(item);
			RotateIfNeeded(line.size());
			if (!m_file.is_open()) return;

			m_file.write(line.data(), static_cast<std::streamsize>(line.size()));
			m_currentSize += line.size();
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
			const char* file,
			int line,
			const char* function,
			const char* messageOnEnter,
			LogLevel level)
			: m_category(category)
			, m_file(file)
			, m_function(function)
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level)
		{
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter",
					m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope()
		{
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) return;

			const auto elapsedUs = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start).count();
			lg.LogMessage(m_level, m_category,
				"Exit (" + std::to_string(elapsedUs) + " us)",
				m_file, m_line, m_function);
		}

	}  // namespace Utils
}  // namespace TrackShield
