/*
 * JitGuard - Endpoint Privilege Elevation Service
 * Copyright (C) 2026 JitGuard Security
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
 * @brief Thread-safe asynchronous logging system for the JitGuard service.
 *
 * Provides:
 * - Asynchronous logging with configurable back-pressure policies
 * - Console and rotating file output
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 * - Thread-safe singleton pattern
 *
 * @note Thread-safe for all public methods.
 * @warning Call Initialize() before logging; the macros are no-ops until then.
 */

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdarg>
#include <cstdio>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace JitGuard {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages.
		 *
		 * Ordered from least to most severe. Messages below the configured
		 * minimum level are discarded.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		/// @brief Parses "trace".."fatal" (case-insensitive); returns fallback on no match.
		[[nodiscard]] LogLevel ParseLogLevel(std::string_view name, LogLevel fallback) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			/// Maximum queue size for async logging
			size_t maxQueueSize = 1000;

			/// Policy when queue is full
			enum class BackPressurePolicy {
				Block,       ///< Block until space available
				DropOldest,  ///< Drop oldest messages
				DropNewest   ///< Drop newest messages
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;              ///< Enable asynchronous logging
			bool toConsole = true;          ///< Output to console
			bool toFile = true;             ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeProcThreadId = true;///< Include process/thread IDs

			std::wstring logDirectory = L"logs";          ///< Log file directory
			std::wstring baseFileName = L"JitGuard";      ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 10;                     ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;       ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;        ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger with async support.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   cfg.logDirectory = L"logs";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   JG_LOG_INFO(L"MyCategory", L"Hello %ls", L"World");
		 *   JG_LOG_ERROR(L"MyCategory", L"Error code: %d", 42);
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 *
		 * @note Call ShutDown() before application exit to flush pending logs.
		 */
		class Logger {
		public:
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * A second call while initialized is ignored.
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 *
			 * Stops the async worker thread and writes remaining messages.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const wchar_t* category,
			           const wchar_t* file,
			           int line,
			           const wchar_t* function,
			           const wchar_t* format, ...);

			/**
			 * @brief Log an OS error number (errno) with context.
			 */
			void LogSystemErrorEx(LogLevel level,
			                      const wchar_t* category,
			                      const wchar_t* file,
			                      int line,
			                      const wchar_t* function,
			                      int errorCode,
			                      const wchar_t* contextFormat, ...);

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const wchar_t* category,
			                const std::wstring& message,
			                const wchar_t* file = nullptr,
			                int line = 0,
			                const wchar_t* function = nullptr,
			                int systemError = 0);

			void Flush();

			/**
			 * @brief Convert narrow string to wide string (thread-local ring buffer).
			 * @return Wide string pointer (thread-local, do not store)
			 */
			[[nodiscard]] static const wchar_t* NarrowToWideTLS(const char* s);

			[[nodiscard]] static std::wstring FormatMessageV(const wchar_t* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const wchar_t* category,
				      const wchar_t* file,
				      int line,
				      const wchar_t* function,
				      const wchar_t* messageOnEnter = L"Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				std::wstring m_category;
				std::wstring m_file;
				std::wstring m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			// ========================================================================
			// Internal Types
			// ========================================================================

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::wstring category;
				std::wstring message;
				std::wstring file;
				std::wstring function;
				int line = 0;
				uint32_t pid = 0;
				uint64_t tid = 0;
				uint64_t tsMicros = 0;
				int systemError = 0;
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			[[nodiscard]] bool Dequeue(LogItem& out);
			void WriteItem(const LogItem& item);
			void WriteConsole(const std::string& line);
			void WriteFile(const std::string& line, bool flush);
			[[nodiscard]] std::wstring FormatPrefix(const LogItem& item) const;
			[[nodiscard]] std::wstring FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::wstring EscapeJson(const std::wstring& s);
			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			void EnsureLogDirectory();
			void CloseLogFile();
			[[nodiscard]] std::wstring BaseLogPath() const;
			[[nodiscard]] static uint64_t NowAsMicrosUTC();
			[[nodiscard]] static std::wstring FormatIso8601UTC(uint64_t micros);
			[[nodiscard]] static std::wstring FormatSystemError(int err);

			// ========================================================================
			// Member Variables
			// ========================================================================

			std::atomic<bool> m_accepting{ false };
			std::atomic<bool> m_insideRotation{ false };
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

			/// Serializes console and file sinks
			std::mutex m_writeMutex;
			std::FILE* m_file{ nullptr };
			uint64_t m_currentSize{ 0 };
		};

	}  // namespace Utils
}  // namespace JitGuard

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   JG_LOG_INFO(L"Category", L"Message with %d format", value);
//   JG_LOG_ERROR(L"Category", L"Error occurred: %ls", errorMsg);
//   JG_LOG_LAST_ERROR(L"Category", L"open() failed");
//   JG_LOG_SCOPE(L"Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

/// @brief Log at TRACE level
#define JG_LOG_TRACE(category, fmt, ...) \
    do { \
        auto& _lg = ::JitGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::JitGuard::Utils::LogLevel::Trace)) { \
            _lg.LogEx(::JitGuard::Utils::LogLevel::Trace, (category), \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at DEBUG level
#define JG_LOG_DEBUG(category, fmt, ...) \
    do { \
        auto& _lg = ::JitGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::JitGuard::Utils::LogLevel::Debug)) { \
            _lg.LogEx(::JitGuard::Utils::LogLevel::Debug, (category), \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at INFO level
#define JG_LOG_INFO(category, fmt, ...) \
    do { \
        auto& _lg = ::JitGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::JitGuard::Utils::LogLevel::Info)) { \
            _lg.LogEx(::JitGuard::Utils::LogLevel::Info, (category), \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at WARN level
#define JG_LOG_WARN(category, fmt, ...) \
    do { \
        auto& _lg = ::JitGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::JitGuard::Utils::LogLevel::Warn)) { \
            _lg.LogEx(::JitGuard::Utils::LogLevel::Warn, (category), \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at ERROR level
#define JG_LOG_ERROR(category, fmt, ...) \
    do { \
        auto& _lg = ::JitGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::JitGuard::Utils::LogLevel::Error)) { \
            _lg.LogEx(::JitGuard::Utils::LogLevel::Error, (category), \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at FATAL level
#define JG_LOG_FATAL(category, fmt, ...) \
    do { \
        auto& _lg = ::JitGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::JitGuard::Utils::LogLevel::Fatal)) { \
            _lg.LogEx(::JitGuard::Utils::LogLevel::Fatal, (category), \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log errno with context message
#define JG_LOG_LAST_ERROR(category, fmt, ...) \
    do { \
        const int _jg_errno = errno; \
        auto& _lg = ::JitGuard::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::JitGuard::Utils::LogLevel::Error)) { \
            _lg.LogSystemErrorEx(::JitGuard::Utils::LogLevel::Error, (category), \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::JitGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__), \
                _jg_errno, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief RAII scope logger - logs function entry and exit with timing
#define JG_LOG_SCOPE(category) \
    ::JitGuard::Utils::Logger::Scope _jg_scope_obj( \
        (category), \
        ::JitGuard::Utils::Logger::NarrowToWideTLS(__FILE__), \
        __LINE__, \
        ::JitGuard::Utils::Logger::NarrowToWideTLS(__FUNCTION__))
