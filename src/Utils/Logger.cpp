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
/**
 * @file Logger.cpp
 * @brief Logger implementation: async queue, console sink, rotating file sink.
 */

#include "Logger.hpp"
#include "StringUtils.hpp"

#include <array>
#include <ctime>
#include <cwchar>
#include <filesystem>
#include <functional>
#include <iostream>
#include <system_error>

#include <unistd.h>

namespace JitGuard {
	namespace Utils {

		namespace {
			/// Upper bound for a single formatted message
			constexpr size_t MAX_MESSAGE_CHARS = 64 * 1024;

			/// Number of thread-local conversion buffers; one macro call converts two strings
			constexpr size_t TLS_RING_SIZE = 8;

			const wchar_t* LevelToString(LogLevel level) noexcept {
				switch (level) {
				case LogLevel::Trace: return L"TRACE";
				case LogLevel::Debug: return L"DEBUG";
				case LogLevel::Info:  return L"INFO";
				case LogLevel::Warn:  return L"WARN";
				case LogLevel::Error: return L"ERROR";
				case LogLevel::Fatal: return L"FATAL";
				}
				return L"UNKNOWN";
			}

			uint64_t CurrentThreadId() noexcept {
				return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			}
		}

		LogLevel ParseLogLevel(std::string_view name, LogLevel fallback) noexcept {
			if (EqualsIgnoreCaseAscii(name, "trace")) return LogLevel::Trace;
			if (EqualsIgnoreCaseAscii(name, "debug")) return LogLevel::Debug;
			if (EqualsIgnoreCaseAscii(name, "info")) return LogLevel::Info;
			if (EqualsIgnoreCaseAscii(name, "warn") || EqualsIgnoreCaseAscii(name, "warning")) return LogLevel::Warn;
			if (EqualsIgnoreCaseAscii(name, "error")) return LogLevel::Error;
			if (EqualsIgnoreCaseAscii(name, "fatal")) return LogLevel::Fatal;
			return fallback;
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::Logger() = default;

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			std::lock_guard<std::mutex> cfgLock(m_cfgMutex);
			if (m_initialized.load(std::memory_order_acquire)) {
				return;
			}

			m_cfg = cfg;
			m_minLevel.store(cfg.minimalLevel, std::memory_order_release);

			if (m_cfg.toFile) {
				std::lock_guard<std::mutex> writeLock(m_writeMutex);
				EnsureLogDirectory();
				OpenLogFileIfNeeded();
			}

			m_stop.store(false, std::memory_order_release);
			m_accepting.store(true, std::memory_order_release);

			if (m_cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}

			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.load(std::memory_order_acquire)) {
				return;
			}

			m_accepting.store(false, std::memory_order_release);
			m_stop.store(true, std::memory_order_release);
			m_queueCv.notify_all();
			m_spaceCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			// Drain whatever the worker did not get to
			LogItem item;
			while (Dequeue(item)) {
				WriteItem(item);
			}

			{
				std::lock_guard<std::mutex> writeLock(m_writeMutex);
				CloseLogFile();
			}

			m_initialized.store(false, std::memory_order_release);
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >=
				static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
		}

		// ============================================================================
		// Logging entry points
		// ============================================================================

		void Logger::LogEx(LogLevel level,
			const wchar_t* category,
			const wchar_t* file,
			int line,
			const wchar_t* function,
			const wchar_t* format, ...) {
			if (!format) return;

			va_list args;
			va_start(args, format);
			std::wstring message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function, 0);
		}

		void Logger::LogSystemErrorEx(LogLevel level,
			const wchar_t* category,
			const wchar_t* file,
			int line,
			const wchar_t* function,
			int errorCode,
			const wchar_t* contextFormat, ...) {
			std::wstring context;
			if (contextFormat) {
				va_list args;
				va_start(args, contextFormat);
				context = FormatMessageV(contextFormat, args);
				va_end(args);
			}

			std::wstring message = context;
			message += L" (errno ";
			message += std::to_wstring(errorCode);
			message += L": ";
			message += FormatSystemError(errorCode);
			message += L")";

			LogMessage(level, category, message, file, line, function, errorCode);
		}

		void Logger::LogMessage(LogLevel level,
			const wchar_t* category,
			const std::wstring& message,
			const wchar_t* file,
			int line,
			const wchar_t* function,
			int systemError) {
			if (!m_accepting.load(std::memory_order_acquire) || !IsEnabled(level)) {
				return;
			}

			LogItem item;
			item.level = level;
			item.category = category ? category : L"";
			item.message = message;
			item.file = file ? file : L"";
			item.function = function ? function : L"";
			item.line = line;
			item.pid = static_cast<uint32_t>(::getpid());
			item.tid = CurrentThreadId();
			item.tsMicros = NowAsMicrosUTC();
			item.systemError = systemError;

			bool async = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				async = m_cfg.async;
			}

			if (async) {
				Enqueue(std::move(item));
			}
			else {
				WriteItem(item);
			}
		}

		void Logger::Flush() {
			bool async = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				async = m_cfg.async;
			}

			if (async) {
				std::unique_lock<std::mutex> lock(m_queueMutex);
				m_spaceCv.wait_for(lock, std::chrono::seconds(5), [this] {
					return m_queue.empty() || m_stop.load(std::memory_order_acquire);
				});
			}

			std::lock_guard<std::mutex> writeLock(m_writeMutex);
			if (m_file) {
				std::fflush(m_file);
			}
			std::cout.flush();
		}

		// ============================================================================
		// String helpers
		// ============================================================================

		const wchar_t* Logger::NarrowToWideTLS(const char* s) {
			thread_local std::array<std::wstring, TLS_RING_SIZE> ring;
			thread_local size_t next = 0;

			std::wstring& slot = ring[next];
			next = (next + 1) % TLS_RING_SIZE;

			slot = s ? ToWide(s) : std::wstring();
			return slot.c_str();
		}

		std::wstring Logger::FormatMessageV(const wchar_t* fmt, va_list args) {
			if (!fmt) return std::wstring();

			std::vector<wchar_t> buffer(256);
			while (true) {
				va_list copy;
				va_copy(copy, args);
				const int written = std::vswprintf(buffer.data(), buffer.size(), fmt, copy);
				va_end(copy);

				if (written >= 0 && static_cast<size_t>(written) < buffer.size()) {
					return std::wstring(buffer.data(), static_cast<size_t>(written));
				}
				if (buffer.size() >= MAX_MESSAGE_CHARS) {
					// Either truncated or an encoding error in the arguments
					return std::wstring(fmt) + L" [format error]";
				}
				buffer.resize(buffer.size() * 2);
			}
		}

		// ============================================================================
		// Queue
		// ============================================================================

		void Logger::WorkerLoop() {
			while (true) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] {
						return !m_queue.empty() || m_stop.load(std::memory_order_acquire);
					});

					if (m_queue.empty()) {
						// stop requested and nothing left
						m_spaceCv.notify_all();
						return;
					}

					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_spaceCv.notify_all();
				WriteItem(item);
			}
		}

		void Logger::Enqueue(LogItem&& item) {
			size_t maxQueue = 0;
			LoggerConfig::BackPressurePolicy policy{};
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				maxQueue = m_cfg.maxQueueSize;
				policy = m_cfg.bpPolicy;
			}

			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				if (maxQueue > 0 && m_queue.size() >= maxQueue) {
					switch (policy) {
					case LoggerConfig::BackPressurePolicy::Block:
						m_spaceCv.wait(lock, [this, maxQueue] {
							return m_queue.size() < maxQueue || m_stop.load(std::memory_order_acquire);
						});
						break;
					case LoggerConfig::BackPressurePolicy::DropOldest:
						m_queue.pop_front();
						break;
					case LoggerConfig::BackPressurePolicy::DropNewest:
						return;
					}
				}
				m_queue.push_back(std::move(item));
			}
			m_queueCv.notify_one();
		}

		bool Logger::Dequeue(LogItem& out) {
			std::lock_guard<std::mutex> lock(m_queueMutex);
			if (m_queue.empty()) return false;
			out = std::move(m_queue.front());
			m_queue.pop_front();
			return true;
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::WriteItem(const LogItem& item) {
			LoggerConfig cfg;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				cfg = m_cfg;
			}

			const std::wstring text = cfg.jsonLines ? FormatAsJson(item) : FormatPrefix(item) + item.message;
			std::string line = ToNarrow(text);
			line.push_back('\n');

			std::lock_guard<std::mutex> writeLock(m_writeMutex);
			if (cfg.toConsole) {
				WriteConsole(line);
			}
			if (cfg.toFile) {
				WriteFile(line, static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(cfg.flushLevel));
			}
		}

		void Logger::WriteConsole(const std::string& line) {
			std::cout << line;
		}

		void Logger::WriteFile(const std::string& line, bool flush) {
			OpenLogFileIfNeeded();
			if (!m_file) return;

			RotateIfNeeded(line.size());
			if (!m_file) return;

			const size_t written = std::fwrite(line.data(), 1, line.size(), m_file);
			m_currentSize += written;

			if (flush) {
				std::fflush(m_file);
			}
		}

		std::wstring Logger::FormatPrefix(const LogItem& item) const {
			std::wstring prefix;
			prefix.reserve(128);
			prefix += L"[";
			prefix += FormatIso8601UTC(item.tsMicros);
			prefix += L"] [";
			prefix += LevelToString(item.level);
			prefix += L"] ";

			if (m_cfg.includeProcThreadId) {
				prefix += L"[";
				prefix += std::to_wstring(item.pid);
				prefix += L":";
				prefix += std::to_wstring(item.tid % 100000);
				prefix += L"] ";
			}

			prefix += L"[";
			prefix += item.category;
			prefix += L"] ";

			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				const auto slash = item.file.find_last_of(L"/\\");
				prefix += L"(";
				prefix += (slash == std::wstring::npos) ? item.file : item.file.substr(slash + 1);
				prefix += L":";
				prefix += std::to_wstring(item.line);
				if (!item.function.empty()) {
					prefix += L" ";
					prefix += item.function;
				}
				prefix += L") ";
			}
			return prefix;
		}

		std::wstring Logger::FormatAsJson(const LogItem& item) const {
			std::wstring json;
			json.reserve(256);
			json += L"{\"ts\":\"";
			json += FormatIso8601UTC(item.tsMicros);
			json += L"\",\"level\":\"";
			json += LevelToString(item.level);
			json += L"\",\"category\":\"";
			json += EscapeJson(item.category);
			json += L"\",\"message\":\"";
			json += EscapeJson(item.message);
			json += L"\"";

			if (m_cfg.includeProcThreadId) {
				json += L",\"pid\":";
				json += std::to_wstring(item.pid);
				json += L",\"tid\":";
				json += std::to_wstring(item.tid);
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				json += L",\"file\":\"";
				json += EscapeJson(item.file);
				json += L"\",\"line\":";
				json += std::to_wstring(item.line);
				json += L",\"function\":\"";
				json += EscapeJson(item.function);
				json += L"\"";
			}
			if (item.systemError != 0) {
				json += L",\"errno\":";
				json += std::to_wstring(item.systemError);
			}
			json += L"}";
			return json;
		}

		std::wstring Logger::EscapeJson(const std::wstring& s) {
			std::wstring out;
			out.reserve(s.size() + 8);
			for (wchar_t c : s) {
				switch (c) {
				case L'"':  out += L"\\\""; break;
				case L'\\': out += L"\\\\"; break;
				case L'\n': out += L"\\n"; break;
				case L'\r': out += L"\\r"; break;
				case L'\t': out += L"\\t"; break;
				default:
					if (c < 0x20) {
						wchar_t buf[8];
						std::swprintf(buf, 8, L"\\u%04x", static_cast<unsigned>(c));
						out += buf;
					}
					else {
						out.push_back(c);
					}
				}
			}
			return out;
		}

		// ============================================================================
		// File management
		// ============================================================================

		void Logger::EnsureLogDirectory() {
			std::error_code ec;
			std::filesystem::create_directories(std::filesystem::path(ToNarrow(m_cfg.logDirectory)), ec);
			if (ec) {
				std::cerr << "[Logger] Cannot create log directory: " << ec.message() << "\n";
			}
		}

		std::wstring Logger::BaseLogPath() const {
			std::filesystem::path p(ToNarrow(m_cfg.logDirectory));
			p /= ToNarrow(m_cfg.baseFileName) + ".log";
			return ToWide(p.string());
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) return;

			const std::string path = ToNarrow(BaseLogPath());
			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::cerr << "[Logger] Cannot open log file " << path << ": "
					<< std::system_category().message(errno) << "\n";
				return;
			}

			std::error_code ec;
			const auto size = std::filesystem::file_size(std::filesystem::path(path), ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::CloseLogFile() {
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
			m_currentSize = 0;
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0) return;
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) return;

			bool expected = false;
			if (!m_insideRotation.compare_exchange_strong(expected, true)) {
				return;
			}
			PerformRotation();
			m_insideRotation.store(false);
		}

		void Logger::PerformRotation() {
			CloseLogFile();

			namespace fs = std::filesystem;
			const fs::path base(ToNarrow(BaseLogPath()));
			std::error_code ec;

			const size_t keep = m_cfg.maxFileCount == 0 ? 1 : m_cfg.maxFileCount;

			// JitGuard.log.(N-1) -> .N, ..., JitGuard.log -> .1
			fs::path oldest = base;
			oldest += "." + std::to_string(keep);
			fs::remove(oldest, ec);

			for (size_t i = keep; i > 1; --i) {
				fs::path from = base;
				from += "." + std::to_string(i - 1);
				fs::path to = base;
				to += "." + std::to_string(i);
				if (fs::exists(from, ec)) {
					fs::rename(from, to, ec);
				}
			}

			fs::path first = base;
			first += ".1";
			fs::rename(base, first, ec);
			if (ec) {
				std::cerr << "[Logger] Log rotation failed: " << ec.message() << "\n";
			}

			OpenLogFileIfNeeded();
		}

		// ============================================================================
		// Time / error formatting
		// ============================================================================

		uint64_t Logger::NowAsMicrosUTC() {
			return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::system_clock::now().time_since_epoch()).count());
		}

		std::wstring Logger::FormatIso8601UTC(uint64_t micros) {
			const std::time_t seconds = static_cast<std::time_t>(micros / 1000000ULL);
			const unsigned millis = static_cast<unsigned>((micros / 1000ULL) % 1000ULL);

			std::tm tm{};
			gmtime_r(&seconds, &tm);

			wchar_t buf[40];
			std::swprintf(buf, 40, L"%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
				tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
				tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
			return buf;
		}

		std::wstring Logger::FormatSystemError(int err) {
			return ToWide(std::system_category().message(err));
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const wchar_t* category,
			const wchar_t* file,
			int line,
			const wchar_t* function,
			const wchar_t* messageOnEnter,
			LogLevel level)
			: m_category(category ? category : L"")
			, m_file(file ? file : L"")
			, m_function(function ? function : L"")
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level)
		{
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category.c_str(),
					messageOnEnter ? messageOnEnter : L"Enter",
					m_file.c_str(), m_line, m_function.c_str());
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
					std::chrono::steady_clock::now() - m_start).count();
				lg.LogMessage(m_level, m_category.c_str(),
					L"Exit (" + std::to_wstring(elapsed) + L" us)",
					m_file.c_str(), m_line, m_function.c_str());
			}
		}

	}  // namespace Utils
}  // namespace JitGuard
