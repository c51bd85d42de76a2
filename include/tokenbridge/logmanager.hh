/*
    Token Bridge, an APNS to FCM registration token exchanger.
    Copyright (C) 2010-2025 Belledonne Communications SARL, All rights reserved.

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#define TOKENBRIDGE_LOG_DOMAIN "tokenbridge"

#ifndef BCTBX_LOG_DOMAIN
#define BCTBX_LOG_DOMAIN TOKENBRIDGE_LOG_DOMAIN
#endif

#include <bctoolbox/logging.h>

#define LOGV(thelevel, thefmt, theargs) bctbx_logv(TOKENBRIDGE_LOG_DOMAIN, thelevel, (thefmt), (theargs))
#define LOGDV(thefmt, theargs) LOGV(BCTBX_LOG_DEBUG, thefmt, theargs)

#define STREAM_LOG(thelevel) BCTBX_SLOG(TOKENBRIDGE_LOG_DOMAIN, thelevel)

#define SLOGD STREAM_LOG(BCTBX_LOG_DEBUG)
#define SLOGI STREAM_LOG(BCTBX_LOG_MESSAGE)
#define SLOGW STREAM_LOG(BCTBX_LOG_WARNING)
#define SLOGE STREAM_LOG(BCTBX_LOG_ERROR)

#define GET_MACRO(_0, _1, _2, NAME, ...) NAME

#define FORMAT_CONTEXT(scope, function) scope << "::" << function << " - "
#define CONTEXT_0() FORMAT_CONTEXT(mLogPrefix, __func__)
#define CONTEXT_1(scope) FORMAT_CONTEXT(scope, __func__)
#define CONTEXT_2(scope, function) FORMAT_CONTEXT(scope, function)

/**
 * Add a context to the log line as follows: "[Class::mLogPrefix]::method() - "
 *
 * Usage:
 * - CONTEXT(): you must define an attribute in your class called 'mLogPrefix' to use this macro
 * - CONTEXT(scope): this is to use a custom scope instead of Class::mLogPrefix
 * - CONTEXT(scope, func): this is to use a custom scope instead of Class::mLogPrefix + a custom function name
 */
#define CONTEXT(...) GET_MACRO(_0, ##__VA_ARGS__, CONTEXT_2, CONTEXT_1, CONTEXT_0)(__VA_ARGS__)

#define _LOG_MACRO_1(level, scope, func) STREAM_LOG(level) << CONTEXT(scope, func)
#define _LOG_MACRO_2(level, scope) STREAM_LOG(level) << CONTEXT(scope, __func__)
#define _LOG_MACRO_3(level) STREAM_LOG(level) << CONTEXT()
#define _LOG_MACRO(...) GET_MACRO(__VA_ARGS__, _LOG_MACRO_1, _LOG_MACRO_2, _LOG_MACRO_3)(__VA_ARGS__)

/**
 * Logging macro for 'debug' level.
 * @note automatically inserts a context to the log using class attribute 'mLogPrefix'.
 */
#define LOGD _LOG_MACRO(BCTBX_LOG_DEBUG)
#define _LOGD_CTX_1(scope) _LOG_MACRO(BCTBX_LOG_DEBUG, scope)
#define _LOGD_CTX_2(scope, func) _LOG_MACRO(BCTBX_LOG_DEBUG, scope, func)
/**
 * Logging macro for 'debug' level.
 * Usage:
 *   - LOGD_CTX(scope): this is to use a custom scope
 *   - LOGD_CTX(scope, func): this is to use a custom scope and function name
 */
#define LOGD_CTX(...) GET_MACRO(_0, ##__VA_ARGS__, _LOGD_CTX_2, _LOGD_CTX_1)(__VA_ARGS__)

/**
 * Logging macro for 'message' level.
 * @note automatically inserts a context to the log using class attribute 'mLogPrefix'.
 */
#define LOGI _LOG_MACRO(BCTBX_LOG_MESSAGE)
#define _LOGI_CTX_1(scope) _LOG_MACRO(BCTBX_LOG_MESSAGE, scope)
#define _LOGI_CTX_2(scope, func) _LOG_MACRO(BCTBX_LOG_MESSAGE, scope, func)
#define LOGI_CTX(...) GET_MACRO(_0, ##__VA_ARGS__, _LOGI_CTX_2, _LOGI_CTX_1)(__VA_ARGS__)

/**
 * Logging macro for 'warning' level.
 * @note automatically inserts a context to the log using class attribute 'mLogPrefix'.
 */
#define LOGW _LOG_MACRO(BCTBX_LOG_WARNING)
#define _LOGW_CTX_1(scope) _LOG_MACRO(BCTBX_LOG_WARNING, scope)
#define _LOGW_CTX_2(scope, func) _LOG_MACRO(BCTBX_LOG_WARNING, scope, func)
#define LOGW_CTX(...) GET_MACRO(_0, ##__VA_ARGS__, _LOGW_CTX_2, _LOGW_CTX_1)(__VA_ARGS__)

/**
 * Logging macro for 'error' level.
 * @note automatically inserts a context to the log using class attribute 'mLogPrefix'.
 */
#define LOGE _LOG_MACRO(BCTBX_LOG_ERROR)
#define _LOGE_CTX_1(scope) _LOG_MACRO(BCTBX_LOG_ERROR, scope)
#define _LOGE_CTX_2(scope, func) _LOG_MACRO(BCTBX_LOG_ERROR, scope, func)
#define LOGE_CTX(...) GET_MACRO(_0, ##__VA_ARGS__, _LOGE_CTX_2, _LOGE_CTX_1)(__VA_ARGS__)

namespace tokenbridge {

struct LoggerParameters {
	bool enableStandardOutput{true};
	BctbxLogLevel level{BCTBX_LOG_WARNING}; // Logging level for both standard output and file log handlers.

	// Leave the file name empty to disable logging into a file.
	std::string logFilename{};
	// Created (with its parents) if it does not exist.
	std::string logDirectory{};
};

/**
 * Tool to configure logging in Token Bridge.
 */
class LogManager {
public:
	LogManager(const LogManager&) = delete;
	~LogManager() = default;

	static LogManager& get();
	/**
	 * @throw invalid_argument if the provided name does not correspond to any known log level.
	 * @return bctoolbox log level from provided name
	 */
	static BctbxLogLevel logLevelFromName(const std::string& name);

	/**
	 * @param ptr pointer to instance of the class
	 * @param className name of the class
	 * @return logging prefix for an instance of a class (output: ClassName[ptr])
	 */
	template <typename T>
	static std::string makeLogPrefixForInstance(const T* ptr, std::string_view className) {
		std::stringstream logPrefix{};
		logPrefix << className << "[" << ptr << "]";
		return logPrefix.str();
	}

	/**
	 * Apply the provided set of parameters to the logger. A handler that is disabled in 'params' is removed.
	 *
	 * @note The default configuration only has standard output enabled.
	 * @throw runtime_error if the log directory cannot be created, or if the file handler cannot be created while
	 * standard output is disabled
	 */
	void configure(const LoggerParameters& params = LoggerParameters());

	/**
	 * Set the log level for all domains.
	 */
	void setLogLevel(BctbxLogLevel level);
	BctbxLogLevel getLogLevel() const;
	bool standardOutputIsEnabled() const;
	bool fileLoggingIsEnabled() const;

private:
	// Owns a bctoolbox log handler and unregisters it on destruction.
	class LogHandler {
	public:
		explicit LogHandler(bctbx_log_handler_t* handler);
		~LogHandler();

		/**
		 * @return true if the log handler is found in the list of all active handlers.
		 */
		bool isSet() const;

	private:
		bctbx_log_handler_t* mHandler{};
	};

	static constexpr std::string_view mLogPrefix{"LogManager"};

	LogManager() = default;

	static std::unique_ptr<LogManager> sInstance;

	BctbxLogLevel mLevel{BCTBX_LOG_ERROR};
	std::unique_ptr<LogHandler> mStdOutLogHandler{};
	std::unique_ptr<LogHandler> mFileLogHandler{};
};

} // namespace tokenbridge
