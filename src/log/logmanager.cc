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

#include "tokenbridge/logmanager.hh"

#include <cstdarg>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace tokenbridge {

unique_ptr<LogManager> LogManager::sInstance{};

namespace {

void logStdOut(void*, const char* domain, BctbxLogLevel level, const char* msg, va_list args) {
	bctbx_logv_out(domain, level, msg, args);
}

void printOnStdOutV(BctbxLogLevel level, const char* fmt, ...) {
	va_list args;
	va_start(args, fmt);
	bctbx_logv_out(TOKENBRIDGE_LOG_DOMAIN, level, fmt, args);
	va_end(args);
}

// Used while (re)configuring, so that the message is printed even when no handler is set yet.
// The message may contain user input (paths), it is never used as a format string.
void printOnStdOut(BctbxLogLevel level, const string& message) {
	printOnStdOutV(level, "LogManager - %s", message.c_str());
}

} // namespace

LogManager::LogHandler::LogHandler(bctbx_log_handler_t* handler) : mHandler(handler) {
	if (handler) bctbx_add_log_handler(handler);
}

LogManager::LogHandler::~LogHandler() {
	if (isSet()) bctbx_remove_log_handler(mHandler);
}

bool LogManager::LogHandler::isSet() const {
	if (mHandler) return bctbx_list_find(bctbx_get_log_handlers(), mHandler) != nullptr;
	return false;
}

LogManager& LogManager::get() {
	if (!sInstance) {
		sInstance = unique_ptr<LogManager>(new LogManager());
		sInstance->configure();
	}
	return *sInstance;
}

BctbxLogLevel LogManager::logLevelFromName(const string& name) {
	if (name == "debug") return BCTBX_LOG_DEBUG;
	if (name == "message") return BCTBX_LOG_MESSAGE;
	if (name == "warning") return BCTBX_LOG_WARNING;
	if (name == "error") return BCTBX_LOG_ERROR;

	throw invalid_argument{"unknown log-level '" + name + "'"};
}

void LogManager::configure(const LoggerParameters& params) {
	setLogLevel(params.level);

	if (params.logFilename.empty()) {
		mFileLogHandler.reset();
	} else {
		error_code ec{};
		if (filesystem::create_directories(params.logDirectory, ec)) {
			printOnStdOut(BCTBX_LOG_MESSAGE, "Created log directory: " + params.logDirectory);
		} else if (ec) {
			throw runtime_error{"log directory '" + params.logDirectory + "' could not be created (" + ec.message() +
			                    ")"};
		}

		if (params.enableStandardOutput)
			printOnStdOut(BCTBX_LOG_MESSAGE, "Writing logs in: " + params.logDirectory + "/" + params.logFilename);

		// Drop the previous handler first, bctoolbox keeps the file open until then.
		mFileLogHandler.reset();
		mFileLogHandler = make_unique<LogHandler>(bctbx_create_file_log_handler(
		    numeric_limits<uint64_t>::max(), params.logDirectory.c_str(), params.logFilename.c_str()));
		if (!mFileLogHandler->isSet()) {
			const auto error = "Could not create log file handler [name: " + params.logFilename +
			                   ", path: " + params.logDirectory + "]";
			if (!params.enableStandardOutput) throw runtime_error{error};
			printOnStdOut(BCTBX_LOG_ERROR, error + " (not fatal when logging is enabled on standard output)");
		}
	}

	if (!params.enableStandardOutput) {
		mStdOutLogHandler.reset();
	} else if (mStdOutLogHandler == nullptr) {
		mStdOutLogHandler = make_unique<LogHandler>(
		    bctbx_create_log_handler(logStdOut, [](bctbx_log_handler_t* handler) { bctbx_free(handler); }, nullptr));
		if (!mStdOutLogHandler->isSet())
			printOnStdOut(BCTBX_LOG_ERROR, "Could not create log handler for standard output");
	}
}

void LogManager::setLogLevel(BctbxLogLevel level) {
	mLevel = level;
	bctbx_set_log_level(nullptr /*any domain*/, level);
}

BctbxLogLevel LogManager::getLogLevel() const {
	return mLevel;
}

bool LogManager::standardOutputIsEnabled() const {
	return mStdOutLogHandler && mStdOutLogHandler->isSet();
}

bool LogManager::fileLoggingIsEnabled() const {
	return mFileLogHandler && mFileLogHandler->isSet();
}

} // namespace tokenbridge
