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

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "tokenbridge/logmanager.hh"

#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"
#include "utils/tmp-dir.hh"

using namespace std;

namespace tokenbridge::tester {
namespace {

void logLevelNames() {
	BC_ASSERT_ENUM_EQUAL(LogManager::logLevelFromName("debug"), BCTBX_LOG_DEBUG);
	BC_ASSERT_ENUM_EQUAL(LogManager::logLevelFromName("message"), BCTBX_LOG_MESSAGE);
	BC_ASSERT_ENUM_EQUAL(LogManager::logLevelFromName("warning"), BCTBX_LOG_WARNING);
	BC_ASSERT_ENUM_EQUAL(LogManager::logLevelFromName("error"), BCTBX_LOG_ERROR);
	BC_ASSERT_THROWN(LogManager::logLevelFromName("verbose"), invalid_argument);
	BC_ASSERT_THROWN(LogManager::logLevelFromName("DEBUG"), invalid_argument);
}

// Log lines are also written in the configured file, the file handler is removed with an empty file name.
void logToFile() {
	const TmpDir dir{"logmanager"};
	const auto logDirectory = (dir.path() / "logs").string();
	auto& logManager = LogManager::get();
	const auto initialLevel = logManager.getLogLevel();

	LoggerParameters params{};
	params.enableStandardOutput = true;
	params.level = BCTBX_LOG_MESSAGE;
	params.logDirectory = logDirectory;
	params.logFilename = "tokenbridge-tester.log";
	logManager.configure(params);
	BC_ASSERT_TRUE(logManager.fileLoggingIsEnabled());

	SLOGI << "token bridge file logging test line";

	params.logFilename.clear();
	params.level = initialLevel;
	logManager.configure(params);
	BC_ASSERT_FALSE(logManager.fileLoggingIsEnabled());

	ifstream file{logDirectory + "/tokenbridge-tester.log"};
	BC_HARD_ASSERT_TRUE(file.is_open());
	stringstream content{};
	content << file.rdbuf();
	BC_ASSERT_CPP_NOT_EQUAL(content.str().find("token bridge file logging test line"), string::npos);
}

// Printf conversion specifiers in the directory name are printed as is.
void logDirectoryWithPercentSigns() {
	const TmpDir dir{"logmanager"};
	const auto logDirectory = (dir.path() / "logs-%s-%n-%p").string();
	auto& logManager = LogManager::get();
	const auto initialLevel = logManager.getLogLevel();

	LoggerParameters params{};
	params.enableStandardOutput = true;
	params.level = BCTBX_LOG_MESSAGE;
	params.logDirectory = logDirectory;
	params.logFilename = "tokenbridge-tester.log";
	logManager.configure(params);
	BC_ASSERT_TRUE(logManager.fileLoggingIsEnabled());
	BC_ASSERT_TRUE(filesystem::is_directory(logDirectory));

	params.logFilename.clear();
	params.level = initialLevel;
	logManager.configure(params);
}

TestSuite _("LogManager",
            {
                CLASSY_TEST(logLevelNames),
                CLASSY_TEST(logToFile),
                CLASSY_TEST(logDirectoryWithPercentSigns),
            });

} // namespace
} // namespace tokenbridge::tester
