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

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "tokenbridge/logmanager.hh"
#include "tokenbridge/sofia-wrapper/su-root.hh"

#include "exceptions/bad-configuration.hh"
#include "exchange/exchange-request.hh"
#include "exchange/token-exchanger.hh"
#include "utils/transport/http/http2client.hh"
#include "utils/variant-utils.hh"

#include "exit-status.hh"

using namespace std;
using namespace std::chrono_literals;
using namespace tokenbridge;
using namespace tokenbridge::exchange;

namespace {

constexpr auto kLogFilename = "tokenbridge-exchange.log";

struct ExchangeArgs {
	string apiKey{};
	optional<ApnsEnvironment> environment{};
	optional<string> bundleIdentifier{};
	optional<string> appName{};
	optional<string> appVersion{};
	optional<string> appBuild{};
	bool debug{false};
	BctbxLogLevel logLevel{BCTBX_LOG_MESSAGE};
	chrono::seconds timeout{30};
	vector<string> deviceTokens{};

	static void usage(const char* app) {
		cout << "usage: " << app
		     << " "
		        R"doc(--key <key> --environment {development,production} [options] <device-token> [<device-token> ...]

Exchange APNS device tokens for Firebase Cloud Messaging registration tokens.
Each device token is exchanged through its own request. On success, the line
'<device-token> <registration-token>' is printed on the standard output.

Mandatory parameters:
---------------------
  --key <key>                        Firebase server key, or path to a file containing it.
  --environment {development,production}
                                     APNS environment the device tokens were issued by.

General options:
----------------
  -h, --help                         Show this help message and exit.
  --debug                            Print all debug messages on the standard output.
  --log-level {debug,message,warning,error}
                                     Verbosity of the logs. Default: message.
  --timeout <seconds>                Timeout of each request. Default: 30.

Application options:
--------------------
  --bundle-id <id>                   Bundle identifier of the iOS application. Default: '(not set)'.
  --app-name <name>                  Name of the application, enables the 'user-agent' header.
  --app-version <version>            Version of the application.
  --app-build <build>                Build number of the application.

Example:
--------
    ./tokenbridge_exchange --key '<ServerKey>' --environment production --bundle-id org.example.app '<token>'

Exit status:
------------
  The number of device tokens that could not be exchanged (at most 125), 2 if the key is missing.

Environment Variables:
----------------------
  TOKENBRIDGE_LOG_DIR    Directory to also write logs into. No log file is written when unset.
)doc";
	}

	void parse(int argc, char* argv[]) {
		auto showUsageAndExit = [=]() {
			usage(*argv);
			exit(-1);
		};

#define EQ0(i, name) (strcmp(name, argv[i]) == 0)
#define EQ1(i, name) (i + 1 < argc && strcmp(name, argv[i]) == 0)
		for (int i = 1; i < argc; ++i) {
			if (EQ1(i, "--key")) {
				apiKey = argv[++i];
			} else if (EQ1(i, "--environment")) {
				try {
					environment = parseApnsEnvironment(argv[++i]);
				} catch (const invalid_argument& e) {
					cerr << e.what() << endl;
					showUsageAndExit();
				}
			} else if (EQ1(i, "--bundle-id")) {
				bundleIdentifier = argv[++i];
			} else if (EQ1(i, "--app-name")) {
				appName = argv[++i];
			} else if (EQ1(i, "--app-version")) {
				appVersion = argv[++i];
			} else if (EQ1(i, "--app-build")) {
				appBuild = argv[++i];
			} else if (EQ1(i, "--timeout")) {
				const char* value = argv[++i];
				char* end = nullptr;
				const auto seconds = strtol(value, &end, 10);
				if (*value == '\0' || *end != '\0' || seconds <= 0) {
					cerr << "Invalid timeout [" << value << "], expected a positive number of seconds" << endl;
					showUsageAndExit();
				}
				timeout = chrono::seconds{seconds};
			} else if (EQ1(i, "--log-level")) {
				try {
					logLevel = LogManager::logLevelFromName(argv[++i]);
				} catch (const invalid_argument& e) {
					cerr << e.what() << endl;
					showUsageAndExit();
				}
			} else if (EQ0(i, "--debug")) {
				debug = true;
			} else if (EQ0(i, "--help") || EQ0(i, "-h")) {
				usage(*argv);
				exit(0);
			} else if (strncmp(argv[i], "--", 2) == 0) {
				cerr << "? arg" << i << " " << argv[i] << endl;
				showUsageAndExit();
			} else {
				deviceTokens.emplace_back(argv[i]);
			}
		}
#undef EQ0
#undef EQ1

		if (!environment) {
			cerr << "Missing APNS environment, use '--environment'" << endl;
			showUsageAndExit();
		}
		if (deviceTokens.empty()) {
			cerr << "No device token to exchange" << endl;
			showUsageAndExit();
		}
	}
};

struct Stats {
	int failed{0};
	int success{0};

	int completed() const noexcept {
		return failed + success;
	}
};

/**
 * @return the content of the first line of the file if the key designates an existing file, the key itself otherwise.
 */
string loadApiKey(const string& key) {
	if (!filesystem::is_regular_file(key)) return key;

	ifstream file{key};
	string firstLine{};
	if (!file || !getline(file, firstLine)) {
		throw BadConfiguration{"could not read the key from file [" + key + "]"};
	}
	while (!firstLine.empty() && isspace(static_cast<unsigned char>(firstLine.back()))) {
		firstLine.pop_back();
	}
	return firstLine;
}

} // namespace

int main(int argc, char* argv[]) {
	ExchangeArgs args{};
	args.parse(argc, argv);

	LoggerParameters logParams{};
	if (const char* logDir = getenv("TOKENBRIDGE_LOG_DIR")) {
		logParams.logDirectory = logDir;
		logParams.logFilename = kLogFilename;
	}
	logParams.level = args.debug ? BCTBX_LOG_DEBUG : args.logLevel;
	logParams.enableStandardOutput = true;
	try {
		LogManager::get().configure(logParams);
	} catch (const runtime_error& e) {
		cerr << "Failed to configure logging: " << e.what() << endl;
		return -1;
	}

	if (args.apiKey.empty()) {
		SLOGE << "Missing Firebase server key. Use '--key'";
		return 2;
	}

	Stats stats{};
	{
		const auto root = make_shared<sofiasip::SuRoot>();
		shared_ptr<ExchangeConfiguration> configuration{};
		try {
			configuration = make_shared<ExchangeConfiguration>(loadApiKey(args.apiKey), *args.environment);
		} catch (const BadConfiguration& e) {
			SLOGE << e.what();
			return 2;
		}

		auto client = Http2Client::make(*root, string{ExchangeRequest::kHost}, string{ExchangeRequest::kPort});
		client->setRequestTimeout(args.timeout);
		TokenExchanger exchanger{configuration, client,
		                         AppMetadata{args.bundleIdentifier, args.appName, args.appVersion, args.appBuild}};

		int submitted = 0;
		for (const auto& deviceToken : args.deviceTokens) {
			try {
				exchanger.exchange(deviceToken, [&stats, deviceToken](const ExchangeOutcome& outcome) {
					Match(outcome).against(
					    [&stats, &deviceToken](const RegistrationToken& token) {
						    cout << deviceToken << " " << token.value << endl;
						    stats.success++;
					    },
					    [&stats](const auto&) { stats.failed++; });
				});
				submitted++;
			} catch (const ExchangeRequest::SerializationError& e) {
				SLOGE << "Device token [" << deviceToken << "] not submitted: " << e.what();
				stats.failed++;
			}
		}

		while (stats.completed() < static_cast<int>(args.deviceTokens.size())) {
			root->step(100ms);
		}

		SLOGI << args.deviceTokens.size() << " device token(s) processed, " << stats.success
		      << " exchanged successfully and " << stats.failed << " failed (" << submitted << " request(s) sent).";
		if (stats.failed > 0) {
			SLOGI << "There are failed exchanges, relaunch with --debug to consult exact error cause.";
		}
	}

	return tools::exitStatusForFailures(stats.failed);
}
