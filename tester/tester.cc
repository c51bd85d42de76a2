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

#include "tester.hh"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include <bctoolbox/logging.h>
#include <bctoolbox/tester.h>

#include <sofia-sip/su_log.h>

#include "tokenbridge/logmanager.hh"

namespace tokenbridge {
namespace tester {

namespace {
auto sSeed = std::random_device()();
}

namespace random {

std::random_device::result_type seed() {
	return sSeed;
}

std::string string(std::size_t length) {
	static constexpr std::string_view kAlphabet{"0123456789abcdefghijklmnopqrstuvwxyz"};
	static std::default_random_engine engine{seed()};
	static std::mutex engineMutex{};
	std::uniform_int_distribution<std::size_t> distribution{0, kAlphabet.size() - 1};

	std::lock_guard<std::mutex> lock{engineMutex};
	std::string result{};
	result.reserve(length);
	for (std::size_t i = 0; i < length; ++i) {
		result += kAlphabet[distribution(engine)];
	}
	return result;
}

} // namespace random

std::filesystem::path bcTesterWriteDir() {
	return std::filesystem::canonical(bc_tester_get_writable_dir_prefix());
}

static int verbose_arg_func(const char*) {
	LogManager::get().setLogLevel(BCTBX_LOG_DEBUG);
	su_log_set_level(nullptr, 9);
	return 0;
}

static int silent_arg_func([[maybe_unused]] const char* arg) {
	LogManager::get().setLogLevel(BCTBX_LOG_FATAL);
	su_log_set_level(nullptr, 0);
	return 0;
}

static void log_handler(int lev, const char* fmt, va_list args) {
	va_list cap;
	va_copy(cap, args);
	/* Otherwise, we must use stdio to avoid log formatting (for autocompletion etc.) */
	vfprintf(lev == BCTBX_LOG_ERROR ? stderr : stdout, fmt, cap);
	fprintf(lev == BCTBX_LOG_ERROR ? stderr : stdout, "\n");
	va_end(cap);
}

void tokenbridge_tester_init() {
	// Initialize logs
	LoggerParameters logParams{};
	logParams.level = BCTBX_LOG_WARNING;
	logParams.enableStandardOutput = true;
	LogManager::get().configure(logParams);

	su_log_redirect(
	    nullptr,
	    [](void*, const char* fmt, va_list ap) {
		    // remove final \n from SofiaSip
		    std::string copy{fmt, strlen(fmt) - 1};
		    LOGDV(copy.c_str(), ap);
	    },
	    nullptr);
	bc_tester_set_verbose_func(verbose_arg_func);
	bc_tester_set_silent_func(silent_arg_func);
	bc_tester_init(log_handler, BCTBX_LOG_MESSAGE, BCTBX_LOG_ERROR, ".");

	try {
		if (auto envVar = std::getenv("TOKENBRIDGE_SEED")) sSeed = std::stoul(envVar, nullptr, 0 /* Autodect base */);
	} catch (const std::invalid_argument&) {
		// leave sSeed untouched
	} catch (const std::out_of_range&) {
		// leave sSeed untouched
	}
	std::cerr << "TOKENBRIDGE_SEED=" << sSeed << "\n";
}

void tokenbridge_tester_uninit() {
	bc_tester_uninit();
}

} // namespace tester
} // namespace tokenbridge

int main(int argc, char* argv[]) {
	using namespace tokenbridge::tester;

	tokenbridge_tester_init();

	for (auto i = 1; i < argc; ++i) {
		auto ret = bc_tester_parse_args(argc, argv, i);
		if (ret > 0) {
			i += ret - 1;
			continue;
		} else if (ret < 0) {
			bc_tester_helper(argv[0], "");
		}
		return ret;
	}

	auto ret = bc_tester_start(argv[0]);
	tokenbridge_tester_uninit();
	return ret;
}
