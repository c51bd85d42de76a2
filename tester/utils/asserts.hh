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

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "bctoolbox/tester.h"

#include "utils/test-patterns/test.hh"

namespace tokenbridge::tester {

struct AssertionResult {
	const char* const file;
	const int line;
	std::string reason;

	// Asserts that the assertion passed. Logs the error otherwise.
	bool assert_passed() const {
		return bc_assert(file, line, operator bool(), reason.c_str());
	}

	operator bool() const { // Assertion is true if and only if there is no failure reason
		return reason.empty();
	}

	AssertionResult(const char* const file, const int line, const char* const reason)
	    : file(file), line(line), reason(reason == nullptr ? "" : reason) {
	}
};

#define LOOP_ASSERTION(assertion)                                                                                      \
	AssertionResult(__FILE__, __LINE__, (assertion) ? nullptr : "LOOP_ASSERTION(" #assertion ")")

/**
 * Evaluate an assertion repeatedly, running the given iterate functions (typically stepping an event loop)
 * between two evaluations, until it passes or the timeout expires.
 */
class BcAssert {
public:
	BcAssert() = default;
	BcAssert(const std::initializer_list<std::function<void()>>& iterateFuncs) : mIterateFuncs(iterateFuncs) {
	}

	template <typename Func>
	[[nodiscard]] AssertionResult waitUntil(const std::chrono::duration<double> timeout, Func&& condition) {
		const auto before = std::chrono::steady_clock::now();
		const auto timeLimit = before + timeout;
		for (uint32_t iterations = 0;; ++iterations) {
			for (const auto& iterate : mIterateFuncs) {
				iterate();
			}
			AssertionResult result = condition();
			if (result) return result;

			const auto now = std::chrono::steady_clock::now();
			if (timeLimit < now) {
				result.reason += "\n -> Still failing after " + std::to_string(iterations) + " iterations and " +
				                 std::to_string(
				                     std::chrono::duration_cast<std::chrono::milliseconds>(now - before).count()) +
				                 "ms";
				return result;
			}

			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}
	}

private:
	std::vector<std::function<void()>> mIterateFuncs;
};

} // namespace tokenbridge::tester
