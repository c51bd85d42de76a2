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

#include "tools/exit-status.hh"

#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;

namespace tokenbridge::tester {
namespace {

void failureCountIsTheExitStatus() {
	BC_ASSERT_CPP_EQUAL(tools::exitStatusForFailures(0), 0);
	BC_ASSERT_CPP_EQUAL(tools::exitStatusForFailures(1), 1);
	BC_ASSERT_CPP_EQUAL(tools::exitStatusForFailures(125), 125);
}

// Exit statuses are truncated to 8 bits: 256 failures would otherwise report a success.
void failureCountSaturates() {
	BC_ASSERT_CPP_EQUAL(tools::exitStatusForFailures(126), 125);
	BC_ASSERT_CPP_EQUAL(tools::exitStatusForFailures(256), 125);
	BC_ASSERT_CPP_EQUAL(tools::exitStatusForFailures(100000), 125);
}

TestSuite _("ExitStatus",
            {
                CLASSY_TEST(failureCountIsTheExitStatus),
                CLASSY_TEST(failureCountSaturates),
            });

} // namespace
} // namespace tokenbridge::tester
