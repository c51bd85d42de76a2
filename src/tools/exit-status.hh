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

#include <algorithm>

namespace tokenbridge::tools {

// Highest exit status reporting a count of failures. Statuses above are reserved by shells.
constexpr int kMaxFailureExitStatus = 125;

/**
 * @return the exit status reporting the given number of failed exchanges: the number itself, saturated to
 * kMaxFailureExitStatus so that it never wraps around to 0 (exit statuses are 8 bits wide).
 */
constexpr int exitStatusForFailures(int failed) {
	return std::clamp(failed, 0, kMaxFailureExitStatus);
}

} // namespace tokenbridge::tools
