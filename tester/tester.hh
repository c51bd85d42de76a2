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

#include <filesystem>
#include <random>
#include <string>

namespace tokenbridge::tester {

// Canonical path to the configured writable directory for tokenbridge_tester
std::filesystem::path bcTesterWriteDir();

void tokenbridge_tester_init();
void tokenbridge_tester_uninit();

namespace random {

/**
 * Get seed for the currently running instance.
 * @return seed
 */
std::random_device::result_type seed();

/**
 * Generate a string of the given length made of lowercase letters and digits, from the seed of the running instance.
 */
std::string string(std::size_t length);

} // namespace random
} // namespace tokenbridge::tester
