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

#include <ostream>
#include <string>
#include <string_view>

namespace tokenbridge {
namespace exchange {

/**
 * APNS environment the device token was issued by.
 */
enum class ApnsEnvironment { Development, Production };

/**
 * @param name "development" (or "dev") or "production" (or "prod"), case sensitive.
 * @throw std::invalid_argument for any other name.
 */
ApnsEnvironment parseApnsEnvironment(std::string_view name);

std::string_view toString(ApnsEnvironment environment) noexcept;

std::ostream& operator<<(std::ostream& os, ApnsEnvironment environment) noexcept;

} // namespace exchange
} // namespace tokenbridge
