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

#include <stdexcept>
#include <string>

namespace tokenbridge {

/**
 * Raised when an operation needs a configuration value that was never provided.
 */
class BadConfiguration : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

class BadConfigurationEmpty : public BadConfiguration {
public:
	explicit BadConfigurationEmpty(const std::string& parameterName)
	    : BadConfiguration{"parameter '" + parameterName + "' must be set"} {
	}
};

} // namespace tokenbridge
