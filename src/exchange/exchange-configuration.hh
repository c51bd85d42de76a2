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

#include <optional>
#include <string>

#include "apns-environment.hh"

namespace tokenbridge {
namespace exchange {

/**
 * Credentials needed to call the token exchange endpoint.
 * Configure it once before the first exchange. A later configure() call replaces both values.
 * Not thread-safe: must not be written while exchanges read it.
 */
class ExchangeConfiguration {
public:
	ExchangeConfiguration() = default;
	ExchangeConfiguration(const std::string& apiKey, ApnsEnvironment environment) {
		configure(apiKey, environment);
	}

	/**
	 * Store both values. The key is not validated.
	 */
	void configure(const std::string& apiKey, ApnsEnvironment environment);

	bool isComplete() const {
		return mApiKey.has_value() && mEnvironment.has_value();
	}

	/**
	 * @throw BadConfiguration if the configuration has never been set.
	 */
	const std::string& getApiKey() const;
	/**
	 * @throw BadConfiguration if the configuration has never been set.
	 */
	ApnsEnvironment getEnvironment() const;

private:
	std::optional<std::string> mApiKey{};
	std::optional<ApnsEnvironment> mEnvironment{};
};

} // namespace exchange
} // namespace tokenbridge
