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

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "utils/transport/http/http-message.hh"

#include "app-metadata.hh"
#include "exchange-configuration.hh"

namespace tokenbridge {
namespace exchange {

/**
 * One HTTP/2 request to the Instance ID batch import endpoint, asking for the FCM registration token matching a single
 * APNS device token:
 *
 * POST https://iid.googleapis.com/iid/v1:batchImport
 * authorization: key=<api key>
 * content-type: application/json
 *
 * {"application": "<bundle id>", "sandbox": <true for development>, "apns_tokens": ["<device token>"]}
 */
class ExchangeRequest : public HttpMessage {
public:
	/**
	 * The JSON body could not be produced from the given values.
	 */
	class SerializationError : public std::logic_error {
	public:
		using std::logic_error::logic_error;
	};

	static constexpr std::string_view kHost{"iid.googleapis.com"};
	static constexpr std::string_view kPort{"443"};
	static constexpr std::string_view kPath{"/iid/v1:batchImport"};

	/**
	 * @throw BadConfiguration if the configuration is not complete.
	 * @throw SerializationError if the body cannot be serialized (e.g. a device token which is not valid UTF-8).
	 */
	ExchangeRequest(const ExchangeConfiguration& configuration,
	                const AppMetadata& metadata,
	                const std::string& deviceToken);

	const std::string& getDeviceToken() const {
		return mDeviceToken;
	}

private:
	std::string mDeviceToken;
};

} // namespace exchange
} // namespace tokenbridge
