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

#include "exchange-request.hh"

#include <nlohmann/json.hpp>

#include "tokenbridge/logmanager.hh"

using namespace std;

namespace tokenbridge {
namespace exchange {

ExchangeRequest::ExchangeRequest(const ExchangeConfiguration& configuration,
                                 const AppMetadata& metadata,
                                 const string& deviceToken)
    : mDeviceToken(deviceToken) {
	// Read the configuration first: nothing may be built from an incomplete one.
	const auto& apiKey = configuration.getApiKey();
	const auto environment = configuration.getEnvironment();

	const nlohmann::json body{
	    {"application", metadata.getBundleIdentifier()},
	    {"sandbox", environment == ApnsEnvironment::Development},
	    {"apns_tokens", nlohmann::json::array({deviceToken})},
	};
	try {
		setBody(body.dump());
	} catch (const nlohmann::json::type_error& e) {
		throw SerializationError{string{"failed to serialize token exchange request body: "} + e.what()};
	}

	mHeaders.add(":method", "POST");
	mHeaders.add(":scheme", "https");
	mHeaders.add(":authority", string{kHost});
	mHeaders.add(":path", string{kPath});
	mHeaders.add("authorization", "key=" + apiKey);
	mHeaders.add("content-type", "application/json");
	if (const auto userAgent = metadata.getUserAgent()) {
		mHeaders.add("user-agent", *userAgent);
	}

	SLOGD << "ExchangeRequest[" << this << "]: created for " << environment << " device token [" << deviceToken
	      << "], payload is:\n"
	      << getBodyAsString();
}

} // namespace exchange
} // namespace tokenbridge
