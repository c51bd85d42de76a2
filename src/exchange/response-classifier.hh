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
#include <string>

#include "utils/transport/http/http-response.hh"

#include "exchange-outcome.hh"

namespace tokenbridge {
namespace exchange {

/**
 * Turns the completion of a token exchange request into an ExchangeOutcome.
 *
 * Checks are applied in this order, the first one that applies gives the outcome:
 *  1. the transport failed -> TransportFailure
 *  2. no response, or no valid ':status' -> InvalidResponse
 *  3. status outside [200, 300) -> UnexpectedStatus (the body is not parsed)
 *  4. empty body -> MissingBody
 *  5. body is not a JSON object -> MalformedBody
 *  6. no non-empty 'results' array whose first element holds a string 'registration_token' -> MalformedBody
 *  7. otherwise -> RegistrationToken
 */
class ResponseClassifier {
public:
	static ExchangeOutcome classifyTransportError(const std::string& reason);
	static ExchangeOutcome classifyResponse(const std::shared_ptr<const HttpResponse>& response);

private:
	static ExchangeOutcome classifyBody(const std::string& body);
};

} // namespace exchange
} // namespace tokenbridge
