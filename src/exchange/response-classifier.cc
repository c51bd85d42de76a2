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

#include "response-classifier.hh"

#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "utils/utf8-string.hh"

using namespace std;

namespace tokenbridge {
namespace exchange {

namespace {

optional<string> asText(const string& body) {
	if (!utils::isValidUtf8(body)) return nullopt;
	return body;
}

} // namespace

ExchangeOutcome ResponseClassifier::classifyTransportError(const string& reason) {
	return TransportFailure{reason};
}

ExchangeOutcome ResponseClassifier::classifyResponse(const shared_ptr<const HttpResponse>& response) {
	if (response == nullptr) {
		return InvalidResponse{"no response"};
	}

	int status = 0;
	try {
		status = response->getStatusCode();
	} catch (const runtime_error& e) {
		return InvalidResponse{e.what()};
	}

	const auto body = response->getBodyAsString();
	if (status < 200 || 300 <= status) {
		return UnexpectedStatus{status, asText(body)};
	}

	if (body.empty()) {
		return MissingBody{};
	}

	return classifyBody(body);
}

ExchangeOutcome ResponseClassifier::classifyBody(const string& body) {
	const auto json = nlohmann::json::parse(body, nullptr, false);
	if (!json.is_object()) {
		return MalformedBody{asText(body)};
	}

	const auto results = json.find("results");
	if (results == json.end() || !results->is_array() || results->empty()) {
		return MalformedBody{asText(body)};
	}

	const auto& first = results->front();
	if (!first.is_object()) {
		return MalformedBody{asText(body)};
	}
	const auto token = first.find("registration_token");
	if (token == first.end() || !token->is_string()) {
		return MalformedBody{asText(body)};
	}

	return RegistrationToken{token->get<string>()};
}

} // namespace exchange
} // namespace tokenbridge
