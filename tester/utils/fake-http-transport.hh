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
#include <optional>
#include <string>
#include <vector>

#include "utils/transport/http/http-transport.hh"

namespace tokenbridge::tester {

/**
 * HttpTransport which records the requests it is given and lets the test decide how each of them completes.
 */
class FakeHttpTransport : public HttpTransport {
public:
	struct SentRequest {
		std::shared_ptr<HttpRequest> request;
		OnResponseCb onResponse;
		OnErrorCb onError;
	};

	void send(const std::shared_ptr<HttpRequest>& request,
	          const OnResponseCb& onResponseCb,
	          const OnErrorCb& onErrorCb) override {
		mSent.push_back({request, onResponseCb, onErrorCb});
	}

	const std::vector<SentRequest>& getSentRequests() const {
		return mSent;
	}

	/**
	 * Complete the i-th request with a response. A nullopt status leaves the ':status' header out.
	 */
	void respond(size_t i, std::optional<std::string> status, const std::string& body = "") {
		auto response = std::make_shared<HttpResponse>();
		if (status) response->getHeaders().add(":status", *status);
		response->setBody(body);
		respond(i, response);
	}
	void respond(size_t i, int status, const std::string& body = "") {
		respond(i, std::to_string(status), body);
	}
	void respond(size_t i, const std::shared_ptr<HttpResponse>& response) {
		const auto& sent = mSent.at(i);
		sent.onResponse(sent.request, response);
	}

	void fail(size_t i, const std::string& reason) {
		const auto& sent = mSent.at(i);
		sent.onError(sent.request, reason);
	}

private:
	std::vector<SentRequest> mSent{};
};

} // namespace tokenbridge::tester
