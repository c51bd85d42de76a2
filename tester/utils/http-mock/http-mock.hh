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

#include <atomic>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

#include <nghttp2/asio_http2_server.h>

#include "utils/tmp-dir.hh"

namespace ssl = boost::asio::ssl;

namespace tokenbridge::tester {

/**
 * A request as received by the mock, once its body has been entirely read.
 */
class Request {
public:
	std::string body;
	std::string method;
	std::string path;
	nghttp2::asio_http2::header_map headers;
};

/**
 * A simple HTTP/2 over TLS mock server, listening on 127.0.0.1 with a self-signed certificate.
 * Every request received on one of the given paths is recorded then answered with the configured response.
 */
class HttpMock {
public:
	struct Response {
		int status;
		std::string body;
	};

	explicit HttpMock(const std::initializer_list<std::string>& endpoints,
	                  std::atomic_int* requestReceivedCount = nullptr);
	~HttpMock() {
		forceCloseServer();
	}

	/**
	 * Set the response sent to the next requests. nullopt makes the mock never answer.
	 */
	void setResponse(const std::optional<Response>& response);

	/**
	 * @return the port the server listens on, -1 on failure.
	 */
	int serveAsync(const std::string& port = "0");
	void forceCloseServer();
	std::shared_ptr<Request> popRequestReceived();

private:
	void handleRequest(const nghttp2::asio_http2::server::request&, const nghttp2::asio_http2::server::response&);

	TmpDir mCertDir{"http-mock"};
	nghttp2::asio_http2::server::http2 mServer{};
	ssl::context mCtx;
	mutable std::recursive_mutex mMutex{};
	std::queue<std::shared_ptr<Request>> mRequestsReceived{};
	std::optional<Response> mResponse{Response{200, ""}};
	std::atomic_int* mRequestReceivedCount{nullptr};
};

} // namespace tokenbridge::tester
