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

#include "http-mock.hh"

#include <string>

#include "tokenbridge/logmanager.hh"

#include "utils/tls/certificate.hh"
#include "utils/tls/private-key.hh"

using namespace std;
using namespace nghttp2::asio_http2;
using namespace nghttp2::asio_http2::server;
using namespace boost::asio::ssl;

namespace tokenbridge::tester {

HttpMock::HttpMock(const std::initializer_list<std::string>& endpoints, std::atomic_int* requestReceivedCount)
    : mCtx(ssl::context::tls), mRequestReceivedCount(requestReceivedCount) {
	const auto keyPath = mCertDir.path() / "key.pem";
	const auto certPath = mCertDir.path() / "cert.pem";
	TlsPrivateKey key{};
	key.writeToFile(keyPath);
	TlsCertificate{key}.writeToFile(certPath);

	mCtx.use_private_key_file(keyPath.string(), context::pem);
	mCtx.use_certificate_chain_file(certPath.string());

	for (const auto& endpoint : endpoints) {
		mServer.handle(endpoint, [this](const request& req, const response& res) { handleRequest(req, res); });
	}
}

void HttpMock::setResponse(const std::optional<Response>& response) {
	lock_guard<recursive_mutex> lock(mMutex);
	mResponse = response;
}

void HttpMock::handleRequest(const request& req, const response& res) {
	SLOGD << "HttpMock::handleRequest() - " << req.method() << " " << req.uri().path;
	auto requestReceived = make_shared<Request>();
	requestReceived->method = req.method();
	requestReceived->headers = req.header();
	requestReceived->path = req.uri().path;

	// A zero length chunk marks the end of the request body.
	req.on_data([this, requestReceived, &res](const uint8_t* data, std::size_t len) {
		lock_guard<recursive_mutex> lock(mMutex);
		if (len > 0) {
			requestReceived->body.append(reinterpret_cast<const char*>(data), len);
			return;
		}

		mRequestsReceived.push(requestReceived);
		if (mRequestReceivedCount) (*mRequestReceivedCount)++;

		if (!mResponse) return;
		header_map headers{{"content-type", {"application/json", false}}};
		res.write_head(mResponse->status, std::move(headers));
		res.end(mResponse->body);
	});
}

int HttpMock::serveAsync(const std::string& port) {
	boost::system::error_code ec{};

	configure_tls_context_easy(ec, mCtx);

	if (mServer.listen_and_serve(ec, mCtx, "127.0.0.1", port, true)) {
		SLOGE << "HttpMock::serveAsync() - error: " << ec.message();
		return -1;
	}
	return !mServer.ports().empty() ? mServer.ports().front() : -1;
}

void HttpMock::forceCloseServer() {
	for (const auto& ioService : mServer.io_services()) {
		ioService->stop();
	}

	mServer.stop();
}

std::shared_ptr<Request> HttpMock::popRequestReceived() {
	lock_guard<recursive_mutex> lock(mMutex);
	shared_ptr<Request> ret{nullptr};
	if (!mRequestsReceived.empty()) {
		ret = mRequestsReceived.front();
		mRequestsReceived.pop();
	}

	return ret;
}

} // namespace tokenbridge::tester
