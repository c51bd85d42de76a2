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

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "tokenbridge/sofia-wrapper/su-root.hh"

#include "exchange/exchange-request.hh"
#include "exchange/token-exchanger.hh"
#include "utils/transport/http/http2client.hh"

#include "utils/assertion-debug-print.hh"
#include "utils/asserts.hh"
#include "utils/http-mock/http-mock.hh"
#include "utils/refusing-port.hh"
#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;
using namespace std::chrono_literals;
using namespace tokenbridge::exchange;

namespace tokenbridge::tester {
namespace {

constexpr auto kDeviceToken = "5d8e1a6a1f0c4e9bb0a2c3d4e5f60718293a4b5c6d7e8f90a1b2c3d4e5f60718";

/**
 * Token exchanger talking HTTP/2 over TLS to a local mock of the exchange endpoint.
 */
class ExchangeAgainstMock {
public:
	explicit ExchangeAgainstMock(const AppMetadata& metadata = AppMetadata{"org.example.app"}) {
		const auto port = mMock.serveAsync();
		BC_HARD_ASSERT(port > 0);
		mClient = Http2Client::make(*mRoot, "127.0.0.1", to_string(port));
		mClient->enableInsecureTestMode();
		mExchanger = make_unique<TokenExchanger>(mConfiguration, mClient, metadata);
	}

	HttpMock& mock() {
		return mMock;
	}
	Http2Client& client() {
		return *mClient;
	}

	/**
	 * Exchange the device token and iterate the loop until the outcome is delivered.
	 */
	ExchangeOutcome exchange(chrono::seconds timeout = 5s) {
		optional<ExchangeOutcome> outcome{};
		mExchanger->exchange(kDeviceToken, [&outcome](const ExchangeOutcome& o) { outcome = o; });
		BC_HARD_ASSERT(BcAssert{[this] { mRoot->step(10ms); }}
		                   .waitUntil(timeout, [&outcome] { return LOOP_ASSERTION(outcome.has_value()); })
		                   .assert_passed());
		return *outcome;
	}

	/**
	 * Exchange the device token without waiting for the outcome.
	 */
	void startExchange(optional<ExchangeOutcome>& outcome) {
		mExchanger->exchange(kDeviceToken, [&outcome](const ExchangeOutcome& o) { outcome = o; });
	}
	void step() {
		mRoot->step(10ms);
	}
	// The exchanger holds the only remaining reference on the client.
	void destroyExchangerAndClient() {
		mClient.reset();
		mExchanger.reset();
	}

private:
	HttpMock mMock{{string{ExchangeRequest::kPath}}, nullptr};
	shared_ptr<sofiasip::SuRoot> mRoot = make_shared<sofiasip::SuRoot>();
	shared_ptr<ExchangeConfiguration> mConfiguration =
	    make_shared<ExchangeConfiguration>("AIzaSyExampleKey", ApnsEnvironment::Development);
	shared_ptr<Http2Client> mClient{};
	unique_ptr<TokenExchanger> mExchanger{};
};

string headerValue(const Request& request, const string& name) {
	const auto header = request.headers.find(name);
	return header == request.headers.cend() ? "" : header->second.value;
}

// The request as it reaches the server.
void requestReceivedByServer() {
	ExchangeAgainstMock helper{AppMetadata{"org.example.app", "Example", "3.1", "310"}};
	helper.mock().setResponse(HttpMock::Response{200, R"({"results":[{"registration_token":"fcm-token"}]})"});

	helper.exchange();

	const auto request = helper.mock().popRequestReceived();
	BC_HARD_ASSERT(request != nullptr);
	BC_ASSERT_CPP_EQUAL(request->method, "POST");
	BC_ASSERT_CPP_EQUAL(request->path, "/iid/v1:batchImport");
	BC_ASSERT_CPP_EQUAL(headerValue(*request, "authorization"), "key=AIzaSyExampleKey");
	BC_ASSERT_CPP_EQUAL(headerValue(*request, "content-type"), "application/json");
	BC_ASSERT_CPP_EQUAL(headerValue(*request, "user-agent").rfind("Example/3.1 (build 310; ", 0), 0);

	const auto body = nlohmann::json::parse(request->body);
	BC_ASSERT_CPP_EQUAL(body.at("application").get<string>(), "org.example.app");
	BC_ASSERT_TRUE(body.at("sandbox").get<bool>());
	BC_HARD_ASSERT_CPP_EQUAL(body.at("apns_tokens").size(), 1);
	BC_ASSERT_CPP_EQUAL(body.at("apns_tokens")[0].get<string>(), kDeviceToken);

	BC_ASSERT_TRUE(helper.mock().popRequestReceived() == nullptr);
}

void successfulExchange() {
	ExchangeAgainstMock helper{};
	helper.mock().setResponse(HttpMock::Response{
	    200, R"({"results":[{"apns_token":"5d8e","status":"OK","registration_token":"fcm-token"}]})"});

	BC_ASSERT_CPP_EQUAL(helper.exchange(), RegistrationToken{"fcm-token"});
}

// Several exchanges share the same connection.
void successiveExchanges() {
	ExchangeAgainstMock helper{};
	helper.mock().setResponse(HttpMock::Response{200, R"({"results":[{"registration_token":"fcm-token"}]})"});

	for (int i = 0; i < 3; i++) {
		BC_ASSERT_CPP_EQUAL(helper.exchange(), RegistrationToken{"fcm-token"});
	}
	BC_ASSERT_ENUM_EQUAL(helper.client().getState(), Http2Client::State::Connected);
	BC_ASSERT_TRUE(helper.client().isIdle());
}

void clientErrorStatus() {
	ExchangeAgainstMock helper{};
	helper.mock().setResponse(HttpMock::Response{401, "Unauthorized"});

	const UnexpectedStatus expected{401, "Unauthorized"};
	BC_ASSERT_CPP_EQUAL(helper.exchange(), expected);
}

void serverErrorStatus() {
	ExchangeAgainstMock helper{};
	helper.mock().setResponse(HttpMock::Response{503, ""});

	const UnexpectedStatus expected{503, ""};
	BC_ASSERT_CPP_EQUAL(helper.exchange(), expected);
}

void malformedBody() {
	ExchangeAgainstMock helper{};
	helper.mock().setResponse(HttpMock::Response{200, R"({"results":[{"error":"InvalidToken"}]})"});

	const MalformedBody expected{R"({"results":[{"error":"InvalidToken"}]})"};
	BC_ASSERT_CPP_EQUAL(helper.exchange(), expected);
}

void missingBody() {
	ExchangeAgainstMock helper{};
	helper.mock().setResponse(HttpMock::Response{200, ""});

	BC_ASSERT_CPP_EQUAL(helper.exchange(), MissingBody{});
}

void connectionRefused() {
	RefusingPort port{};
	auto root = make_shared<sofiasip::SuRoot>();
	auto client = Http2Client::make(*root, "127.0.0.1", port.getPort());
	client->enableInsecureTestMode();
	TokenExchanger exchanger{make_shared<ExchangeConfiguration>("key", ApnsEnvironment::Production), client};

	optional<ExchangeOutcome> outcome{};
	exchanger.exchange(kDeviceToken, [&outcome](const ExchangeOutcome& o) { outcome = o; });
	BC_HARD_ASSERT(BcAssert{[&root] { root->step(10ms); }}
	                   .waitUntil(5s, [&outcome] { return LOOP_ASSERTION(outcome.has_value()); })
	                   .assert_passed());

	BC_HARD_ASSERT(holds_alternative<TransportFailure>(*outcome));
	BC_ASSERT_CPP_NOT_EQUAL(get<TransportFailure>(*outcome).reason.find("TLS connection"), string::npos);
	BC_ASSERT_ENUM_EQUAL(client->getState(), Http2Client::State::Disconnected);
}

// The server never answers: the request times out.
void requestTimeout() {
	ExchangeAgainstMock helper{};
	helper.mock().setResponse(nullopt);
	helper.client().setRequestTimeout(1s);

	const auto outcome = helper.exchange(5s);

	BC_HARD_ASSERT(holds_alternative<TransportFailure>(outcome));
	BC_ASSERT_CPP_NOT_EQUAL(get<TransportFailure>(outcome).reason.find("timeout"), string::npos);
	BC_ASSERT_TRUE(helper.client().isIdle());
}

// Requests still waiting for the TLS connection complete when the client is destroyed.
void clientDestroyedWhileConnecting() {
	ExchangeAgainstMock helper{};
	optional<ExchangeOutcome> outcome{};
	helper.startExchange(outcome);
	BC_ASSERT_FALSE(outcome.has_value());

	helper.destroyExchangerAndClient();

	BC_HARD_ASSERT(outcome.has_value());
	BC_HARD_ASSERT(holds_alternative<TransportFailure>(*outcome));
	BC_ASSERT_CPP_EQUAL(get<TransportFailure>(*outcome).reason, "HTTP/2 client destroyed");
	// Let the TLS connection callback find the client gone.
	for (int i = 0; i < 10; i++) {
		helper.step();
	}
}

// Requests sent but not yet answered complete when the client is destroyed.
void clientDestroyedWithRequestInFlight() {
	ExchangeAgainstMock helper{};
	helper.mock().setResponse(nullopt);
	optional<ExchangeOutcome> outcome{};
	helper.startExchange(outcome);
	shared_ptr<Request> received{};
	BC_HARD_ASSERT(BcAssert{[&helper] { helper.step(); }}
	                   .waitUntil(5s,
	                              [&helper, &received] {
		                              received = helper.mock().popRequestReceived();
		                              return LOOP_ASSERTION(received != nullptr);
	                              })
	                   .assert_passed());
	BC_ASSERT_FALSE(outcome.has_value());

	helper.destroyExchangerAndClient();

	BC_HARD_ASSERT(outcome.has_value());
	BC_HARD_ASSERT(holds_alternative<TransportFailure>(*outcome));
	BC_ASSERT_CPP_EQUAL(get<TransportFailure>(*outcome).reason, "HTTP/2 client destroyed");
}

TestSuite _("Http2Client",
            {
                CLASSY_TEST(requestReceivedByServer),
                CLASSY_TEST(successfulExchange),
                CLASSY_TEST(successiveExchanges),
                CLASSY_TEST(clientErrorStatus),
                CLASSY_TEST(serverErrorStatus),
                CLASSY_TEST(malformedBody),
                CLASSY_TEST(missingBody),
                CLASSY_TEST(connectionRefused),
                CLASSY_TEST(requestTimeout),
                CLASSY_TEST(clientDestroyedWhileConnecting),
                CLASSY_TEST(clientDestroyedWithRequestInFlight),
            });

} // namespace
} // namespace tokenbridge::tester
