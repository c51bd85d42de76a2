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

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "exceptions/bad-configuration.hh"
#include "exchange/exchange-request.hh"
#include "exchange/token-exchanger.hh"

#include "utils/assertion-debug-print.hh"
#include "utils/fake-http-transport.hh"
#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;
using namespace tokenbridge::exchange;

namespace tokenbridge::tester {
namespace {

constexpr auto kDeviceToken = "0f1e2d3c4b5a69788796a5b4c3d2e1f00f1e2d3c4b5a69788796a5b4c3d2e1f0";
constexpr auto kSuccessBody = R"({"results":[{"apns_token":"0f1e","status":"OK","registration_token":"fcm-token"}]})";

/**
 * Keeps the submitted work until the test runs it.
 */
class QueuingExecutionContext : public ExecutionContext {
public:
	void submit(Work&& work) override {
		mQueue.push_back(std::move(work));
	}

	void runAll() {
		auto queue = std::move(mQueue);
		mQueue.clear();
		for (const auto& work : queue) {
			work();
		}
	}

	size_t size() const {
		return mQueue.size();
	}

private:
	vector<Work> mQueue{};
};

class RejectingExecutionContext : public ExecutionContext {
public:
	void submit(Work&&) override {
		throw runtime_error{"rejected"};
	}
};

/**
 * Exchanger wired to a fake transport, recording every outcome delivered.
 */
struct ExchangeFixture {
	shared_ptr<ExchangeConfiguration> configuration =
	    make_shared<ExchangeConfiguration>("AIzaSyExampleKey", ApnsEnvironment::Development);
	shared_ptr<FakeHttpTransport> transport = make_shared<FakeHttpTransport>();
	TokenExchanger exchanger{configuration, transport, AppMetadata{"org.example.app"}};
	vector<ExchangeOutcome> outcomes{};

	TokenExchanger::Callback recorder() {
		return [this](const ExchangeOutcome& outcome) { outcomes.push_back(outcome); };
	}
};

void successfulExchange() {
	ExchangeFixture fixture{};

	fixture.exchanger.exchange(kDeviceToken, fixture.recorder());

	const auto& sent = fixture.transport->getSentRequests();
	BC_HARD_ASSERT_CPP_EQUAL(sent.size(), 1);
	BC_ASSERT_CPP_EQUAL(sent[0].request->getHeaders().get("authorization").value_or(""), "key=AIzaSyExampleKey");
	const auto body = nlohmann::json::parse(sent[0].request->getBodyAsString());
	BC_ASSERT_CPP_EQUAL(body.at("application").get<string>(), "org.example.app");
	BC_ASSERT_TRUE(body.at("sandbox").get<bool>());
	BC_ASSERT_CPP_EQUAL(body.at("apns_tokens")[0].get<string>(), kDeviceToken);
	BC_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 0);

	fixture.transport->respond(0, 200, kSuccessBody);

	BC_HARD_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 1);
	BC_ASSERT_CPP_EQUAL(fixture.outcomes[0], RegistrationToken{"fcm-token"});
}

void transportFailure() {
	ExchangeFixture fixture{};

	fixture.exchanger.exchange(kDeviceToken, fixture.recorder());
	fixture.transport->fail(0, "request timeout after 30s");

	BC_HARD_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 1);
	BC_ASSERT_CPP_EQUAL(fixture.outcomes[0], TransportFailure{"request timeout after 30s"});
}

void errorStatus() {
	ExchangeFixture fixture{};

	fixture.exchanger.exchange(kDeviceToken, fixture.recorder());
	fixture.transport->respond(0, 401, "Unauthorized");

	BC_HARD_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 1);
	const UnexpectedStatus expected{401, "Unauthorized"};
	BC_ASSERT_CPP_EQUAL(fixture.outcomes[0], expected);
}

void responseWithoutStatus() {
	ExchangeFixture fixture{};

	fixture.exchanger.exchange(kDeviceToken, fixture.recorder());
	fixture.transport->respond(0, nullopt, kSuccessBody);

	BC_HARD_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 1);
	BC_ASSERT_TRUE(holds_alternative<InvalidResponse>(fixture.outcomes[0]));
}

// A transport misbehaving by completing a request twice must not lead to a second callback invocation.
void callbackInvokedExactlyOnce() {
	ExchangeFixture fixture{};

	fixture.exchanger.exchange(kDeviceToken, fixture.recorder());
	fixture.transport->respond(0, 200, kSuccessBody);
	fixture.transport->fail(0, "late failure");
	fixture.transport->respond(0, 500, "");

	BC_HARD_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 1);
	BC_ASSERT_CPP_EQUAL(fixture.outcomes[0], RegistrationToken{"fcm-token"});
}

// Each call is an independent request, even for the same token.
void callsAreIndependent() {
	ExchangeFixture fixture{};
	vector<string> order{};

	fixture.exchanger.exchange(kDeviceToken, [&order](const ExchangeOutcome&) { order.emplace_back("first"); });
	fixture.exchanger.exchange(kDeviceToken, [&order](const ExchangeOutcome&) { order.emplace_back("second"); });
	BC_HARD_ASSERT_CPP_EQUAL(fixture.transport->getSentRequests().size(), 2);

	// Completed in reverse order.
	fixture.transport->fail(1, "connection refused");
	fixture.transport->respond(0, 200, kSuccessBody);

	BC_HARD_ASSERT_CPP_EQUAL(order.size(), 2);
	BC_ASSERT_CPP_EQUAL(order[0], "second");
	BC_ASSERT_CPP_EQUAL(order[1], "first");
}

void unconfiguredExchangeSendsNothing() {
	auto configuration = make_shared<ExchangeConfiguration>();
	auto transport = make_shared<FakeHttpTransport>();
	TokenExchanger exchanger{configuration, transport};
	auto invoked = false;

	BC_ASSERT_THROWN(exchanger.exchange(kDeviceToken, [&invoked](const ExchangeOutcome&) { invoked = true; }),
	                 BadConfigurationEmpty);

	BC_ASSERT_CPP_EQUAL(transport->getSentRequests().size(), 0);
	BC_ASSERT_FALSE(invoked);
}

void unserializableTokenSendsNothing() {
	ExchangeFixture fixture{};

	BC_ASSERT_THROWN(fixture.exchanger.exchange("\xc3\x28", fixture.recorder()), ExchangeRequest::SerializationError);

	BC_ASSERT_CPP_EQUAL(fixture.transport->getSentRequests().size(), 0);
	BC_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 0);
}

// The configuration is read at each call.
void reconfigurationAppliesToNextExchange() {
	ExchangeFixture fixture{};

	fixture.configuration->configure("rotated-key", ApnsEnvironment::Production);
	fixture.exchanger.exchange(kDeviceToken, fixture.recorder());

	const auto& request = fixture.transport->getSentRequests().at(0).request;
	BC_ASSERT_CPP_EQUAL(request->getHeaders().get("authorization").value_or(""), "key=rotated-key");
	BC_ASSERT_FALSE(nlohmann::json::parse(request->getBodyAsString()).at("sandbox").get<bool>());
}

void callbackSubmittedToExecutionContext() {
	ExchangeFixture fixture{};
	auto context = make_shared<QueuingExecutionContext>();

	fixture.exchanger.exchange(kDeviceToken, context, fixture.recorder());
	fixture.transport->respond(0, 200, kSuccessBody);

	BC_ASSERT_CPP_EQUAL(context->size(), 1);
	BC_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 0);

	context->runAll();
	BC_HARD_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 1);
	BC_ASSERT_CPP_EQUAL(fixture.outcomes[0], RegistrationToken{"fcm-token"});
}

void nullExecutionContextDeliversInline() {
	ExchangeFixture fixture{};

	fixture.exchanger.exchange(kDeviceToken, nullptr, fixture.recorder());
	fixture.transport->fail(0, "connection closed by peer");

	BC_HARD_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 1);
}

// The outcome must not be lost when the execution context cannot take the callback.
void rejectingExecutionContextStillDelivers() {
	ExchangeFixture fixture{};

	fixture.exchanger.exchange(kDeviceToken, make_shared<RejectingExecutionContext>(), fixture.recorder());
	fixture.transport->respond(0, 200, kSuccessBody);

	BC_HARD_ASSERT_CPP_EQUAL(fixture.outcomes.size(), 1);
	BC_ASSERT_CPP_EQUAL(fixture.outcomes[0], RegistrationToken{"fcm-token"});
}

void throwingCallbackDoesNotReachTransport() {
	ExchangeFixture fixture{};

	fixture.exchanger.exchange(kDeviceToken, [](const ExchangeOutcome&) { throw runtime_error{"callback failure"}; });

	try {
		fixture.transport->respond(0, 200, kSuccessBody);
	} catch (const exception&) {
		BC_FAIL("exception escaped the exchange callback");
	}
}

void exchangerDestroyedBeforeCompletion() {
	auto configuration = make_shared<ExchangeConfiguration>("key", ApnsEnvironment::Production);
	auto transport = make_shared<FakeHttpTransport>();
	optional<ExchangeOutcome> outcome{};

	{
		TokenExchanger exchanger{configuration, transport};
		exchanger.exchange(kDeviceToken, [&outcome](const ExchangeOutcome& o) { outcome = o; });
	}
	transport->respond(0, 200, kSuccessBody);

	BC_HARD_ASSERT_TRUE(outcome.has_value());
	BC_ASSERT_CPP_EQUAL(*outcome, RegistrationToken{"fcm-token"});
}

void nullCollaboratorsAreRejected() {
	const auto configuration = make_shared<ExchangeConfiguration>();
	const auto transport = make_shared<FakeHttpTransport>();

	BC_ASSERT_THROWN(TokenExchanger(nullptr, transport), invalid_argument);
	BC_ASSERT_THROWN(TokenExchanger(configuration, nullptr), invalid_argument);
}

TestSuite _("TokenExchanger",
            {
                CLASSY_TEST(successfulExchange),
                CLASSY_TEST(transportFailure),
                CLASSY_TEST(errorStatus),
                CLASSY_TEST(responseWithoutStatus),
                CLASSY_TEST(callbackInvokedExactlyOnce),
                CLASSY_TEST(callsAreIndependent),
                CLASSY_TEST(unconfiguredExchangeSendsNothing),
                CLASSY_TEST(unserializableTokenSendsNothing),
                CLASSY_TEST(reconfigurationAppliesToNextExchange),
                CLASSY_TEST(callbackSubmittedToExecutionContext),
                CLASSY_TEST(nullExecutionContextDeliversInline),
                CLASSY_TEST(rejectingExecutionContextStillDelivers),
                CLASSY_TEST(throwingCallbackDoesNotReachTransport),
                CLASSY_TEST(exchangerDestroyedBeforeCompletion),
                CLASSY_TEST(nullCollaboratorsAreRejected),
            });

} // namespace
} // namespace tokenbridge::tester
