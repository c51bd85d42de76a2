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

#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "exchange/response-classifier.hh"
#include "utils/variant-utils.hh"

#include "utils/assertion-debug-print.hh"
#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;
using namespace tokenbridge::exchange;

namespace tokenbridge::tester {
namespace {

shared_ptr<const HttpResponse> makeResponse(const optional<string>& status, const string& body = "") {
	auto response = make_shared<HttpResponse>();
	if (status) response->getHeaders().add(":status", *status);
	response->setBody(body);
	return response;
}

ExchangeOutcome classify(const optional<string>& status, const string& body = "") {
	return ResponseClassifier::classifyResponse(makeResponse(status, body));
}

void transportError() {
	const auto outcome = ResponseClassifier::classifyTransportError("connection closed by peer");
	BC_ASSERT_CPP_EQUAL(outcome, TransportFailure{"connection closed by peer"});
	BC_ASSERT_FALSE(isSuccess(outcome));
}

void success() {
	const auto outcome = classify("200", R"({"results":[{"apns_token":"abc","status":"OK","registration_token":"fcm-1"}]})");
	BC_ASSERT_CPP_EQUAL(outcome, RegistrationToken{"fcm-1"});
	BC_ASSERT_TRUE(isSuccess(outcome));
}

// Any 2xx status is a success, extra fields and extra results are ignored.
void successIgnoresExtraContent() {
	const auto outcome = classify(
	    "204", R"({"extra":true,"results":[{"registration_token":"fcm-1","more":1},{"registration_token":"fcm-2"}]})");
	BC_ASSERT_CPP_EQUAL(outcome, RegistrationToken{"fcm-1"});
}

void noResponse() {
	const auto outcome = ResponseClassifier::classifyResponse(nullptr);
	BC_ASSERT_TRUE(holds_alternative<InvalidResponse>(outcome));
}

void invalidStatus() {
	BC_ASSERT_TRUE(holds_alternative<InvalidResponse>(classify(nullopt, R"({"results":[]})")));
	BC_ASSERT_TRUE(holds_alternative<InvalidResponse>(classify("abc")));
	BC_ASSERT_TRUE(holds_alternative<InvalidResponse>(classify("42")));
	BC_ASSERT_TRUE(holds_alternative<InvalidResponse>(classify("1000")));
}

void unexpectedStatus() {
	const UnexpectedStatus unauthorized{401, "Unauthorized"};
	BC_ASSERT_CPP_EQUAL(classify("401", "Unauthorized"), unauthorized);

	const UnexpectedStatus redirect{302, ""};
	BC_ASSERT_CPP_EQUAL(classify("302"), redirect);

	const UnexpectedStatus informational{100, ""};
	BC_ASSERT_CPP_EQUAL(classify("100"), informational);

	// Outside of the defined classes, still a status.
	const UnexpectedStatus unknownClass{600, "body"};
	BC_ASSERT_CPP_EQUAL(classify("600", "body"), unknownClass);

	// Not UTF-8: the body is not carried as text.
	const UnexpectedStatus binary{503, nullopt};
	BC_ASSERT_CPP_EQUAL(classify("503", "\xff\xfe\xfd"), binary);
}

// A valid token in the body does not make an error status a success.
void statusCheckedBeforeBody() {
	const string body{R"({"results":[{"registration_token":"fcm-1"}]})"};
	const UnexpectedStatus expected{500, body};
	BC_ASSERT_CPP_EQUAL(classify("500", body), expected);
}

void missingBody() {
	BC_ASSERT_CPP_EQUAL(classify("200"), MissingBody{});
}

void malformedBody() {
	const auto expectMalformed = [](const string& body) {
		const MalformedBody expected{body};
		BC_ASSERT_CPP_EQUAL(classify("200", body), expected);
	};

	// Not JSON.
	expectMalformed("not json");
	expectMalformed(R"({"results":[)");
	// JSON but not an object.
	expectMalformed(R"([{"registration_token":"fcm-1"}])");
	expectMalformed(R"("fcm-1")");
	expectMalformed("null");
	// Object of the wrong shape.
	expectMalformed(R"({})");
	expectMalformed(R"({"results":{"registration_token":"fcm-1"}})");
	expectMalformed(R"({"results":[]})");
	expectMalformed(R"({"results":["fcm-1"]})");
	expectMalformed(R"({"results":[{"apns_token":"abc","status":"Internal Server Error"}]})");
	expectMalformed(R"({"results":[{"registration_token":42}]})");
	expectMalformed(R"({"results":[{"registration_token":null}]})");

	const MalformedBody binary{nullopt};
	BC_ASSERT_CPP_EQUAL(classify("200", "\xff\xfe\xfd"), binary);
}

void outcomesArePrintable() {
	ostringstream success{};
	success << StreamableVariant(classify("200", R"({"results":[{"registration_token":"t"}]})"));
	BC_ASSERT_CPP_EQUAL(success.str(), "RegistrationToken[t]");

	ostringstream failures{};
	failures << UnexpectedStatus{404, ""} << " " << UnexpectedStatus{404, nullopt} << " " << MissingBody{};
	BC_ASSERT_CPP_EQUAL(failures.str(), "UnexpectedStatus[404, <empty>] UnexpectedStatus[404, <not UTF-8>] MissingBody");
}

TestSuite _("ResponseClassifier",
            {
                CLASSY_TEST(transportError),
                CLASSY_TEST(success),
                CLASSY_TEST(successIgnoresExtraContent),
                CLASSY_TEST(noResponse),
                CLASSY_TEST(invalidStatus),
                CLASSY_TEST(unexpectedStatus),
                CLASSY_TEST(statusCheckedBeforeBody),
                CLASSY_TEST(missingBody),
                CLASSY_TEST(malformedBody),
                CLASSY_TEST(outcomesArePrintable),
            });

} // namespace
} // namespace tokenbridge::tester
