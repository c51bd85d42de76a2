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

#include <stdexcept>
#include <string>

#include "utils/transport/http/http-headers.hh"
#include "utils/transport/http/http-response.hh"

#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;

namespace tokenbridge::tester {
namespace {

HttpResponse responseWithStatus(const string& status) {
	HttpResponse response{};
	response.getHeaders().add(":status", status);
	return response;
}

void headersAddReplacesValue() {
	HttpHeaders headers{{"content-type", "text/plain"}, {":status", "200"}};
	headers.add("content-type", "application/json");

	BC_ASSERT_CPP_EQUAL(headers.getHeadersList().size(), 2);
	BC_ASSERT_CPP_EQUAL(headers.get("content-type").value_or(""), "application/json");
	BC_ASSERT_FALSE(headers.get("user-agent").has_value());

	const auto cHeaders = headers.makeCHeaderList();
	BC_HARD_ASSERT_CPP_EQUAL(cHeaders.size(), 2);
	BC_ASSERT_CPP_EQUAL(string(reinterpret_cast<const char*>(cHeaders[0].name), cHeaders[0].namelen),
	                    "content-type");
	BC_ASSERT_CPP_EQUAL(string(reinterpret_cast<const char*>(cHeaders[0].value), cHeaders[0].valuelen),
	                    "application/json");
}

void messageBody() {
	HttpMessage message{HttpHeaders{{":method", "POST"}}, "{\"a\":"};
	const string tail{"1}"};
	message.appendBody(tail.data(), tail.size());

	BC_ASSERT_CPP_EQUAL(message.getBodyAsString(), "{\"a\":1}");
	BC_ASSERT_CPP_EQUAL(message.getBody().size(), 7);
	BC_ASSERT_TRUE(message.getCDataProvider() != nullptr);
}

void validStatusCodes() {
	BC_ASSERT_CPP_EQUAL(responseWithStatus("200").getStatusCode(), 200);
	BC_ASSERT_CPP_EQUAL(responseWithStatus("100").getStatusCode(), 100);
	BC_ASSERT_CPP_EQUAL(responseWithStatus("503").getStatusCode(), 503);
	BC_ASSERT_CPP_EQUAL(responseWithStatus("599").getStatusCode(), 599);
	// Well-formed codes of unknown classes.
	BC_ASSERT_CPP_EQUAL(responseWithStatus("600").getStatusCode(), 600);
	BC_ASSERT_CPP_EQUAL(responseWithStatus("999").getStatusCode(), 999);
}

void invalidStatusCodes() {
	BC_ASSERT_THROWN(HttpResponse{}.getStatusCode(), runtime_error);
	BC_ASSERT_THROWN(responseWithStatus("").getStatusCode(), runtime_error);
	BC_ASSERT_THROWN(responseWithStatus("OK").getStatusCode(), runtime_error);
	BC_ASSERT_THROWN(responseWithStatus("200 OK").getStatusCode(), runtime_error);
	BC_ASSERT_THROWN(responseWithStatus("99").getStatusCode(), runtime_error);
	BC_ASSERT_THROWN(responseWithStatus("1000").getStatusCode(), runtime_error);
	BC_ASSERT_THROWN(responseWithStatus("99999999999").getStatusCode(), runtime_error);
}

TestSuite _("HttpMessage",
            {
                CLASSY_TEST(headersAddReplacesValue),
                CLASSY_TEST(messageBody),
                CLASSY_TEST(validStatusCodes),
                CLASSY_TEST(invalidStatusCodes),
            });

} // namespace
} // namespace tokenbridge::tester
