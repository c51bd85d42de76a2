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

#include "http-response.hh"

#include <stdexcept>
#include <string>

using namespace std;

namespace tokenbridge {

int HttpResponse::getStatusCode() const {
	const auto status = mHeaders.get(":status");
	if (!status) {
		throw runtime_error("no status code in HTTP response");
	}

	int i = 0;
	size_t parsed = 0;
	try {
		i = stoi(*status, &parsed);
	} catch (const logic_error& e) {
		throw runtime_error("status code is not a valid integer value [" + *status + "]: " + e.what());
	}
	if (parsed != status->size()) {
		throw runtime_error("status code is not a valid integer value [" + *status + "]");
	}

	// Any three-digit code is a status, unknown classes included.
	if (i < 100 || i > 999) {
		throw runtime_error("status code is not a three-digit HTTP code [" + to_string(i) + "]");
	}
	return i;
}

} // namespace tokenbridge
