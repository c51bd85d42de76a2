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

#include "apns-environment.hh"

#include <stdexcept>

using namespace std;

namespace tokenbridge {
namespace exchange {

ApnsEnvironment parseApnsEnvironment(string_view name) {
	if (name == "development" || name == "dev") return ApnsEnvironment::Development;
	if (name == "production" || name == "prod") return ApnsEnvironment::Production;
	throw invalid_argument{"unknown APNS environment [" + string{name} + "], expected 'development' or 'production'"};
}

string_view toString(ApnsEnvironment environment) noexcept {
	switch (environment) {
		case ApnsEnvironment::Development:
			return "development";
		case ApnsEnvironment::Production:
			return "production";
	}
	return "unknown";
}

ostream& operator<<(ostream& os, ApnsEnvironment environment) noexcept {
	return os << toString(environment);
}

} // namespace exchange
} // namespace tokenbridge
