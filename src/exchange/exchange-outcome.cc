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

#include "exchange-outcome.hh"

using namespace std;

namespace tokenbridge {
namespace exchange {

namespace {

ostream& printBody(ostream& os, const optional<string>& body) {
	if (!body) return os << "<not UTF-8>";
	if (body->empty()) return os << "<empty>";
	return os << *body;
}

} // namespace

bool operator==(const RegistrationToken& lhs, const RegistrationToken& rhs) {
	return lhs.value == rhs.value;
}
bool operator==(const TransportFailure& lhs, const TransportFailure& rhs) {
	return lhs.reason == rhs.reason;
}
bool operator==(const InvalidResponse& lhs, const InvalidResponse& rhs) {
	return lhs.reason == rhs.reason;
}
bool operator==(const UnexpectedStatus& lhs, const UnexpectedStatus& rhs) {
	return lhs.status == rhs.status && lhs.body == rhs.body;
}
bool operator==(const MissingBody&, const MissingBody&) {
	return true;
}
bool operator==(const MalformedBody& lhs, const MalformedBody& rhs) {
	return lhs.body == rhs.body;
}

ostream& operator<<(ostream& os, const RegistrationToken& outcome) {
	return os << "RegistrationToken[" << outcome.value << "]";
}
ostream& operator<<(ostream& os, const TransportFailure& outcome) {
	return os << "TransportFailure[" << outcome.reason << "]";
}
ostream& operator<<(ostream& os, const InvalidResponse& outcome) {
	return os << "InvalidResponse[" << outcome.reason << "]";
}
ostream& operator<<(ostream& os, const UnexpectedStatus& outcome) {
	os << "UnexpectedStatus[" << outcome.status << ", ";
	return printBody(os, outcome.body) << "]";
}
ostream& operator<<(ostream& os, const MissingBody&) {
	return os << "MissingBody";
}
ostream& operator<<(ostream& os, const MalformedBody& outcome) {
	os << "MalformedBody[";
	return printBody(os, outcome.body) << "]";
}

} // namespace exchange
} // namespace tokenbridge
