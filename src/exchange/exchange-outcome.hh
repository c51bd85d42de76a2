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

#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace tokenbridge {
namespace exchange {

/**
 * FCM registration token obtained for the device token.
 */
struct RegistrationToken {
	std::string value;
};

/**
 * No response could be obtained (connection, TLS, timeout...).
 */
struct TransportFailure {
	std::string reason;
};

/**
 * A response was received but carries no usable HTTP status.
 */
struct InvalidResponse {
	std::string reason;
};

/**
 * The HTTP status is outside [200, 300).
 * The body is nullopt when it is not valid UTF-8 text.
 */
struct UnexpectedStatus {
	int status;
	std::optional<std::string> body;
};

/**
 * Successful status but no response body.
 */
struct MissingBody {};

/**
 * The body is not JSON, or not of the expected shape.
 */
struct MalformedBody {
	std::optional<std::string> body;
};

using ExchangeOutcome =
    std::variant<RegistrationToken, TransportFailure, InvalidResponse, UnexpectedStatus, MissingBody, MalformedBody>;

inline bool isSuccess(const ExchangeOutcome& outcome) {
	return std::holds_alternative<RegistrationToken>(outcome);
}

bool operator==(const RegistrationToken& lhs, const RegistrationToken& rhs);
bool operator==(const TransportFailure& lhs, const TransportFailure& rhs);
bool operator==(const InvalidResponse& lhs, const InvalidResponse& rhs);
bool operator==(const UnexpectedStatus& lhs, const UnexpectedStatus& rhs);
bool operator==(const MissingBody& lhs, const MissingBody& rhs);
bool operator==(const MalformedBody& lhs, const MalformedBody& rhs);

std::ostream& operator<<(std::ostream& os, const RegistrationToken& outcome);
std::ostream& operator<<(std::ostream& os, const TransportFailure& outcome);
std::ostream& operator<<(std::ostream& os, const InvalidResponse& outcome);
std::ostream& operator<<(std::ostream& os, const UnexpectedStatus& outcome);
std::ostream& operator<<(std::ostream& os, const MissingBody& outcome);
std::ostream& operator<<(std::ostream& os, const MalformedBody& outcome);

} // namespace exchange
} // namespace tokenbridge
