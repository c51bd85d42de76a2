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

#include "http-message.hh"

namespace tokenbridge {

/**
 * An HTTP/2 response, an HttpMessage whose status code is held by the ':status' pseudo-header.
 */
class HttpResponse : public HttpMessage {
public:
	using HttpMessage::HttpMessage;

	/**
	 * @throw std::runtime_error if the ':status' header is missing, is not an integer or is out of [100, 999].
	 */
	int getStatusCode() const;
};

} // namespace tokenbridge
