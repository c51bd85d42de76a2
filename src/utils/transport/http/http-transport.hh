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

#include <memory>

#include "http-message-context.hh"

namespace tokenbridge {

/**
 * Something able to carry an HTTP request to a server and to report how it completed.
 *
 * For each call to send(), exactly one of the two callbacks is eventually invoked, exactly once:
 * onResponseCb when a complete response has been received, whatever its status code,
 * onErrorCb when no response could be obtained.
 */
class HttpTransport {
public:
	using HttpRequest = HttpMessageContext::HttpRequest;
	using OnResponseCb = HttpMessageContext::OnResponseCb;
	using OnErrorCb = HttpMessageContext::OnErrorCb;

	virtual ~HttpTransport() = default;

	virtual void
	send(const std::shared_ptr<HttpRequest>& request, const OnResponseCb& onResponseCb, const OnErrorCb& onErrorCb) = 0;
};

} // namespace tokenbridge
