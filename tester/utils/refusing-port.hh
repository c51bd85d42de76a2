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

#include <cstdint>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "utils/test-patterns/test.hh"

namespace tokenbridge::tester {

/**
 * A TCP port bound on the loopback interface but not listening: connections to it are refused.
 */
class RefusingPort {
public:
	RefusingPort() : mFd(socket(AF_INET, SOCK_STREAM, 0)) {
		BC_HARD_ASSERT(mFd >= 0);
		sockaddr_in address{};
		address.sin_family = AF_INET;
		address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
		address.sin_port = 0;
		if (bind(mFd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
			close(mFd);
			BC_HARD_FAIL("cannot bind a socket on the loopback interface");
		}
		socklen_t length = sizeof(address);
		if (getsockname(mFd, reinterpret_cast<sockaddr*>(&address), &length) != 0) {
			close(mFd);
			BC_HARD_FAIL("cannot get the port of the bound socket");
		}
		mPort = ntohs(address.sin_port);
	}
	~RefusingPort() {
		close(mFd);
	}

	RefusingPort(const RefusingPort&) = delete;
	RefusingPort& operator=(const RefusingPort&) = delete;

	std::string getPort() const {
		return std::to_string(mPort);
	}

private:
	int mFd;
	std::uint16_t mPort{0};
};

} // namespace tokenbridge::tester
