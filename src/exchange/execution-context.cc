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

#include "execution-context.hh"

#include <stdexcept>

#include "tokenbridge/logmanager.hh"

using namespace std;

namespace tokenbridge {
namespace exchange {

ThreadPoolExecutionContext::ThreadPoolExecutionContext(unsigned int threadCount, unsigned int maxQueueSize)
    : mPool(threadCount, maxQueueSize) {
	mLogPrefix = LogManager::makeLogPrefixForInstance(this, "ThreadPoolExecutionContext");
}

void ThreadPoolExecutionContext::submit(Work&& work) {
	if (!mPool.run(std::move(work))) {
		LOGE << "Worker queue is full or stopped, rejecting work";
		throw runtime_error{"thread pool execution context rejected the work (queue full or stopped)"};
	}
}

} // namespace exchange
} // namespace tokenbridge
