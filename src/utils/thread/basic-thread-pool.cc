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

#include "tokenbridge/logmanager.hh"

#include "basic-thread-pool.hh"

using namespace std;

namespace tokenbridge {

BasicThreadPool::BasicThreadPool(unsigned int maxThreadNumber, unsigned int maxQueueSize)
    : mMaxQueueSize(maxQueueSize), mMaxThreadNumber(maxThreadNumber) {
	SLOGD << "BasicThreadPool [" << this << "]: init with " << maxThreadNumber << " threads and queue size "
	      << maxQueueSize;

	for (unsigned int i = 0; i < mMaxThreadNumber; i++) {
		mThreadPool.emplace_back(&BasicThreadPool::_run, this);
	}
}

BasicThreadPool::~BasicThreadPool() {
	stop();
}

bool BasicThreadPool::run(Task t) {
	bool enqueued = false;
	{
		unique_lock<mutex> lock(mTasksMutex);

		if (mState == Running && (mMaxQueueSize == 0 || mTasks.size() < mMaxQueueSize)) {
			mTasks.push(std::move(t));
			enqueued = true;
		}
	}

	// Wake up one thread if the task was successfully queued
	if (enqueued) {
		mCondition.notify_one();
	}

	return enqueued;
}

void BasicThreadPool::stop() {
	{
		unique_lock<mutex> lock(mTasksMutex);
		// Only the caller leaving the Running state joins the threads.
		if (mState != Running) return;
		mState = Shutdown;
	}
	SLOGD << "BasicThreadPool [" << this << "]: shutdown";

	// Wake up all threads.
	mCondition.notify_all();

	for (auto& thread : mThreadPool) {
		if (thread.joinable()) thread.join();
	}
	mThreadPool.clear();

	unique_lock<mutex> lock(mTasksMutex);
	mState = Stopped;
}

void BasicThreadPool::_run() {
	Task task;
	while (true) {
		{
			unique_lock<mutex> lock(mTasksMutex);

			// Wait until queue is not empty or termination signal is sent.
			mCondition.wait(lock, [this]() { return !mTasks.empty() || mState != Running; });
			// If termination signal received and queue is empty then exit else continue clearing the queue.
			if (mState != Running && mTasks.empty()) {
				SLOGD << "BasicThreadPool [" << this << "]: terminate thread";
				return;
			}

			task = std::move(mTasks.front());
			mTasks.pop();
		}
		try {
			task();
		} catch (const exception& e) {
			SLOGE << "BasicThreadPool [" << this << "]: uncaught exception in task: " << e.what();
		}
		// Keep this to trigger task destructor out of locked scope
		task = nullptr;
	}
}

} // namespace tokenbridge
