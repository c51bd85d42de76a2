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

#include <functional>
#include <memory>
#include <string>

#include "tokenbridge/sofia-wrapper/su-root.hh"

#include "utils/thread/basic-thread-pool.hh"

namespace tokenbridge {
namespace exchange {

/**
 * Place where a unit of work is scheduled for execution.
 * Ordering between submitted units is the one provided by the implementation.
 */
class ExecutionContext {
public:
	using Work = std::function<void()>;

	virtual ~ExecutionContext() = default;

	/**
	 * Schedule the work and return immediately.
	 * @throw std::runtime_error if the work could not be scheduled.
	 */
	virtual void submit(Work&& work) = 0;
};

/**
 * Runs the work on the thread iterating a sofia-sip loop, in submission order.
 */
class SuRootExecutionContext : public ExecutionContext {
public:
	explicit SuRootExecutionContext(const std::shared_ptr<sofiasip::SuRoot>& root) : mRoot(root) {
	}

	void submit(Work&& work) override {
		mRoot->addToMainLoop(work);
	}

private:
	std::shared_ptr<sofiasip::SuRoot> mRoot;
};

/**
 * Runs the work on a pool of worker threads. No ordering is guaranteed when the pool has several threads.
 */
class ThreadPoolExecutionContext : public ExecutionContext {
public:
	/**
	 * @param maxQueueSize maximum number of units waiting for a thread, 0 means unbounded.
	 */
	ThreadPoolExecutionContext(unsigned int threadCount, unsigned int maxQueueSize);

	/**
	 * @throw std::runtime_error when the queue is full or the pool has been stopped.
	 */
	void submit(Work&& work) override;

	/**
	 * Run the units already submitted then stop the worker threads.
	 */
	void stop() {
		mPool.stop();
	}

private:
	BasicThreadPool mPool;
	std::string mLogPrefix{};
};

} // namespace exchange
} // namespace tokenbridge
