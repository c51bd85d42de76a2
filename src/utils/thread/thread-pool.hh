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

namespace tokenbridge {

/**
 * Interface describing a pool of threads for executing custom tasks.
 */
class ThreadPool {
public:
	using Task = std::function<void()>;

	virtual ~ThreadPool() = default;

	/**
	 * Assign a task to a thread for execution. If no thread is available
	 * while this method is called, then the task is queued until a thread
	 * has completed its task.
	 * @param[in] t the task to run.
	 * @return True on success or false when the queue is full or the pool is stopped.
	 */
	virtual bool run(Task t) = 0;

	/**
	 * Stop all the threads.
	 * Tasks already queued are still executed, then the threads exit and cannot be started again.
	 */
	virtual void stop() = 0;
};

} // namespace tokenbridge
