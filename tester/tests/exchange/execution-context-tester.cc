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

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "tokenbridge/sofia-wrapper/su-root.hh"

#include "exchange/execution-context.hh"

#include "utils/asserts.hh"
#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;
using namespace std::chrono_literals;
using namespace tokenbridge::exchange;

namespace tokenbridge::tester {
namespace {

// Work is run by the thread iterating the loop, in submission order.
void suRootContextRunsOnLoopThread() {
	auto root = make_shared<sofiasip::SuRoot>();
	SuRootExecutionContext context{root};
	vector<int> order{};
	thread::id runner{};

	for (int i = 0; i < 5; i++) {
		context.submit([&order, &runner, i]() {
			order.push_back(i);
			runner = this_thread::get_id();
		});
	}
	BC_ASSERT_CPP_EQUAL(order.size(), 0);

	BC_HARD_ASSERT(BcAssert{[&root] { root->step(10ms); }}
	                   .waitUntil(1s, [&order] { return LOOP_ASSERTION(order.size() == 5); })
	                   .assert_passed());
	BC_ASSERT_TRUE(order == (vector<int>{0, 1, 2, 3, 4}));
	BC_ASSERT_TRUE(runner == this_thread::get_id());
}

// Work submitted from another thread is run by the loop thread.
void suRootContextAcceptsWorkFromOtherThreads() {
	auto root = make_shared<sofiasip::SuRoot>();
	auto context = make_shared<SuRootExecutionContext>(root);
	atomic_bool ranOnLoop{false};
	const auto loopThread = this_thread::get_id();

	thread submitter{[context, &ranOnLoop, loopThread]() {
		context->submit([&ranOnLoop, loopThread]() { ranOnLoop = this_thread::get_id() == loopThread; });
	}};
	submitter.join();

	BC_HARD_ASSERT(BcAssert{[&root] { root->step(10ms); }}
	                   .waitUntil(1s, [&ranOnLoop] { return LOOP_ASSERTION(ranOnLoop.load()); })
	                   .assert_passed());
}

class ThreadPoolContextRunsOnWorker : public Test {
public:
	void operator()() override {
		ThreadPoolExecutionContext context{2, 0};
		mutex runnersMutex{};
		vector<thread::id> runners{};

		for (int i = 0; i < 4; i++) {
			context.submit([&runnersMutex, &runners]() {
				lock_guard<mutex> lock{runnersMutex};
				runners.push_back(this_thread::get_id());
			});
		}
		context.stop();

		BC_HARD_ASSERT_CPP_EQUAL(runners.size(), 4);
		for (const auto& runner : runners) {
			BC_ASSERT_TRUE(runner != this_thread::get_id());
		}
	}
};

class ThreadPoolContextRejectsWhenFull : public Test {
public:
	void operator()() override {
		ThreadPoolExecutionContext context{1, 1};
		atomic_bool release{false};
		atomic_bool started{false};

		try {
			// Occupies the only worker.
			context.submit([&release, &started]() {
				started = true;
				while (!release) this_thread::sleep_for(1ms);
			});
			BC_HARD_ASSERT_TRUE(waitFor([&started]() { return started.load(); }, 1s));
			// Fills the queue.
			context.submit([]() {});

			BC_ASSERT_THROWN(context.submit([]() {}), runtime_error);
		} catch (const exception&) {
			release = true;
			throw;
		}

		release = true;
		context.stop();
		BC_ASSERT_THROWN(context.submit([]() {}), runtime_error);
	}
};

TestSuite _("ExecutionContext",
            {
                CLASSY_TEST(suRootContextRunsOnLoopThread),
                CLASSY_TEST(suRootContextAcceptsWorkFromOtherThreads),
                CLASSY_TEST(ThreadPoolContextRunsOnWorker),
                CLASSY_TEST(ThreadPoolContextRejectsWhenFull),
            });

} // namespace
} // namespace tokenbridge::tester
