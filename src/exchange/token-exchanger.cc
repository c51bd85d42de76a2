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

#include "token-exchanger.hh"

#include <atomic>
#include <stdexcept>

#include "tokenbridge/logmanager.hh"

#include "utils/variant-utils.hh"

#include "exchange-request.hh"
#include "response-classifier.hh"

using namespace std;

namespace tokenbridge {
namespace exchange {

TokenExchanger::TokenExchanger(const shared_ptr<const ExchangeConfiguration>& configuration,
                               const shared_ptr<HttpTransport>& transport,
                               const AppMetadata& metadata)
    : mConfiguration(configuration), mTransport(transport), mMetadata(metadata) {
	if (mConfiguration == nullptr) throw invalid_argument{"TokenExchanger: null configuration"};
	if (mTransport == nullptr) throw invalid_argument{"TokenExchanger: null transport"};
	mLogPrefix = LogManager::makeLogPrefixForInstance(this, "TokenExchanger");
}

void TokenExchanger::exchange(const string& deviceToken, const Callback& callback) {
	exchange(deviceToken, nullptr, callback);
}

void TokenExchanger::exchange(const string& deviceToken,
                              const shared_ptr<ExecutionContext>& executionContext,
                              const Callback& callback) {
	auto request = make_shared<ExchangeRequest>(*mConfiguration, mMetadata, deviceToken);
	LOGD << "Exchanging device token [" << deviceToken << "]";

	// Guards against a transport completing the same request twice.
	auto delivered = make_shared<atomic_bool>(false);
	// Must not capture 'this': the exchanger may be destroyed before the request completes.
	auto onResponse = [logPrefix = mLogPrefix, delivered, deviceToken, executionContext, callback](
	                      const shared_ptr<HttpTransport::HttpRequest>&, const shared_ptr<HttpResponse>& response) {
		if (delivered->exchange(true)) {
			LOGE_CTX(logPrefix, "onResponse") << "Request for device token [" << deviceToken
			                                  << "] completed more than once, ignoring";
			return;
		}
		deliver(logPrefix, deviceToken, ResponseClassifier::classifyResponse(response), executionContext, callback);
	};
	auto onError = [logPrefix = mLogPrefix, delivered, deviceToken, executionContext, callback](
	                   const shared_ptr<HttpTransport::HttpRequest>&, const string& reason) {
		if (delivered->exchange(true)) {
			LOGE_CTX(logPrefix, "onError") << "Request for device token [" << deviceToken
			                               << "] completed more than once, ignoring";
			return;
		}
		deliver(logPrefix, deviceToken, ResponseClassifier::classifyTransportError(reason), executionContext, callback);
	};

	mTransport->send(request, onResponse, onError);
}

void TokenExchanger::deliver(const string& logPrefix,
                             const string& deviceToken,
                             ExchangeOutcome&& outcome,
                             const shared_ptr<ExecutionContext>& executionContext,
                             const Callback& callback) {
	if (isSuccess(outcome)) {
		LOGD_CTX(logPrefix) << "Device token [" << deviceToken << "] exchanged: " << StreamableVariant(outcome);
	} else {
		LOGW_CTX(logPrefix) << "Failed to exchange device token [" << deviceToken
		                    << "]: " << StreamableVariant(outcome);
	}

	const ExecutionContext::Work work = [callback, outcome = std::move(outcome), logPrefix]() {
		try {
			callback(outcome);
		} catch (const exception& e) {
			LOGE_CTX(logPrefix, "deliver") << "Uncaught exception in exchange callback: " << e.what();
		}
	};

	if (executionContext == nullptr) {
		work();
		return;
	}
	try {
		executionContext->submit(ExecutionContext::Work{work});
	} catch (const runtime_error& e) {
		LOGE_CTX(logPrefix) << "Execution context rejected the exchange callback (" << e.what()
		                    << "), invoking it on the completion thread";
		work();
	}
}

} // namespace exchange
} // namespace tokenbridge
