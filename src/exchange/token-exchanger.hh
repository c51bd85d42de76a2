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

#include "utils/transport/http/http-transport.hh"

#include "app-metadata.hh"
#include "exchange-configuration.hh"
#include "exchange-outcome.hh"
#include "execution-context.hh"

namespace tokenbridge {
namespace exchange {

/**
 * Exchanges APNS device tokens for FCM registration tokens, one request per device token.
 *
 * Every call to exchange() that returns normally invokes its callback exactly once, with the outcome of the request.
 * Calls are independent from each other: they are neither ordered nor deduplicated.
 */
class TokenExchanger {
public:
	using Callback = std::function<void(const ExchangeOutcome&)>;

	TokenExchanger(const std::shared_ptr<const ExchangeConfiguration>& configuration,
	               const std::shared_ptr<HttpTransport>& transport,
	               const AppMetadata& metadata = AppMetadata{});

	/**
	 * Send the exchange request and return immediately. The callback runs on the thread completing the request.
	 *
	 * @throw BadConfiguration if the configuration is incomplete, nothing is sent.
	 * @throw ExchangeRequest::SerializationError if the request body cannot be built, nothing is sent.
	 */
	void exchange(const std::string& deviceToken, const Callback& callback);
	/**
	 * Same as above, but the callback is submitted to the given execution context. A null context behaves as the
	 * overload without context.
	 */
	void exchange(const std::string& deviceToken,
	              const std::shared_ptr<ExecutionContext>& executionContext,
	              const Callback& callback);

private:
	static void deliver(const std::string& logPrefix,
	                    const std::string& deviceToken,
	                    ExchangeOutcome&& outcome,
	                    const std::shared_ptr<ExecutionContext>& executionContext,
	                    const Callback& callback);

	std::shared_ptr<const ExchangeConfiguration> mConfiguration;
	std::shared_ptr<HttpTransport> mTransport;
	AppMetadata mMetadata;
	std::string mLogPrefix{};
};

} // namespace exchange
} // namespace tokenbridge
