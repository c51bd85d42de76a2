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

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>

#include "tokenbridge/sofia-wrapper/su-root.hh"

#include "utils/thread/must-finish-thread.hh"

namespace tokenbridge {

/**
 * A client-side TLS connection over the OpenSSL library.
 * All I/O are non-blocking once the connection is established.
 */
class TlsConnection {
public:
	struct SSLCtxDeleter {
		void operator()(SSL_CTX* ssl) noexcept {
			SSL_CTX_free(ssl);
		}
	};
	using SSLCtxUniquePtr = std::unique_ptr<SSL_CTX, SSLCtxDeleter>;

	class CreationError : public std::runtime_error {
	public:
		explicit CreationError(const std::string& message)
		    : std::runtime_error("failed to create TlsConnection, reason = " + message) {
		}
	};

	/**
	 * @brief Instantiate a new TLS connection.
	 *
	 * @param host other end hostname or IP address
	 * @param port other end port
	 * @param trustStorePath file of trusted CA certificates in PEM format. Empty means the system default trust store.
	 * @param mustBeHttp2 whether or not to negotiate HTTP/2 through ALPN
	 * @throw CreationError if the SSL context could not be created or the trust store could not be loaded.
	 */
	TlsConnection(const std::string& host,
	              const std::string& port,
	              const std::string& trustStorePath = "",
	              bool mustBeHttp2 = false);

	TlsConnection(const TlsConnection&) = delete;
	TlsConnection(TlsConnection&&) = delete;

	const std::string& getHost() const noexcept {
		return mHost;
	}
	const std::string& getPort() const noexcept {
		return mPort;
	}

	/**
	 * @brief Establish connection with the other end.
	 *
	 * @note On failure, the reason is available through getLastError() and isConnected() stays false.
	 * @warning This is a blocking operation.
	 */
	void connect() noexcept;

	/**
	 * @brief Establish connection with the other end, from a helper thread.
	 *
	 * @details onConnectCb is posted to the given loop once the attempt has completed, whatever its result.
	 */
	void connectAsync(sofiasip::SuRoot& root, const std::function<void()>& onConnectCb) noexcept;

	void disconnect() noexcept {
		mBio.reset();
	}

	bool isConnected() const noexcept {
		return mBio != nullptr;
	}

	/**
	 * Reason of the last failed connection attempt, empty if the last attempt succeeded.
	 */
	const std::string& getLastError() const noexcept {
		return mLastError;
	}

	int getFd() const noexcept;

	/**
	 * @brief Attempt to read data from the socket.
	 *
	 * @return number of bytes read. A value of zero means "retry later": the socket may be empty
	 * or there were not enough data to form a complete TLS message. A negative value means an error occurred.
	 */
	int read(void* data, int dlen) noexcept;
	/**
	 * @brief Attempt to write data to the socket.
	 *
	 * @return number of bytes written. A value of zero means "retry later". A negative value means an error
	 * occurred.
	 */
	int write(const void* data, int dlen) noexcept;

	void setTimeout(const std::chrono::milliseconds& timeout) {
		mTimeout = timeout;
	}

	/**
	 * Disable the verification of the server certificate.
	 *
	 * @warning do not use this mode in production applications.
	 */
	void enableInsecureTestMode();

private:
	struct BIODeleter {
		void operator()(BIO* bio) noexcept {
			BIO_free_all(bio);
		}
	};
	using BIOUniquePtr = std::unique_ptr<BIO, BIODeleter>;

	static std::string formatBioError(const std::string& msg, int status);
	static SSLCtxUniquePtr makeDefaultCtx();

	BIOUniquePtr mBio{nullptr};
	SSLCtxUniquePtr mCtx{nullptr};
	std::string mHost{}, mPort{};
	bool mMustBeHttp2 = false;
	bool mInsecure = false;
	std::chrono::milliseconds mTimeout{20000};
	std::string mLastError{};
	std::string mLogPrefix{};

	/* Must be the last field to be deleted first and guarantee all previous fields will be available to the thread on
	 * destruction
	 */
	MustFinishThread mThread;
};

} // namespace tokenbridge
