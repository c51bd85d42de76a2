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

#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "tokenbridge/logmanager.hh"

#include "tls-connection.hh"

using namespace std;

namespace tokenbridge {

TlsConnection::TlsConnection(const string& host, const string& port, const string& trustStorePath, bool mustBeHttp2)
    : mCtx{makeDefaultCtx()}, mHost{host}, mPort{port}, mMustBeHttp2{mustBeHttp2} {
	mLogPrefix = LogManager::makeLogPrefixForInstance(this, "TlsConnection");

	SSL_CTX_set_verify(mCtx.get(), SSL_VERIFY_PEER, nullptr);
	const auto loaded = trustStorePath.empty()
	                        ? SSL_CTX_set_default_verify_paths(mCtx.get())
	                        : SSL_CTX_load_verify_locations(mCtx.get(), trustStorePath.c_str(), nullptr);
	if (loaded != 1) {
		throw CreationError{formatBioError("error loading trust store [" + trustStorePath + "]", loaded)};
	}
}

void TlsConnection::connectAsync(sofiasip::SuRoot& root, const function<void()>& onConnectCb) noexcept {
	// SAFETY: The thread MUST NOT outlive `this`;
	mThread = thread{[this, &root, onConnectCb]() {
		connect();
		try {
			root.addToMainLoop(onConnectCb);
		} catch (const exception& e) {
			LOGE << "Failed to notify connection result to the main loop: " << e.what();
		}
	}};
}

void TlsConnection::connect() noexcept {
	if (isConnected()) return;
	mLastError.clear();

	const auto hostname = mHost + ":" + mPort;
	const auto errmsg = "error while connecting to tls://" + hostname;
	SSL* ssl = nullptr;

	BIOUniquePtr newBio{BIO_new_ssl_connect(mCtx.get())};
	if (newBio == nullptr) {
		mLastError = formatBioError(errmsg + ": BIO allocation failed", 0);
		LOGE << mLastError;
		return;
	}
	BIO_set_conn_hostname(newBio.get(), hostname.c_str());
	BIO_get_ssl(newBio.get(), &ssl);
	SSL_set_mode(ssl, SSL_MODE_AUTO_RETRY);
	SSL_set_tlsext_host_name(ssl, mHost.c_str());
	if (!mInsecure) SSL_set1_host(ssl, mHost.c_str());
	if (mMustBeHttp2) {
		unsigned char protos[] = {2, 'h', '2'};
		SSL_set_alpn_protos(ssl, protos, sizeof(protos));
	}
	BIO_set_nbio(newBio.get(), 1);

	/* Ensure that the error queue is empty */
	ERR_clear_error();

	/* Do the connection by actively waiting for connection completion */
	auto status = 0;
	chrono::milliseconds time{0};
	while (status <= 0) {
		status = BIO_do_handshake(newBio.get());
		if (status <= 0 && !BIO_should_retry(newBio.get())) {
			mLastError = formatBioError(errmsg, status);
			LOGE << mLastError;
			return;
		}
		if (status <= 0 && time >= mTimeout) {
			mLastError = errmsg + ": timeout";
			LOGE << mLastError;
			return;
		}

		constexpr chrono::milliseconds sleepDuration{10};
		this_thread::sleep_for(sleepDuration);
		time += sleepDuration;
	}

	if (!mInsecure && SSL_get_verify_result(ssl) != X509_V_OK) {
		mLastError = errmsg + ": certificate verification error: " +
		             X509_verify_cert_error_string(SSL_get_verify_result(ssl));
		LOGE << mLastError;
		return;
	}

	LOGD << "Connected to " << hostname;
	mBio = std::move(newBio);
}

int TlsConnection::getFd() const noexcept {
	if (mBio == nullptr) return -1;

	int fd = 0;
	ERR_clear_error();
	auto status = BIO_get_fd(mBio.get(), &fd);
	if (status < 0) {
		LOGE << formatBioError("getting fd from BIO failed", status);
		return -1;
	}
	return fd;
}

int TlsConnection::read(void* data, int dlen) noexcept {
	if (mBio == nullptr) return -1;

	ERR_clear_error();
	auto nread = BIO_read(mBio.get(), data, dlen);
	if (nread <= 0) {
		if (BIO_should_retry(mBio.get())) {
			// Either the socket was empty or there wasn't enough data to
			// form a complete TLS message.
			return 0;
		}
		// Zero without retry means the peer closed the connection.
		LOGD << formatBioError("error while reading data", nread);
		return -1;
	}
	return nread;
}

int TlsConnection::write(const void* data, int dlen) noexcept {
	if (mBio == nullptr) return -1;
	if (dlen <= 0) return 0;

	ERR_clear_error();
	auto nwritten = BIO_write(mBio.get(), data, dlen);
	if (nwritten <= 0) {
		if (BIO_should_retry(mBio.get())) {
			return 0;
		}
		LOGE << formatBioError("error while writing data", nwritten);
		return -1;
	}
	return nwritten;
}

void TlsConnection::enableInsecureTestMode() {
	LOGW << "BE CAREFUL, YOU BETTER BE IN TEST ENV, YOU ARE USING AN INSECURE CONNECTION";
	mInsecure = true;
	SSL_CTX_set_verify(mCtx.get(), SSL_VERIFY_NONE, nullptr);
}

TlsConnection::SSLCtxUniquePtr TlsConnection::makeDefaultCtx() {
	SSLCtxUniquePtr ctx{SSL_CTX_new(TLS_client_method())};
	if (ctx == nullptr) {
		throw CreationError{formatBioError("SSL_CTX_new() failed", 0)};
	}
	SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
	return ctx;
}

string TlsConnection::formatBioError(const string& msg, int status) {
	ostringstream os;
	os << msg << ": " << status << " - " << strerror(errno) << " - SSL error stack:";
	ERR_print_errors_cb(
	    [](const char* str, [[maybe_unused]] size_t len, void* u) {
		    auto& os = *static_cast<ostream*>(u);
		    os << '\n' << '\t' << str;
		    return 0;
	    },
	    &os);
	return os.str();
}

} // namespace tokenbridge
