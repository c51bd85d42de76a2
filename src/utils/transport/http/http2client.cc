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

#include <algorithm>
#include <limits>
#include <sstream>

#include <nghttp2/nghttp2.h>
#include <nghttp2/nghttp2ver.h>

#include "tokenbridge/logmanager.hh"
#include "tokenbridge/sofia-wrapper/su-root.hh"

#include "http2client.hh"

using namespace std;

namespace tokenbridge {

string Http2Client::BadStateError::formatWhatArg(State state) noexcept {
	ostringstream os{};
	os << "bad state [" << state << "]";
	return os.str();
}

Http2Client::Http2Client(sofiasip::SuRoot& root, decltype(mConn)&& connection, SessionSettings&& sessionSettings)
    : mConn(std::move(connection)), mRoot(root), mIdleTimer(root.getCPtr(), sIdleTimeout),
      mSessionSettings(std::move(sessionSettings)) {
	mLogPrefix = LogManager::makeLogPrefixForInstance(this, "Http2Client");
	LOGD << "Constructing Http2Client with TlsConnection[" << mConn.get() << "] to " << getHost();
}

Http2Client::Http2Client(sofiasip::SuRoot& root,
                         const string& host,
                         const string& port,
                         const string& trustStorePath,
                         SessionSettings&& sessionSettings)
    : Http2Client(root, make_unique<TlsConnection>(host, port, trustStorePath, true), std::move(sessionSettings)) {
}

Http2Client::~Http2Client() {
	if (mState == State::Connected) {
		su_root_unregister(mRoot.getCPtr(), &mPollInWait, onPollInCb, this);
	}
	// Every request sent must be completed, including those still waiting for the connection.
	try {
		discardAllPendingRequests("HTTP/2 client destroyed");
		discardAllActiveRequests("HTTP/2 client destroyed");
	} catch (const exception& e) {
		LOGE << "Error while discarding requests on destruction: " << e.what();
	}
}

void Http2Client::sendAllPendingRequests() {
	auto pending = std::move(mPendingHttpContexts);
	mPendingHttpContexts.clear();
	for (const auto& context : pending) {
		send(context->getRequest(), context->getOnResponseCb(), context->getOnErrorCb());
	}
}

void Http2Client::discardAllPendingRequests(const string& reason) {
	auto pending = std::move(mPendingHttpContexts);
	mPendingHttpContexts.clear();
	for (const auto& context : pending) {
		context->getOnErrorCb()(context->getRequest(), reason);
	}
}

void Http2Client::discardAllActiveRequests(const string& reason) {
	auto active = std::move(mActiveHttpContexts);
	mActiveHttpContexts.clear();
	for (const auto& [streamId, context] : active) {
		context->getOnErrorCb()(context->getRequest(), reason);
	}
}

void Http2Client::send(const shared_ptr<HttpRequest>& request,
                       const OnResponseCb& onResponseCb,
                       const OnErrorCb& onErrorCb) {
	LOGD << "Sending request[" << request << "] to " << getHost();

	auto context = make_shared<HttpMessageContext>(request, onResponseCb, onErrorCb, mRoot, mRequestTimeout);

	if (mState == State::Disconnected) {
		LOGD << "Not connected, trying to connect";
		tlsConnect();
	}
	if (mState != State::Connected) {
		mPendingHttpContexts.emplace_back(std::move(context));
		return;
	}

	auto streamId =
	    nghttp2_submit_request(mHttpSession.get(), nullptr, request->getHeaders().makeCHeaderList().data(),
	                           request->getHeaders().getHeadersList().size(), request->getCDataProvider(), nullptr);
	if (streamId < 0) {
		const auto reason = string{"request submission failed: "} + nghttp2_strerror(streamId);
		LOGE << reason;
		onErrorCb(request, reason);
		return;
	}

	// The context MUST be in the map before nghttp2_session_send() for the timeout timer to be started by
	// onFrameSent().
	mActiveHttpContexts.emplace(streamId, std::move(context));
	auto status = sendAll();
	if (status < 0) {
		const auto reason = string{"request sending failed: "} + nghttp2_strerror(status);
		LOGE << "[" << streamId << "] " << reason;
		mActiveHttpContexts.erase(streamId);
		onErrorCb(request, reason);
		return;
	}

	LOGD << "[" << streamId << "] request[" << request << "] submitted";
}

void Http2Client::tlsConnect() {
	if (mState != State::Disconnected) {
		throw BadStateError(mState);
	}
	setState(State::Connecting);

	mConn->connectAsync(mRoot, [weakThis = weak_from_this()]() {
		if (auto sharedThis = weakThis.lock()) {
			sharedThis->onTlsConnectCb();
		}
	});
}

void Http2Client::onTlsConnectCb() {
	if (mConn->isConnected()) {
		http2Setup();
	} else {
		setState(State::Disconnected);
		discardAllPendingRequests("TLS connection to " + getHost() + " failed: " + mConn->getLastError());
	}
}

void Http2Client::http2Setup() {
	auto sendCb = [](nghttp2_session* session, const uint8_t* data, size_t length, [[maybe_unused]] int flags,
	                 void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		return thiz->doSend(*session, data, length);
	};
	auto recvCb = [](nghttp2_session* session, uint8_t* buf, size_t length, [[maybe_unused]] int flags,
	                 void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		return thiz->doRecv(*session, buf, length);
	};
	auto frameSentCb = [](nghttp2_session* session, const nghttp2_frame* frame, void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		thiz->onFrameSent(*session, *frame);
		return 0;
	};
	auto frameRecvCb = [](nghttp2_session* session, const nghttp2_frame* frame, void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		thiz->onFrameRecv(*session, *frame);
		return 0;
	};
	auto onHeaderRecvCb = [](nghttp2_session* session, const nghttp2_frame* frame, const uint8_t* name, size_t namelen,
	                         const uint8_t* value, size_t valuelen, uint8_t flags, void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		string nameStr{reinterpret_cast<const char*>(name), namelen};
		string valueStr{reinterpret_cast<const char*>(value), valuelen};
		thiz->onHeaderRecv(*session, *frame, nameStr, valueStr, flags);
		return 0;
	};
	auto onDataChunkRecvCb = [](nghttp2_session* session, uint8_t flags, int32_t stream_id, const uint8_t* data,
	                            size_t len, void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		thiz->onDataReceived(*session, flags, stream_id, data, len);
		return 0;
	};
	auto onStreamClosedCb = [](nghttp2_session* session, int32_t stream_id, uint32_t error_code,
	                           void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		thiz->onStreamClosed(*session, stream_id, error_code);
		return 0;
	};

	nghttp2_session_callbacks* cbs;
	nghttp2_session_callbacks_new(&cbs);
	unique_ptr<nghttp2_session_callbacks, void (*)(nghttp2_session_callbacks*)> cbsPtr{cbs,
	                                                                                   nghttp2_session_callbacks_del};
	nghttp2_session_callbacks_set_send_callback(cbs, sendCb);
	nghttp2_session_callbacks_set_recv_callback(cbs, recvCb);
	nghttp2_session_callbacks_set_on_frame_send_callback(cbs, frameSentCb);
	nghttp2_session_callbacks_set_on_frame_recv_callback(cbs, frameRecvCb);
	nghttp2_session_callbacks_set_on_header_callback(cbs, onHeaderRecvCb);
	nghttp2_session_callbacks_set_on_data_chunk_recv_callback(cbs, onDataChunkRecvCb);
	nghttp2_session_callbacks_set_on_stream_close_callback(cbs, onStreamClosedCb);

	nghttp2_session* session;
	nghttp2_session_client_new(&session, cbs, this);
	NgHttp2SessionPtr httpSession{session};

	int status;
	if ((status = mSessionSettings.submitTo(session)) != 0) {
		const auto reason = string{"submitting settings failed: "} + nghttp2_strerror(status);
		LOGE << reason;
		mConn->disconnect();
		setState(State::Disconnected);
		discardAllPendingRequests(reason);
		return;
	}

	mHttpSession = std::move(httpSession);

	su_wait_create(&mPollInWait, mConn->getFd(), SU_WAIT_IN);
	su_root_register(mRoot.getCPtr(), &mPollInWait, onPollInCb, this, su_pri_normal);
	resetIdleTimer();

	setState(State::Connected);
	sendAllPendingRequests();
}

ssize_t Http2Client::doSend([[maybe_unused]] nghttp2_session& session, const uint8_t* data, size_t length) noexcept {
	length = min(length, size_t(numeric_limits<int>::max()));
	auto nwritten = mConn->write(data, int(length));
	if (nwritten < 0) {
		LOGE << "Error while writing into socket [" << nwritten << "]";
		return NGHTTP2_ERR_CALLBACK_FAILURE;
	}
	if (nwritten == 0 && length > 0) return NGHTTP2_ERR_WOULDBLOCK;
	return nwritten;
}

ssize_t Http2Client::doRecv([[maybe_unused]] nghttp2_session& session, uint8_t* data, size_t length) noexcept {
	length = min(length, size_t(numeric_limits<int>::max()));
	auto nread = mConn->read(data, int(length));
	if (nread < 0) {
		LOGD << "Connection closed while reading socket";
		return NGHTTP2_ERR_EOF;
	}
	if (nread == 0 && length > 0) return NGHTTP2_ERR_WOULDBLOCK;
	return nread;
}

/**
 * Synchronously called by nghttp2_session_send
 */
void Http2Client::onFrameSent([[maybe_unused]] nghttp2_session& session, const nghttp2_frame& frame) noexcept {
	LOGD << "[" << frame.hd.stream_id << "] " << Http2Tools::frameTypeToString(frame.hd.type) << " frame sent ("
	     << frame.hd.length << "B)";
	resetTimeoutTimer(frame.hd.stream_id);
	resetIdleTimer();
}

void Http2Client::onFrameRecv([[maybe_unused]] nghttp2_session& session, const nghttp2_frame& frame) noexcept {
	const auto logPrefix = mLogPrefix + "[" + to_string(frame.hd.stream_id) + "]";
	LOGD_CTX(logPrefix) << Http2Tools::frameTypeToString(frame.hd.type) << " frame received (" << frame.hd.length
	                    << "B)";
	resetTimeoutTimer(frame.hd.stream_id);
	resetIdleTimer();

	switch (frame.hd.type) {
		case NGHTTP2_WINDOW_UPDATE: // Remote says we're clear for another window.
			resumeSending(logPrefix);
			break;
		case NGHTTP2_SETTINGS:
			if ((frame.hd.flags & NGHTTP2_FLAG_ACK) == 0) {
				LOGD_CTX(logPrefix) << "Server settings received";
			}
			break;
		case NGHTTP2_GOAWAY: {
			ostringstream msg{};
			msg << "GOAWAY frame received, errorCode=[" << frame.goaway.error_code << "], lastStreamId=["
			    << frame.goaway.last_stream_id << "]:";
			if (frame.goaway.opaque_data_len > 0) {
				msg << '\n';
				msg.write(reinterpret_cast<const char*>(frame.goaway.opaque_data), frame.goaway.opaque_data_len);
			} else {
				msg << " <empty>";
			}
			LOGD_CTX(logPrefix) << msg.str();
			LOGD_CTX(logPrefix) << "Scheduling connection closing";
			mLastSID = frame.goaway.last_stream_id;
			break;
		}
		default:
			break;
	}
}

void Http2Client::onHeaderRecv([[maybe_unused]] nghttp2_session& session,
                               const nghttp2_frame& frame,
                               const string& name,
                               const string& value,
                               uint8_t flags) noexcept {
	const auto& streamId = frame.hd.stream_id;

	auto contextIterator = mActiveHttpContexts.find(streamId);
	if (contextIterator != mActiveHttpContexts.end()) {
		contextIterator->second->getResponse()->getHeaders().add(name, value, flags);
	} else {
		LOGE << "[" << streamId << "] receiving header for an unknown stream, ignoring";
	}
}

void Http2Client::onDataReceived([[maybe_unused]] nghttp2_session& session,
                                 [[maybe_unused]] uint8_t flags,
                                 int32_t streamId,
                                 const uint8_t* data,
                                 size_t datalen) noexcept {
	auto contextIterator = mActiveHttpContexts.find(streamId);
	if (contextIterator != mActiveHttpContexts.end()) {
		contextIterator->second->getResponse()->appendBody(reinterpret_cast<const char*>(data), datalen);
	} else {
		LOGE << "[" << streamId << "] data received for an unknown stream, ignoring";
	}
}

int Http2Client::onPollInCb(su_root_magic_t*, su_wait_t* w, su_wakeup_arg_t* arg) noexcept {
	auto thiz = static_cast<Http2Client*>(arg);
	// Callbacks invoked from here may release the last external reference on this client.
	[[maybe_unused]] auto self = thiz->shared_from_this();

	if (w->revents & SU_WAIT_ERR) {
		LOGE_CTX(thiz->mLogPrefix, "onPollInCb") << "Socket error";
		thiz->disconnect("socket error");
		return 0;
	}

	auto status = nghttp2_session_recv(thiz->mHttpSession.get());
	if (status < 0) {
		const auto reason = status == NGHTTP2_ERR_EOF ? string{"connection closed by peer"}
		                                              : string{"error while receiving HTTP/2 data: "} +
		                                                    nghttp2_strerror(status);
		LOGD_CTX(thiz->mLogPrefix, "onPollInCb") << reason << ", disconnecting";
		thiz->disconnect(reason);
		return 0;
	}
	if (thiz->mLastSID >= 0) {
		LOGD_CTX(thiz->mLogPrefix, "onPollInCb")
		    << "Closing connection after receiving GOAWAY frame, last processed stream is [" << thiz->mLastSID << "]";
		thiz->disconnect("connection closed by server (GOAWAY)");
		return 0;
	}
	if (thiz->mHttpSession && nghttp2_session_want_write(thiz->mHttpSession.get())) {
		// Flush the frames nghttp2 produced while receiving (SETTINGS acknowledgement, WINDOW_UPDATE...).
		thiz->resumeSending(thiz->mLogPrefix);
	}
	if (w->revents & SU_WAIT_HUP) {
		LOGD_CTX(thiz->mLogPrefix, "onPollInCb") << "Peer has hung up";
		thiz->disconnect("connection closed by peer");
	}
	return 0;
}

void Http2Client::onStreamClosed([[maybe_unused]] nghttp2_session& session,
                                 int32_t streamId,
                                 uint32_t errorCode) noexcept {
	const auto logPrefix = mLogPrefix + "[" + to_string(streamId) + "]";

	auto contextMapIterator = mActiveHttpContexts.find(streamId);
	if (contextMapIterator == mActiveHttpContexts.cend()) return;
	auto context = contextMapIterator->second;
	mActiveHttpContexts.erase(contextMapIterator);

	if (errorCode == NGHTTP2_NO_ERROR) {
		LOGD_CTX(logPrefix) << "Stream closed without error, response received for request[" << context->getRequest()
		                    << "]:\n"
		                    << context->getResponse()->toString();
		context->getOnResponseCb()(context->getRequest(), context->getResponse());

		auto queueSize = getOutboundQueueSize();
		if (0 < queueSize) {
			// When nghttp2 reaches a maximum number of concurrent streams, it starts queueing up messages.
			// A stream has just closed, we should start sending those queued up messages
			mRoot.addToMainLoop([weakThis = weak_from_this(), previousSize = queueSize, logPrefix]() {
				auto sharedThis = weakThis.lock();
				// Something triggered a resend in the meantime, nothing to do.
				if (!sharedThis || sharedThis->getOutboundQueueSize() < previousSize) return;
				sharedThis->resumeSending(logPrefix);
			});
		}
	} else {
		const auto reason = "stream closed with error code [" + to_string(errorCode) +
		                    "]: " + nghttp2_http2_strerror(errorCode);
		LOGD_CTX(logPrefix) << reason;
		context->getOnErrorCb()(context->getRequest(), reason);
	}
}

void Http2Client::resumeSending(const string& logPrefix) {
	const auto status = sendAll();
	if (status < 0) {
		LOGE_CTX(logPrefix) << "Failure while trying to catch up queued frames, reason=[" << nghttp2_strerror(status)
		                    << "]";
	}
}

void Http2Client::disconnect(const string& reason) {
	if (mState == State::Disconnected) {
		return;
	}
	LOGD << "Disconnecting: " << reason;
	if (mState == State::Connected) {
		su_root_unregister(mRoot.getCPtr(), &mPollInWait, onPollInCb, this);
	}
	mHttpSession.reset();
	mConn->disconnect();
	mLastSID = -1;
	setState(State::Disconnected);
	discardAllPendingRequests(reason);
	discardAllActiveRequests(reason);
}

void Http2Client::onConnectionIdle() noexcept {
	LOGD << "Connection is idle";
	disconnect("connection idle");
}

void Http2Client::setState(State state) noexcept {
	if (mState == state) return;
	LOGD << "Switching state from [" << mState << "] to [" << state << "]";
	mState = state;
}

void Http2Client::resetTimeoutTimer(int32_t streamId) {
	auto contextMapIterator = mActiveHttpContexts.find(streamId);
	if (contextMapIterator != mActiveHttpContexts.cend()) {
		contextMapIterator->second->getTimeoutTimer().set([this, streamId]() { onRequestTimeout(streamId); });
	}
}

void Http2Client::onRequestTimeout(int32_t streamId) {
	auto contextMapIterator = mActiveHttpContexts.find(streamId);
	if (contextMapIterator == mActiveHttpContexts.cend()) return;

	auto context = contextMapIterator->second;
	mActiveHttpContexts.erase(contextMapIterator);
	LOGD << "Closing stream[" << streamId << "] after request timeout";
	// Cancel any unsent frames
	nghttp2_submit_rst_stream(mHttpSession.get(), NGHTTP2_FLAG_NONE, streamId, NGHTTP2_CANCEL);
	resumeSending(mLogPrefix);
	context->getOnErrorCb()(context->getRequest(),
	                        "request timeout after " + to_string(mRequestTimeout.count()) + "s");
}

const char* Http2Tools::frameTypeToString(uint8_t frameType) noexcept {
	switch (frameType) {
		case NGHTTP2_DATA:
			return "DATA";
		case NGHTTP2_HEADERS:
			return "HEADERS";
		case NGHTTP2_PRIORITY:
			return "PRIORITY";
		case NGHTTP2_RST_STREAM:
			return "RST_STREAM";
		case NGHTTP2_SETTINGS:
			return "SETTINGS";
		case NGHTTP2_PUSH_PROMISE:
			return "PUSH_PROMISE";
		case NGHTTP2_PING:
			return "PING";
		case NGHTTP2_GOAWAY:
			return "GOAWAY";
		case NGHTTP2_WINDOW_UPDATE:
			return "WINDOW_UPDATE";
		case NGHTTP2_CONTINUATION:
			return "CONTINUATION";
#if NGHTTP2_VERSION_NUM >= 0x010a00 // v1.10.0
		case NGHTTP2_ALTSVC:
			return "ALTSVC";
#endif
#if NGHTTP2_VERSION_NUM >= 0x012100 // v1.33.0
		case NGHTTP2_ORIGIN:
			return "ORIGIN";
#endif
	}
	return "UNKNOWN";
}

ostream& operator<<(ostream& os, Http2Client::State state) noexcept {
	switch (state) {
		case Http2Client::State::Disconnected:
			return os << "Disconnected";
		case Http2Client::State::Connected:
			return os << "Connected";
		case Http2Client::State::Connecting:
			return os << "Connecting";
	}
	return os << "Unknown";
}

} // namespace tokenbridge
