// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include "Error.hxx"

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <new>
#include <string_view>
#include <utility>

/**
 * An OO wrapper for a "CURL*" (a libcurl "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.
	 *
	 * Throws std::bad_alloc on error.
	 */
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::bad_alloc{};
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	/**
	 * Reset all options.  Live connections are kept.
	 */
	void Reset() noexcept {
		curl_easy_reset(handle);
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw CurlError(code);
	}

	template<typename T>
	bool TrySetOption(CURLoption option, T value) noexcept {
		return curl_easy_setopt(handle, option, value) == CURLE_OK;
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetUserAgent(const char *value) {
		SetOption(CURLOPT_USERAGENT, value);
	}

	void SetRequestHeaders(struct curl_slist *headers) {
		SetOption(CURLOPT_HTTPHEADER, headers);
	}

	void SetConnectTimeout(std::chrono::steady_clock::duration timeout) {
		SetOption(CURLOPT_CONNECTTIMEOUT_MS,
			  (long)std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
	}

	void SetTimeout(std::chrono::steady_clock::duration timeout) {
		SetOption(CURLOPT_TIMEOUT_MS,
			  (long)std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
	}

	void SetNoSignal() {
		SetOption(CURLOPT_NOSIGNAL, 1L);
	}

	void SetFailOnError(bool value=true) {
		SetOption(CURLOPT_FAILONERROR, (long)value);
	}

	void SetHttpGet() {
		SetOption(CURLOPT_HTTPGET, 1L);
	}

	/**
	 * Send a POST request with the given body.  The body is copied.
	 */
	void SetRequestBody(std::string_view body) {
		SetOption(CURLOPT_POSTFIELDSIZE, (long)body.size());
		SetOption(CURLOPT_COPYPOSTFIELDS, body.data());
	}

	template<typename F>
	void SetWriteFunction(F &&f, void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, std::forward<F>(f));
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	/**
	 * Throws #CurlError on error.
	 */
	void Perform() {
		CURLcode code = curl_easy_perform(handle);
		if (code != CURLE_OK)
			throw CurlError(code);
	}

	long GetResponseCode() const noexcept {
		long code = 0;
		curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
		return code;
	}
};
