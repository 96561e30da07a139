// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "HttpClient.hxx"
#include "Easy.hxx"
#include "Slist.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

static constexpr Domain curl_domain("curl");

namespace {

class CurlHttpSession final : public HttpSession {
	CurlEasy easy;

	const std::string &user_agent;

	const std::chrono::steady_clock::duration connect_timeout;
	const std::chrono::steady_clock::duration request_timeout;

public:
	CurlHttpSession(const std::string &_user_agent,
			std::chrono::steady_clock::duration _connect_timeout,
			std::chrono::steady_clock::duration _request_timeout) noexcept
		:user_agent(_user_agent),
		 connect_timeout(_connect_timeout),
		 request_timeout(_request_timeout) {}

	/* virtual methods from class HttpSession */
	HttpResponse Get(const std::string &url) override;
	HttpResponse Post(const std::string &url, const HttpHeaders &headers,
			  std::string_view body) override;

private:
	void Setup(const std::string &url, HttpResponse &response);

	void Perform(const std::string &url, HttpResponse &response);

	static std::size_t WriteFunction(char *ptr, std::size_t size,
					 std::size_t nmemb,
					 void *userdata) noexcept;
};

} // anonymous namespace

std::size_t
CurlHttpSession::WriteFunction(char *ptr, std::size_t size, std::size_t nmemb,
			       void *userdata) noexcept
{
	auto &response = *(HttpResponse *)userdata;
	const std::size_t length = size * nmemb;

	try {
		response.body.append(ptr, length);
	} catch (const std::bad_alloc &) {
		/* returning a different value aborts the transfer */
		return 0;
	}

	return length;
}

void
CurlHttpSession::Setup(const std::string &url, HttpResponse &response)
{
	easy.Reset();
	easy.SetNoSignal();
	easy.SetURL(url.c_str());
	easy.SetUserAgent(user_agent.c_str());
	easy.SetConnectTimeout(connect_timeout);
	easy.SetTimeout(request_timeout);
	easy.SetOption(CURLOPT_FOLLOWLOCATION, 1L);
	easy.SetOption(CURLOPT_MAXREDIRS, 5L);
	easy.SetWriteFunction(WriteFunction, &response);
}

void
CurlHttpSession::Perform(const std::string &url, HttpResponse &response)
{
	try {
		easy.Perform();
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("HTTP request to {} failed",
						       url));
	}

	response.status = easy.GetResponseCode();
	FmtDebug(curl_domain, "{}: status {}, {} bytes",
		 url, response.status, response.body.size());
}

HttpResponse
CurlHttpSession::Get(const std::string &url)
{
	HttpResponse response;
	Setup(url, response);
	easy.SetHttpGet();
	Perform(url, response);
	return response;
}

HttpResponse
CurlHttpSession::Post(const std::string &url, const HttpHeaders &headers,
		      std::string_view body)
{
	HttpResponse response;
	Setup(url, response);

	CurlSlist header_list;
	for (const auto &[name, value] : headers)
		header_list.Append(fmt::format("{}: {}", name, value).c_str());

	/* suppress "Expect: 100-continue"; many renderers don't
	   implement it */
	header_list.Append("Expect:");

	easy.SetRequestHeaders(header_list.Get());
	easy.SetRequestBody(body);
	Perform(url, response);
	return response;
}

CurlHttpClient::CurlHttpClient(std::string _user_agent,
			       std::chrono::steady_clock::duration _connect_timeout,
			       std::chrono::steady_clock::duration _request_timeout)
	:user_agent(std::move(_user_agent)),
	 connect_timeout(_connect_timeout),
	 request_timeout(_request_timeout)
{
}

std::unique_ptr<HttpSession>
CurlHttpClient::OpenSession()
{
	return std::make_unique<CurlHttpSession>(user_agent, connect_timeout,
						 request_timeout);
}
