// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "CastConfig.hxx"
#include "Data.hxx"
#include "LogBackend.hxx"
#include "Version.hxx"

using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""s;
using std::chrono_literals::operator""min;
using std::chrono_literals::operator""h;

CastConfig::CastConfig()
	:user_agent(UPNPCAST_USER_AGENT)
{
}

CastConfig::CastConfig(const ConfigData &config)
	:network_interface(config.GetString(ConfigOption::NETWORK_INTERFACE, "")),
	 user_agent(config.GetString(ConfigOption::USER_AGENT,
				     UPNPCAST_USER_AGENT)),
	 search_timeout(config.GetDuration(ConfigOption::SEARCH_TIMEOUT,
					   1s, 10min, 30s)),
	 /* SSDP allows MX values from 1 to 5 */
	 search_mx(std::chrono::duration_cast<std::chrono::seconds>(config.GetDuration(ConfigOption::SEARCH_MX,
										       1s, 5s, 3s))),
	 tombstone_grace(config.GetDuration(ConfigOption::TOMBSTONE_GRACE,
					    0s, 1h, 10s)),
	 connect_timeout(config.GetDuration(ConfigOption::CONNECT_TIMEOUT,
					    100ms, 5min, 10s)),
	 soap_timeout(config.GetDuration(ConfigOption::SOAP_TIMEOUT,
					 100ms, 5min, 30s)),
	 retry_delay(config.GetDuration(ConfigOption::RETRY_DELAY,
					0s, 1min, 2s)),
	 shutdown_timeout(config.GetDuration(ConfigOption::SHUTDOWN_TIMEOUT,
					     0s, 1min, 5s)),
	 max_devices(config.GetUnsigned(ConfigOption::MAX_DEVICES, 1, 10000, 100)),
	 description_retries(config.GetUnsigned(ConfigOption::DESCRIPTION_RETRIES,
						1, 10, 3)),
	 worker_threads(config.GetUnsigned(ConfigOption::WORKER_THREADS, 1, 64, 4))
{
}

void
ConfigureLogging(const ConfigData &config, bool verbose)
{
	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
	else
		SetLogThreshold(config.With(ConfigOption::LOG_LEVEL, [](const char *s){
			return s != nullptr
				? ParseLogLevel(s)
				: LogLevel::NOTICE;
		}));

	if (config.GetBool(ConfigOption::LOG_TIMESTAMP, false))
		EnableLogTimestamp();
}
