// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#include "Instance.hxx"
#include "Version.hxx"
#include "config/CastConfig.hxx"
#include "config/Data.hxx"
#include "config/File.hxx"
#include "config/Parser.hxx"
#include "control/TransportState.hxx"
#include "discovery/MulticastLock.hxx"
#include "error/CastError.hxx"
#include "lib/curl/HttpClient.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/upnp/SsdpClient.hxx"
#include "util/OptionDef.hxx"
#include "util/OptionParser.hxx"
#include "util/PrintException.hxx"

#include <fmt/format.h>

#include <future>
#include <span>
#include <stdexcept>
#include <string_view>

#include <stdlib.h>

using std::string_view_literals::operator""sv;

enum Option {
	OPTION_CONFIG,
	OPTION_TIMEOUT,
	OPTION_VERBOSE,
	OPTION_VERSION,
	OPTION_HELP,
};

static constexpr OptionDef option_defs[] = {
	{"config", 'c', true, "read settings from this file"},
	{"timeout", 't', true, "search duration in seconds (default 5)"},
	{"verbose", 'v', "verbose logging"},
	{"version", 'V', "print version number"},
	{"help", 'h', "show help options"},
};

struct CommandLine {
	const char *config_path = nullptr;

	std::chrono::steady_clock::duration search_timeout = std::chrono::seconds{5};

	bool verbose = false;

	std::span<const char *const> args;
};

static void
PrintOption(const OptionDef &opt)
{
	if (opt.HasValue())
		fmt::print("  -{}, --{:<12} {}\n",
			   opt.GetShortOption(),
			   fmt::format("{} ARG", opt.GetLongOption()),
			   opt.GetDescription());
	else
		fmt::print("  -{}, --{:<12} {}\n",
			   opt.GetShortOption(),
			   opt.GetLongOption(),
			   opt.GetDescription());
}

[[noreturn]]
static void
Help()
{
	fmt::print("Usage:\n"
		   "  upnpcast [OPTION...] search\n"
		   "  upnpcast [OPTION...] cast UDN URL [TITLE [POSITION_MS]]\n"
		   "  upnpcast [OPTION...] control UDN ACTION [VALUE]\n"
		   "  upnpcast [OPTION...] state UDN\n"
		   "\n"
		   "UPnP/DLNA control point.\n"
		   "\n"
		   "Options:\n");

	for (const auto &i : option_defs)
		PrintOption(i);

	exit(EXIT_SUCCESS);
}

[[noreturn]]
static void
Version()
{
	fmt::print("upnpcast " UPNPCAST_VERSION "\n");
	exit(EXIT_SUCCESS);
}

static CommandLine
ParseCommandLine(OptionParser &parser)
{
	CommandLine cmdline;

	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_CONFIG:
			cmdline.config_path = o.value;
			break;

		case OPTION_TIMEOUT:
			cmdline.search_timeout = std::chrono::seconds(ParsePositive(o.value));
			break;

		case OPTION_VERBOSE:
			cmdline.verbose = true;
			break;

		case OPTION_VERSION:
			Version();

		case OPTION_HELP:
			Help();
		}
	}

	cmdline.args = parser.GetRemaining();
	if (cmdline.args.empty())
		throw std::runtime_error("No command specified; try --help");

	return cmdline;
}

static void
PrintDevices(const Instance &instance)
{
	for (const auto &i : instance.GetDevices())
		fmt::print("{}\t{}\t{}{}\n", i.udn, i.address, i.name,
			   i.is_tv ? " [TV]" : "");
}

/**
 * Run a search and wait for it to finish.
 */
static void
RunSearch(Instance &instance, std::chrono::steady_clock::duration timeout)
{
	if (!instance.Search(timeout))
		throw std::runtime_error("Failed to start the search");

	instance.GetRouter().WaitSearchFinished(timeout + std::chrono::seconds{1});
}

/**
 * Wait for the result of an asynchronous operation and print it.
 *
 * @return true on success
 */
static bool
PrintResult(std::future<ActionResult> &&future)
{
	const auto result = future.get();

	for (const auto &[key, value] : result)
		fmt::print("{}: {}\n", key, value);

	return !result.contains("Error");
}

static Instance::Callback
MakeCallback(std::promise<ActionResult> &promise)
{
	return [&promise](ActionResult &&result){
		promise.set_value(std::move(result));
	};
}

static bool
CommandCast(Instance &instance, std::span<const char *const> args,
	    std::chrono::steady_clock::duration search_timeout)
{
	if (args.size() < 2 || args.size() > 4)
		throw std::runtime_error("Usage: cast UDN URL [TITLE [POSITION_MS]]");

	const char *title = args.size() >= 3 ? args[2] : args[1];
	const std::chrono::milliseconds position{args.size() >= 4
		? ParseUnsigned(args[3])
		: 0};

	RunSearch(instance, search_timeout);

	std::promise<ActionResult> promise;
	auto future = promise.get_future();
	if (!instance.Cast(args[0], args[1], title, MakeCallback(promise),
			   position))
		throw std::runtime_error("Failed to submit the cast");

	return PrintResult(std::move(future));
}

static bool
CommandControl(Instance &instance, std::span<const char *const> args,
	       std::chrono::steady_clock::duration search_timeout)
{
	if (args.size() < 2 || args.size() > 3)
		throw std::runtime_error("Usage: control UDN ACTION [VALUE]");

	const auto action = ParseMediaAction(args[1]);
	if (!action)
		throw FmtRuntimeError("Unknown action: {}", args[1]);

	RunSearch(instance, search_timeout);
	instance.SetCurrentDevice(args[0]);

	std::promise<ActionResult> promise;
	auto future = promise.get_future();
	if (!instance.Control(*action, args.size() >= 3 ? args[2] : "",
			      MakeCallback(promise)))
		throw std::runtime_error("Failed to submit the action");

	return PrintResult(std::move(future));
}

static bool
CommandState(Instance &instance, std::span<const char *const> args,
	     std::chrono::steady_clock::duration search_timeout)
{
	if (args.size() != 1)
		throw std::runtime_error("Usage: state UDN");

	RunSearch(instance, search_timeout);
	instance.SetCurrentDevice(args[0]);

	/* refresh the transport state and the volume */
	for (const auto action : {MediaAction::GET_TRANSPORT_INFO,
				  MediaAction::GET_VOLUME,
				  MediaAction::GET_MUTE}) {
		std::promise<ActionResult> promise;
		auto future = promise.get_future();
		if (instance.Control(action, {}, MakeCallback(promise)))
			future.wait();
	}

	const auto state = instance.GetState();
	fmt::print("connected: {}\n", state.connected);
	if (state.device)
		fmt::print("device: {} ({})\n", state.device->name,
			   state.device->address);
	fmt::print("state: {}\n", ToString(state.state));
	if (state.volume)
		fmt::print("volume: {}\n", *state.volume);
	if (state.muted)
		fmt::print("muted: {}\n", *state.muted);

	return state.connected;
}

int
main(int argc, char **argv)
try {
	OptionParser parser(option_defs, argc, argv);
	const auto cmdline = ParseCommandLine(parser);

	ConfigData config_data;
	if (cmdline.config_path != nullptr)
		ReadConfigFile(config_data, cmdline.config_path);

	ConfigureLogging(config_data, cmdline.verbose);

	const CastConfig config(config_data);

	UpnpSsdpClient ssdp(config.network_interface);
	CurlHttpClient http(config.user_agent, config.connect_timeout,
			    config.soap_timeout);
	NullMulticastLock multicast_lock;

	Instance instance(config, ssdp, http, multicast_lock);

	const std::string_view command{cmdline.args.front()};
	const auto args = cmdline.args.subspan(1);

	bool success;
	if (command == "search"sv) {
		RunSearch(instance, cmdline.search_timeout);
		PrintDevices(instance);
		success = true;
	} else if (command == "cast"sv)
		success = CommandCast(instance, args, cmdline.search_timeout);
	else if (command == "control"sv)
		success = CommandControl(instance, args, cmdline.search_timeout);
	else if (command == "state"sv)
		success = CommandState(instance, args, cmdline.search_timeout);
	else
		throw FmtRuntimeError("Unknown command: {}", command);

	instance.Release();
	return success ? EXIT_SUCCESS : EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
