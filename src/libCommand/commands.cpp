#include "command/commands.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <limits>
#include <string_view>
#include <vector>

namespace ttt::command {

static constexpr std::string_view CMD_JOIN    = "JOIN";
static constexpr std::string_view CMD_NAME    = "NAME";
static constexpr std::string_view CMD_LEAVE   = "LEAVE";
static constexpr std::string_view CMD_MOVE    = "MOVE";
static constexpr std::string_view CMD_RESET   = "RESET";
static constexpr std::string_view CMD_RESTART = "RESTART";
static constexpr std::string_view CMD_STATE   = "STATE";
static constexpr std::string_view CMD_QUIT    = "QUIT";
static constexpr std::string_view CMD_EXIT    = "EXIT";

static std::string trim(const std::string& value) {
	const auto first = value.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) {
		return {};
	}
	const auto last = value.find_last_not_of(" \t\r\n");
	return value.substr(first, last - first + 1);
}

static std::vector<std::string> split(const std::string& payload, const std::size_t maxParts) {
	std::vector<std::string> parts;
	std::size_t start = 0u;
	while (parts.size() + 1 < maxParts) {
		const auto comma = payload.find(',', start);
		if (comma == std::string::npos) {
			break;
		}
		parts.push_back(trim(payload.substr(start, comma - start)));
		start = comma + 1;
	}
	parts.push_back(trim(payload.substr(start)));
	return parts;
}

static std::optional<unsigned> parseIndex(const std::string& value) {
	if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
		return {};
	}
	try {
		const auto index = std::stoull(value);
		if (index <= std::numeric_limits<unsigned>::max()) {
			return static_cast<unsigned>(index);
		}
	} catch (const std::exception&) {}
	return {};
}

static std::optional<std::string> nonEmpty(const std::string& value) {
	if (value.empty()) {
		return {};
	}
	return value;
}

std::optional<Command> fromLine(const std::string& line) {
	const auto input = trim(line);
	const auto colon = input.find(':');

	auto keyword = input.substr(0, colon);
	std::transform(keyword.begin(), keyword.end(), keyword.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	const bool hasPayload = colon != std::string::npos;
	const auto payload    = hasPayload ? input.substr(colon + 1) : std::string{};

	if (keyword == CMD_JOIN) {
		// Expect "JOIN", "JOIN:id" or "JOIN:id,name"
		if (!hasPayload) {
			return JoinCommand{};
		}
		const auto parts = split(payload, 2u);
		return JoinCommand{
		        .id   = nonEmpty(parts[0]),
		        .name = parts.size() > 1 ? nonEmpty(parts[1]) : std::nullopt,
		};
	}

	if (keyword == CMD_NAME) {
		// Expect "NAME:id" or "NAME:id,name"
		const auto parts = split(payload, 2u);
		if (!hasPayload || parts[0].empty()) {
			return {};
		}
		return RenameCommand{
		        .id   = parts[0],
		        .name = parts.size() > 1 ? nonEmpty(parts[1]) : std::nullopt,
		};
	}

	if (keyword == CMD_LEAVE) {
		const auto id = trim(payload);
		if (id.empty()) {
			return {};
		}
		return LeaveCommand{.id = id};
	}

	if (keyword == CMD_MOVE) {
		// Expect "MOVE:id,x,y"
		const auto parts = split(payload, 3u);
		if (parts.size() != 3u || parts[0].empty()) {
			return {};
		}
		const auto x = parseIndex(parts[1]);
		const auto y = parseIndex(parts[2]);
		if (!x || !y) {
			return {};
		}
		return MoveCommand{.id = parts[0], .c = {*x, *y}};
	}

	if (hasPayload) {
		return {};
	}
	if (keyword == CMD_RESET) {
		return ResetCommand{};
	}
	if (keyword == CMD_RESTART) {
		return RestartCommand{};
	}
	if (keyword == CMD_STATE) {
		return StateCommand{};
	}
	if (keyword == CMD_QUIT || keyword == CMD_EXIT) {
		return QuitCommand{};
	}

	// Invalid
	return {};
}

std::string usage() {
	return "Commands:\n"
	       "  JOIN[:id[,name]]   join the table (id generated if omitted)\n"
	       "  NAME:id[,name]     set or clear the display name\n"
	       "  LEAVE:id           leave seat or queue\n"
	       "  MOVE:id,x,y        place a piece at column x, row y\n"
	       "  RESET              clear board, seats and queue\n"
	       "  RESTART            reset and advance\n"
	       "  STATE              print the table\n"
	       "  QUIT               exit\n";
}

} // namespace ttt::command
