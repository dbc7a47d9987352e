#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace ttt::command {

// Operator commands (console -> engine)
struct JoinCommand {
	std::optional<PlayerId> id;      //!< Generated by the console if empty.
	std::optional<std::string> name;
};
struct RenameCommand {
	PlayerId id;
	std::optional<std::string> name; //!< Empty clears the name.
};
struct LeaveCommand {
	PlayerId id;
};
struct MoveCommand {
	PlayerId id;
	Coord c;
};
struct ResetCommand {};
struct RestartCommand {};
struct StateCommand {};
struct QuitCommand {};

using Command = std::variant<JoinCommand, RenameCommand, LeaveCommand, MoveCommand, ResetCommand, RestartCommand, StateCommand, QuitCommand>;

//! Parse one input line. Keywords are case insensitive, arguments follow a ':' separated by ','.
//! Examples: "JOIN", "JOIN:p1,Alice", "NAME:p1,Bob", "LEAVE:p1", "MOVE:p1,0,2", "RESET", "RESTART", "STATE", "QUIT".
//! Returns empty on invalid input.
std::optional<Command> fromLine(const std::string& line);

//! Usage text listing the accepted commands.
std::string usage();

} // namespace ttt::command
