#pragma once

#include "command/commands.hpp"
#include "core/game.hpp"
#include "core/gameConfig.hpp"
#include "store/fileStateSink.hpp"

#include <boost/program_options.hpp>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ttt::app {

//! Settings of the console process.
struct AppConfig {
	GameConfig game;
	std::optional<std::filesystem::path> stateFile; //!< Attach the file sink if set.
};

//! Command line flags of the console.
boost::program_options::options_description optionsDescription();

//! Parse command line flags. Returns empty and prints the reason on invalid input.
std::optional<AppConfig> parseArguments(const std::vector<std::string>& args, std::ostream& err);

//! Drives the engine from text commands.
class ConsoleApp {
public:
	explicit ConsoleApp(const AppConfig& config);

	//! Read commands until the input closes or quit is requested.
	void run(std::istream& in, std::ostream& out);

	//! Handle one line. Returns false once quit is requested.
	bool handleLine(const std::string& line, std::ostream& out);

private:
	void handle(const command::JoinCommand& cmd, std::ostream& out);
	void handle(const command::RenameCommand& cmd, std::ostream& out);
	void handle(const command::LeaveCommand& cmd, std::ostream& out);
	void handle(const command::MoveCommand& cmd, std::ostream& out);
	void handle(const command::ResetCommand& cmd, std::ostream& out);
	void handle(const command::RestartCommand& cmd, std::ostream& out);
	void handle(const command::StateCommand& cmd, std::ostream& out);
	void handle(const command::QuitCommand& cmd, std::ostream& out);

	void report(const std::error_code& ec, std::ostream& out) const;

private:
	std::unique_ptr<store::FileStateSink> m_sink; //!< Declared before the game: pending snapshots are flushed to it on shutdown.
	Game m_game;
	bool m_quit{false};
};

} // namespace ttt::app
