#include "consoleApp.hpp"

#include "store/stateCodec.hpp"

#include <array>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace ttt::app {

// Id for a player that joins without choosing one: 128 random bits in hex.
static std::string GenerateGuestId() {
	std::array<std::uint8_t, 16> bytes{};
	std::random_device rd;
	for (auto& b: bytes) {
		b = static_cast<std::uint8_t>(rd());
	}

	std::ostringstream oss;
	for (const auto byte: bytes) {
		oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
	}
	return oss.str();
}

boost::program_options::options_description optionsDescription() {
	namespace po = boost::program_options;

	po::options_description desc("TicTacTable options");
	desc.add_options()
	("timeout-ms", po::value<std::uint64_t>(), "time a seated player has for a move before an automatic move is placed")
	("advance-delay-ms", po::value<std::uint64_t>(), "delay between a finished round and the next one")
	("seed", po::value<std::uint64_t>(), "seed of the draw coin flip (random if omitted)")
	("state-file", po::value<std::string>(), "mirror the game state into this file");
	return desc;
}

std::optional<AppConfig> parseArguments(const std::vector<std::string>& args, std::ostream& err) {
	namespace po = boost::program_options;

	po::variables_map vm;
	try {
		po::store(po::command_line_parser(args).options(optionsDescription()).run(), vm);
		po::notify(vm);
	} catch (const po::error& e) {
		err << e.what() << '\n';
		return {};
	}

	AppConfig config;
	if (vm.count("timeout-ms")) {
		const auto timeout = vm["timeout-ms"].as<std::uint64_t>();
		if (timeout == 0u) {
			err << "Move timeout must be positive.\n";
			return {};
		}
		config.game.moveTimeout = GameConfig::Duration(timeout);
	}
	if (vm.count("advance-delay-ms")) {
		config.game.advanceDelay = GameConfig::Duration(vm["advance-delay-ms"].as<std::uint64_t>());
	}
	if (vm.count("seed")) {
		config.game.seed = vm["seed"].as<std::uint64_t>();
	}
	if (vm.count("state-file")) {
		config.stateFile = vm["state-file"].as<std::string>();
	}
	return config;
}

ConsoleApp::ConsoleApp(const AppConfig& config) : m_game{config.game} {
	if (config.stateFile) {
		m_sink = std::make_unique<store::FileStateSink>(*config.stateFile);
		m_game.subscribeState(m_sink.get());
	}
}

void ConsoleApp::run(std::istream& in, std::ostream& out) {
	out << command::usage();

	std::string line;
	while (!m_quit && std::getline(in, line)) {
		handleLine(line, out);
	}
}

bool ConsoleApp::handleLine(const std::string& line, std::ostream& out) {
	if (line.find_first_not_of(" \t\r") == std::string::npos) {
		return !m_quit;
	}

	const auto cmd = command::fromLine(line);
	if (!cmd) {
		out << "ERROR unknown command '" << line << "'\n";
		return !m_quit;
	}

	std::visit([&](const auto& c) { handle(c, out); }, *cmd);
	return !m_quit;
}

void ConsoleApp::handle(const command::JoinCommand& cmd, std::ostream& out) {
	const Player player{.id = cmd.id ? *cmd.id : GenerateGuestId(), .name = cmd.name};
	if (const auto ec = m_game.addPlayer(player)) {
		report(ec, out);
		return;
	}
	out << "OK id=" << player.id << '\n';
}

void ConsoleApp::handle(const command::RenameCommand& cmd, std::ostream& out) {
	report(m_game.updatePlayer(Player{.id = cmd.id, .name = cmd.name}), out);
}

void ConsoleApp::handle(const command::LeaveCommand& cmd, std::ostream& out) {
	report(m_game.removePlayer(cmd.id), out);
}

void ConsoleApp::handle(const command::MoveCommand& cmd, std::ostream& out) {
	report(m_game.placeMove(Move{cmd.id, cmd.c}), out);
}

void ConsoleApp::handle(const command::ResetCommand&, std::ostream& out) {
	m_game.reset();
	report({}, out);
}

void ConsoleApp::handle(const command::RestartCommand&, std::ostream& out) {
	m_game.reset();
	report(m_game.advance(), out);
}

void ConsoleApp::handle(const command::StateCommand&, std::ostream& out) {
	out << store::renderState(m_game.snapshot());
}

void ConsoleApp::handle(const command::QuitCommand&, std::ostream&) {
	m_quit = true;
}

void ConsoleApp::report(const std::error_code& ec, std::ostream& out) const {
	if (ec) {
		out << "ERROR " << ec.message() << '\n';
	} else {
		out << "OK\n";
	}
}

} // namespace ttt::app
