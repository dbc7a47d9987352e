#include "consoleApp.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
	const std::vector<std::string> args(argv + 1, argv + argc);

	const auto config = ttt::app::parseArguments(args, std::cerr);
	if (!config) {
		std::cerr << "Usage: tictactable [options]\n" << ttt::app::optionsDescription();
		return 1;
	}

	ttt::app::ConsoleApp app(*config);
	app.run(std::cin, std::cout);
	return 0;
}
