#include "store/stateCodec.hpp"

#include <cstdio>
#include <sstream>
#include <string_view>

namespace ttt::store {

static constexpr std::string_view STATE_PREFIX = "STATE:";
static constexpr std::string_view RESERVED     = "%,=;|:";

std::string escapeField(const std::string& value) {
	std::string out;
	out.reserve(value.size());
	for (const char ch: value) {
		const auto byte = static_cast<unsigned char>(ch);
		if (RESERVED.find(ch) != std::string_view::npos || byte < 0x20 || byte == 0x7f) {
			char buffer[4];
			std::snprintf(buffer, sizeof(buffer), "%%%02X", byte);
			out += buffer;
		} else {
			out.push_back(ch);
		}
	}
	return out;
}

static std::string encodePlayer(const std::optional<Player>& player) {
	if (!player) {
		return {};
	}
	auto out = escapeField(player->id);
	if (player->name) {
		out.push_back(':');
		out += escapeField(*player->name);
	}
	return out;
}

static std::string encodeBoard(const Board& board) {
	std::string out;
	for (Id y = 0u; y != Board::SIZE; ++y) {
		if (y)
			out.push_back(';');
		for (Id x = 0u; x != Board::SIZE; ++x) {
			if (x)
				out.push_back('|');
			out += std::to_string(weight(board.get({x, y})));
		}
	}
	return out;
}

std::string encodeState(const GameSnapshot& snapshot) {
	std::string payload{STATE_PREFIX};
	payload += "round=" + std::to_string(snapshot.round);
	payload += std::string(",status=") + toString(snapshot.status);
	payload += std::string(",turn=") + toString(snapshot.turn);
	payload += ",board=" + encodeBoard(snapshot.board);
	payload += ",seatA=" + encodePlayer(snapshot.seatA);
	payload += ",seatB=" + encodePlayer(snapshot.seatB);
	payload += ",queue=";
	for (std::size_t i = 0; i < snapshot.queue.size(); ++i) {
		if (i)
			payload.push_back(';');
		payload += encodePlayer(snapshot.queue[i]);
	}
	return payload;
}

static char toSymbol(const Board::Piece piece) {
	switch (piece) {
	case Board::Piece::A:
		return 'X';
	case Board::Piece::B:
		return 'O';
	case Board::Piece::Empty:
		break;
	}
	return '.';
}

static std::string describePlayer(const std::optional<Player>& player) {
	if (!player) {
		return "-";
	}
	return player->name ? player->id + " (" + *player->name + ")" : player->id;
}

std::string renderState(const GameSnapshot& snapshot) {
	std::ostringstream out;
	out << "Round " << snapshot.round << " | " << toString(snapshot.status);
	if (snapshot.status == GameStatus::InProgress) {
		out << " | seat " << toString(snapshot.turn) << " to move";
	}
	out << '\n';

	for (Id y = 0u; y != Board::SIZE; ++y) {
		out << "  ";
		for (Id x = 0u; x != Board::SIZE; ++x) {
			out << toSymbol(snapshot.board.get({x, y})) << (x + 1u == Board::SIZE ? '\n' : ' ');
		}
	}

	out << "Seat A (X): " << describePlayer(snapshot.seatA) << '\n';
	out << "Seat B (O): " << describePlayer(snapshot.seatB) << '\n';
	out << "Queue:";
	if (snapshot.queue.empty()) {
		out << " -";
	}
	for (const auto& player: snapshot.queue) {
		out << ' ' << describePlayer(player);
	}
	out << '\n';
	return out.str();
}

} // namespace ttt::store
