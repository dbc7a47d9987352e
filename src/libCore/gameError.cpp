#include "core/gameError.hpp"

namespace ttt {

namespace {

class GameCategory final : public std::error_category {
public:
	const char* name() const noexcept override {
		return "ttt.game";
	}

	std::string message(int value) const override {
		switch (static_cast<GameErrc>(value)) {
		case GameErrc::PlayerNotFound:
			return "player not found";
		case GameErrc::InvalidMove:
			return "invalid move";
		case GameErrc::AlreadyRegistered:
			return "player already registered";
		case GameErrc::InvalidStateTransition:
			return "invalid state transition";
		}
		return "unknown game error";
	}
};

} // namespace

const std::error_category& gameCategory() {
	static const GameCategory category;
	return category;
}

std::error_code make_error_code(const GameErrc errc) {
	return {static_cast<int>(errc), gameCategory()};
}

} // namespace ttt
