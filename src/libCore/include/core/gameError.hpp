#pragma once

#include <string>
#include <system_error>

namespace ttt {

//! Errors returned synchronously by the game operations.
enum class GameErrc {
	PlayerNotFound = 1,     //!< Update or remove of an unknown player id.
	InvalidMove,            //!< Wrong turn, occupied field or no round in progress.
	AlreadyRegistered,      //!< Player id already seated or queued.
	InvalidStateTransition, //!< Round advancement invoked in an unexpected status.
};

const std::error_category& gameCategory();

std::error_code make_error_code(GameErrc errc);

} // namespace ttt

template <>
struct std::is_error_code_enum<ttt::GameErrc> : std::true_type {};
