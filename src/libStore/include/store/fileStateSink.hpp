#pragma once

#include "core/IGameStateListener.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>

namespace ttt::store {

//! Mirrors the game state into a file. Every notification rewrites the file with the latest record.
//! \note Write failures are logged and otherwise ignored; the game never waits on the sink.
class FileStateSink : public IGameStateListener {
public:
	explicit FileStateSink(std::filesystem::path path);

	void onGameState(const GameSnapshot& snapshot) override;

	const std::filesystem::path& path() const;
	std::size_t writeCount() const; //!< Number of successfully written snapshots.

private:
	bool write(const std::string& record);

private:
	std::filesystem::path m_path;
	mutable std::mutex m_mutex;
	std::size_t m_writes{0u};
};

} // namespace ttt::store
