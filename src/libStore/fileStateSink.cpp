#include "store/fileStateSink.hpp"
#include "store/stateCodec.hpp"

#include "Logging.hpp"

#include <fstream>
#include <utility>

namespace ttt::store {

FileStateSink::FileStateSink(std::filesystem::path path) : m_path{std::move(path)} {
}

void FileStateSink::onGameState(const GameSnapshot& snapshot) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (write(encodeState(snapshot))) {
		++m_writes;
	}
}

const std::filesystem::path& FileStateSink::path() const {
	return m_path;
}

std::size_t FileStateSink::writeCount() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_writes;
}

bool FileStateSink::write(const std::string& record) {
	auto tmpPath = m_path;
	tmpPath += ".tmp";

	{
		std::ofstream file(tmpPath, std::ios::out | std::ios::trunc);
		if (!file) {
			Logger().Log(Logging::LogLevel::Error, "[Store] Could not open '" + tmpPath.string() + "' for writing.");
			return false;
		}
		file << record << '\n';
		if (!file.flush()) {
			Logger().Log(Logging::LogLevel::Error, "[Store] Could not write state to '" + tmpPath.string() + "'.");
			return false;
		}
	}

	std::error_code ec{};
	std::filesystem::rename(tmpPath, m_path, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, "[Store] Could not replace '" + m_path.string() + "': " + ec.message());
		return false;
	}

	Logger().Log(Logging::LogLevel::Debug, "[Store] State written to '" + m_path.string() + "'.");
	return true;
}

} // namespace ttt::store
