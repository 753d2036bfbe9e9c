#include "presence_sink.h"

#include <filesystem>
#include <fstream>
#include <system_error>

#include <glog/logging.h>

namespace Splitwatch {

namespace fs = std::filesystem;

bool LogPresenceSink::Update(const PresenceInfo& info) {
	LOG(INFO) << "Presence: " << info.state << " | " << info.details
		<< " [" << info.large_text << " / " << info.small_text << "]";
	return true;
}

void LogPresenceSink::Clear() {
	LOG(INFO) << "Presence cleared";
}

StatusFileSink::StatusFileSink(std::string path) : path_(std::move(path)) {}

bool StatusFileSink::WriteAtomically(const std::string& content) {
	const std::string tmp_path = path_ + ".tmp";
	{
		std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
		if (!out) {
			LOG(WARNING) << "Cannot write status file " << tmp_path;
			return false;
		}
		out << content;
		out.flush();
		if (!out) {
			LOG(WARNING) << "Short write to status file " << tmp_path;
			return false;
		}
	}
	std::error_code ec;
	fs::rename(tmp_path, path_, ec);
	if (ec) {
		LOG(WARNING) << "Cannot replace status file " << path_ << ": " << ec.message();
		fs::remove(tmp_path, ec);
		return false;
	}
	return true;
}

bool StatusFileSink::Update(const PresenceInfo& info) {
	std::string content;
	content.append(info.state).append("\n");
	content.append(info.details).append("\n");
	content.append(info.large_text).append("\n");
	content.append(info.small_text).append("\n");
	return WriteAtomically(content);
}

void StatusFileSink::Clear() {
	if (!WriteAtomically("")) {
		LOG(WARNING) << "Status file " << path_ << " still shows the last presence";
	}
}

} // namespace Splitwatch
