#ifndef SPLITWATCH_TRACKER_SNAPSHOT_READER_H_
#define SPLITWATCH_TRACKER_SNAPSHOT_READER_H_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "detected_event.h"

namespace Splitwatch {

namespace fs = std::filesystem;

using SplitTimes = std::map<Milestone, int64_t>;

struct SnapshotData {
	SplitTimes splits;   // canonical milestone -> in-game time in ms
	fs::path source;
	fs::file_time_type mtime;
};

/**
 * Reads the split record files the timing mod keeps rewriting.
 *
 * Poll() looks for the most recently modified file under the search root
 * whose name is one of `file_names` and parses it. Older files from other
 * worlds are ignored even if they reached further. A snapshot is only
 * returned when its (path, mtime, size) differs from the last one parsed, so
 * an untouched record cannot re-advance a run after a reset. Unreadable or
 * half-written files, and files without a single recognised split, yield
 * std::nullopt.
 *
 * Not thread safe; owned by the snapshot poll loop.
 */
class SnapshotReader {
	public:
		SnapshotReader(std::string root, std::vector<std::string> file_names, int max_depth);

		std::optional<fs::path> FindNewestSnapshot() const;
		std::optional<SnapshotData> Poll();

		// Drop the remembered identity; the next Poll() re-parses.
		void Forget() { last_.reset(); }

		// Recognised splits in a JSON document. std::nullopt on malformed
		// input, an empty map when it parsed but nothing was recognised.
		static std::optional<SplitTimes> Parse(const std::string& content);

		// Many-to-one alias canonicalisation, case insensitive.
		static std::optional<Milestone> CanonicalMilestone(std::string_view raw_key);

		// ADVANCE for the furthest split followed by one ENRICH per split.
		static std::vector<DetectedEvent> ToEvents(const SplitTimes& splits,
				std::chrono::steady_clock::time_point now);

		static std::vector<std::string> DefaultFileNames() {
			return {"record.json", "latest_world", "latest_world.json"};
		}

	private:
		struct Identity {
			fs::path path;
			fs::file_time_type mtime;
			uintmax_t size = 0;

			bool operator==(const Identity& o) const {
				return path == o.path && mtime == o.mtime && size == o.size;
			}
		};

		std::string root_;
		std::vector<std::string> file_names_;
		int max_depth_;
		std::optional<Identity> last_;
		bool root_missing_logged_ = false;
};

} // namespace Splitwatch

#endif // SPLITWATCH_TRACKER_SNAPSHOT_READER_H_
