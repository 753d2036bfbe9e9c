#ifndef SPLITWATCH_TRACKER_LINE_STREAM_READER_H_
#define SPLITWATCH_TRACKER_LINE_STREAM_READER_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace Splitwatch {

/**
 * Incremental reader for an append-only text file (the game log).
 *
 * The read offset starts at the file's size when the reader is created, so
 * lines written before startup are never replayed. A file that does not exist
 * yet starts at offset 0. Each Poll() returns the complete lines appended
 * since the previous poll, in file order:
 * - size below the offset, or a different inode at the path, means the file
 *   was truncated or rotated and reading restarts at offset 0;
 * - the offset only moves past the last newline read, an unterminated
 *   trailing fragment is picked up again once its newline arrives;
 * - blank lines are skipped, '\r' is stripped and malformed UTF-8 is replaced.
 * Any I/O failure is reported as an empty poll.
 *
 * Not thread safe; each reader belongs to one poll loop.
 */
class LineStreamReader {
	public:
		explicit LineStreamReader(std::string path, bool from_start = false);

		std::vector<std::string> Poll();

		const std::string& path() const { return path_; }
		uint64_t offset() const { return offset_; }
		uint64_t rotations() const { return rotations_; }

		// Upper bound of bytes consumed by a single Poll().
		static constexpr uint64_t kMaxReadPerPoll = 4UL << 20;

	private:
		bool ReadRange(int fd, uint64_t from, uint64_t to, std::string& out);

		std::string path_;
		uint64_t offset_ = 0;
		uint64_t rotations_ = 0;
		dev_t dev_ = 0;
		ino_t ino_ = 0;
		bool have_identity_ = false;
		bool open_failure_logged_ = false;
};

// Copy of `in` with every invalid UTF-8 sequence replaced by U+FFFD.
std::string SanitizeUtf8(std::string_view in);

} // namespace Splitwatch

#endif // SPLITWATCH_TRACKER_LINE_STREAM_READER_H_
