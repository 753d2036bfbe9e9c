#ifndef SPLITWATCH_TRACKER_SPLIT_TRACKER_H_
#define SPLITWATCH_TRACKER_SPLIT_TRACKER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/notification.h"
#include "interfaces.h"
#include "line_stream_reader.h"
#include "pattern_table.h"
#include "snapshot_reader.h"
#include "split_state_machine.h"

namespace Splitwatch {

struct TrackerOptions {
	// Empty disables the corresponding poll loop.
	std::string log_file;
	std::string snapshot_root;
	std::vector<std::string> snapshot_file_names = SnapshotReader::DefaultFileNames();
	int snapshot_max_depth = 6;
	std::chrono::milliseconds stream_poll_interval{100};
	std::chrono::milliseconds snapshot_poll_interval{1000};
};

/**
 * Runs the two producers against one SplitStateMachine:
 * - the stream loop tails the log and feeds matched lines,
 * - the snapshot loop feeds the freshest split record.
 * Each loop sleeps for its own interval and wakes early on Stop(). Stop()
 * joins both loops and clears the publisher once. Start() may be called once.
 */
class SplitTracker {
	public:
		SplitTracker(TrackerOptions options, PatternTable patterns,
				SplitStateMachine& state_machine, IRunStatePublisher* publisher);
		~SplitTracker();

		SplitTracker(const SplitTracker&) = delete;
		SplitTracker& operator=(const SplitTracker&) = delete;

		void Start();
		void Stop();
		bool IsRunning() const { return running_.load(); }

		// One poll cycle of each loop; return the number of accepted events.
		// After a RESET, a snapshot last written before the reset belongs to
		// the abandoned world and is skipped.
		size_t PollStreamOnce();
		size_t PollSnapshotOnce();

	private:
		void StreamPollThread();
		void SnapshotPollThread();

		const TrackerOptions options_;
		const PatternTable patterns_;
		SplitStateMachine& state_machine_;
		IRunStatePublisher* publisher_;

		std::unique_ptr<LineStreamReader> line_reader_;
		std::unique_ptr<SnapshotReader> snapshot_reader_;

		absl::Notification stop_requested_;
		std::thread stream_thread_;
		std::thread snapshot_thread_;
		std::atomic<bool> running_{false};
		std::atomic<bool> started_{false};
		std::atomic<bool> stopped_{false};
};

} // namespace Splitwatch

#endif // SPLITWATCH_TRACKER_SPLIT_TRACKER_H_
