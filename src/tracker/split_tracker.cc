#include "split_tracker.h"

#include <glog/logging.h>
#include "absl/time/time.h"

namespace Splitwatch {

namespace {

// file_time_type has no portable conversion in C++17; shift by the offset
// between the two clocks' current readings.
std::chrono::system_clock::time_point ToSystemTime(fs::file_time_type mtime) {
	return std::chrono::system_clock::now() + std::chrono::duration_cast<std::chrono::system_clock::duration>(
			mtime - fs::file_time_type::clock::now());
}

} // end of namespace

SplitTracker::SplitTracker(TrackerOptions options, PatternTable patterns,
		SplitStateMachine& state_machine, IRunStatePublisher* publisher)
	: options_(std::move(options)),
	  patterns_(std::move(patterns)),
	  state_machine_(state_machine),
	  publisher_(publisher) {
	if (!options_.log_file.empty()) {
		line_reader_ = std::make_unique<LineStreamReader>(options_.log_file);
	}
	if (!options_.snapshot_root.empty()) {
		snapshot_reader_ = std::make_unique<SnapshotReader>(options_.snapshot_root,
				options_.snapshot_file_names, options_.snapshot_max_depth);
	}
	if (publisher_ != nullptr) {
		state_machine_.SetTransitionCallback([this](const RunSnapshot& snapshot) {
			publisher_->Publish(snapshot);
		});
	}
}

SplitTracker::~SplitTracker() {
	Stop();
}

void SplitTracker::Start() {
	if (started_.exchange(true)) {
		LOG(WARNING) << "SplitTracker already started";
		return;
	}
	running_ = true;
	if (line_reader_) {
		LOG(INFO) << "Tailing " << options_.log_file << " every "
			<< options_.stream_poll_interval.count() << "ms from offset " << line_reader_->offset();
		stream_thread_ = std::thread([this]() {
				this->StreamPollThread();
				});
	}
	if (snapshot_reader_) {
		LOG(INFO) << "Watching snapshots under " << options_.snapshot_root << " every "
			<< options_.snapshot_poll_interval.count() << "ms";
		snapshot_thread_ = std::thread([this]() {
				this->SnapshotPollThread();
				});
	}
}

void SplitTracker::Stop() {
	if (!started_.load() || stopped_.exchange(true)) {
		return;
	}
	if (!stop_requested_.HasBeenNotified()) {
		stop_requested_.Notify();
	}
	if (stream_thread_.joinable()) {
		stream_thread_.join();
	}
	if (snapshot_thread_.joinable()) {
		snapshot_thread_.join();
	}
	running_ = false;
	if (publisher_ != nullptr) {
		publisher_->Clear();
	}
	LOG(INFO) << "SplitTracker stopped";
}

size_t SplitTracker::PollStreamOnce() {
	if (!line_reader_) {
		return 0;
	}
	size_t accepted = 0;
	for (const auto& line : line_reader_->Poll()) {
		VLOG(4) << "log: " << line;
		auto event = patterns_.Match(line, std::chrono::steady_clock::now());
		if (event && state_machine_.Apply(*event)) {
			++accepted;
		}
	}
	return accepted;
}

size_t SplitTracker::PollSnapshotOnce() {
	if (!snapshot_reader_) {
		return 0;
	}
	auto snapshot = snapshot_reader_->Poll();
	if (!snapshot) {
		return 0;
	}
	const RunSnapshot run = state_machine_.Snapshot();
	if (run.started_by_reset && ToSystemTime(snapshot->mtime) < run.run_epoch_start) {
		VLOG(1) << "Skipping " << snapshot->source.string() << ", last written before the current run";
		return 0;
	}
	return state_machine_.ApplyAll(
			SnapshotReader::ToEvents(snapshot->splits, std::chrono::steady_clock::now()));
}

void SplitTracker::StreamPollThread() {
	const absl::Duration interval = absl::FromChrono(options_.stream_poll_interval);
	do {
		PollStreamOnce();
	} while (!stop_requested_.WaitForNotificationWithTimeout(interval));
	VLOG(1) << "Stream poll loop exiting";
}

void SplitTracker::SnapshotPollThread() {
	const absl::Duration interval = absl::FromChrono(options_.snapshot_poll_interval);
	do {
		PollSnapshotOnce();
	} while (!stop_requested_.WaitForNotificationWithTimeout(interval));
	VLOG(1) << "Snapshot poll loop exiting";
}

} // namespace Splitwatch
