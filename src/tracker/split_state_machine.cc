#include "split_state_machine.h"

#include <glog/logging.h>

namespace Splitwatch {

SplitStateMachine::SplitStateMachine(DisplayBand band, std::chrono::milliseconds cooldown,
		WallClock wall_clock)
	: band_(band),
	  cooldown_(cooldown),
	  wall_clock_(wall_clock ? std::move(wall_clock) : WallClock([] { return std::chrono::system_clock::now(); })) {
	if (!band_.IsValid()) {
		LOG(WARNING) << "Display band [" << MilestoneName(band_.from) << ", "
			<< MilestoneName(band_.until) << ") is empty, display-only states will never show";
	}
	state_.run_epoch_start = wall_clock_();
}

bool SplitStateMachine::Apply(const DetectedEvent& event) {
	RunSnapshot snapshot;
	{
		absl::MutexLock lock(&mutex_);
		bool changed = false;
		switch (event.kind) {
			case EventKind::kReset:
				changed = ApplyReset();
				break;
			case EventKind::kAdvance:
				changed = ApplyAdvance(event);
				break;
			case EventKind::kEnrich:
				changed = ApplyEnrich(event);
				break;
			case EventKind::kDisplay:
				changed = ApplyDisplay(event);
				break;
		}
		if (!changed) {
			VLOG(3) << "Ignored " << EventKindName(event.kind) << "(" << MilestoneName(event.milestone)
				<< ") from " << EventSourceName(event.source);
			return false;
		}
		++sequence_;
		snapshot = SnapshotLocked();
	}

	VLOG(1) << "Accepted " << EventKindName(event.kind) << "(" << MilestoneName(event.milestone)
		<< ") from " << EventSourceName(event.source) << " -> current=" << MilestoneName(snapshot.current)
		<< " display=" << MilestoneName(snapshot.display) << " elapsed_ms=" << snapshot.elapsed_ms;
	if (on_transition_) {
		on_transition_(snapshot);
	}
	return true;
}

size_t SplitStateMachine::ApplyAll(const std::vector<DetectedEvent>& events) {
	size_t accepted = 0;
	for (const auto& event : events) {
		if (Apply(event)) {
			++accepted;
		}
	}
	return accepted;
}

RunSnapshot SplitStateMachine::Snapshot() const {
	absl::MutexLock lock(&mutex_);
	return SnapshotLocked();
}

RunSnapshot SplitStateMachine::SnapshotLocked() const {
	RunSnapshot snapshot;
	snapshot.current = state_.current;
	snapshot.display = state_.display;
	snapshot.elapsed_ms = state_.elapsed_ms;
	snapshot.is_new_run = state_.is_new_run;
	snapshot.run_epoch_start = state_.run_epoch_start;
	snapshot.started_by_reset = state_.started_by_reset;
	snapshot.sequence = sequence_;
	return snapshot;
}

bool SplitStateMachine::ApplyReset() {
	if (state_.current == Milestone::kNone && state_.is_new_run) {
		return false;
	}
	state_ = RunState{};
	state_.is_new_run = true;
	state_.run_epoch_start = wall_clock_();
	state_.started_by_reset = true;
	last_trigger_.clear();
	return true;
}

bool SplitStateMachine::PassCooldown(Milestone m, std::chrono::steady_clock::time_point at) {
	auto it = last_trigger_.find(m);
	if (it != last_trigger_.end() && at - it->second < cooldown_) {
		return false;
	}
	last_trigger_[m] = at;
	return true;
}

bool SplitStateMachine::ApplyAdvance(const DetectedEvent& event) {
	const Milestone m = event.milestone;
	if (!IsRankBearing(m) || m == Milestone::kNone) {
		return false;
	}
	if (Rank(m) <= Rank(state_.current)) {
		return false;
	}
	state_.current = m;
	state_.display = m;
	state_.is_new_run = false;
	state_.elapsed_ms = event.source == EventSource::kSnapshot && event.elapsed_ms > 0
		? event.elapsed_ms : 0;
	return true;
}

bool SplitStateMachine::ApplyEnrich(const DetectedEvent& event) {
	if (event.milestone != state_.current || state_.current == Milestone::kNone) {
		return false;
	}
	if (state_.elapsed_ms != 0 || event.elapsed_ms <= 0) {
		return false;
	}
	state_.elapsed_ms = event.elapsed_ms;
	return true;
}

bool SplitStateMachine::ApplyDisplay(const DetectedEvent& event) {
	if (!band_.Contains(Rank(state_.current))) {
		return false;
	}
	if (IsRankBearing(event.milestone) && Rank(event.milestone) < Rank(state_.current)) {
		return false;
	}
	if (state_.display == event.milestone) {
		return false;
	}
	if (event.source == EventSource::kStream && !PassCooldown(event.milestone, event.arrival)) {
		return false;
	}
	state_.display = event.milestone;
	return true;
}

} // namespace Splitwatch
