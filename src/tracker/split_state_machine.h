#ifndef SPLITWATCH_TRACKER_SPLIT_STATE_MACHINE_H_
#define SPLITWATCH_TRACKER_SPLIT_STATE_MACHINE_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "detected_event.h"
#include "milestone.h"

namespace Splitwatch {

/**
 * Immutable view of the run handed to consumers after every accepted
 * transition. `sequence` grows by one per transition.
 */
struct RunSnapshot {
	Milestone current = Milestone::kNone;
	Milestone display = Milestone::kNone;
	int64_t elapsed_ms = 0;
	bool is_new_run = false;
	std::chrono::system_clock::time_point run_epoch_start{};
	// False until the first RESET; before that the epoch is only process start.
	bool started_by_reset = false;
	uint64_t sequence = 0;
};

/**
 * Reconciles events from the log stream and the snapshot file into one
 * monotonic run state.
 *
 * - RESET returns to kNone with a fresh epoch. Repeating it while already in a
 *   fresh run is a no-op.
 * - ADVANCE never moves to a rank at or below the current one, so a repeated
 *   trigger of an accepted milestone is rejected until the next RESET.
 *   Snapshot advances carry elapsed time.
 * - ENRICH fills elapsed time for the current milestone while it is still 0.
 * - DISPLAY swaps the shown milestone only while the current rank is inside
 *   the display band. Stream DISPLAY triggers of the same milestone within
 *   `cooldown` of each other are collapsed; this is the only throttled kind.
 *
 * All state sits behind one mutex held only for the decision itself; the
 * transition callback runs after the lock is released.
 */
class SplitStateMachine {
	public:
		using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;
		using WallClock = std::function<std::chrono::system_clock::time_point()>;
		using TransitionCallback = std::function<void(const RunSnapshot&)>;

		explicit SplitStateMachine(DisplayBand band = DisplayBand{},
				std::chrono::milliseconds cooldown = std::chrono::milliseconds(2000),
				WallClock wall_clock = nullptr);

		// Must be set before producers start.
		void SetTransitionCallback(TransitionCallback callback) {
			on_transition_ = std::move(callback);
		}

		// True when the event changed the run state.
		bool Apply(const DetectedEvent& event);

		// Applies in order, returns the number of accepted events.
		size_t ApplyAll(const std::vector<DetectedEvent>& events);

		RunSnapshot Snapshot() const;

		const DisplayBand& band() const { return band_; }
		std::chrono::milliseconds cooldown() const { return cooldown_; }

	private:
		struct RunState {
			Milestone current = Milestone::kNone;
			Milestone display = Milestone::kNone;
			int64_t elapsed_ms = 0;
			bool is_new_run = false;
			std::chrono::system_clock::time_point run_epoch_start{};
			bool started_by_reset = false;
		};

		bool ApplyReset();
		bool ApplyAdvance(const DetectedEvent& event);
		bool ApplyEnrich(const DetectedEvent& event);
		bool ApplyDisplay(const DetectedEvent& event);

		// True (and the trigger remembered) unless a DISPLAY of `m` fired from
		// the stream less than cooldown_ ago.
		bool PassCooldown(Milestone m, std::chrono::steady_clock::time_point at);

		RunSnapshot SnapshotLocked() const;

		const DisplayBand band_;
		const std::chrono::milliseconds cooldown_;
		WallClock wall_clock_;
		TransitionCallback on_transition_;

		mutable absl::Mutex mutex_;
		RunState state_;
		uint64_t sequence_ = 0;
		absl::flat_hash_map<Milestone, std::chrono::steady_clock::time_point> last_trigger_;
};

} // namespace Splitwatch

#endif // SPLITWATCH_TRACKER_SPLIT_STATE_MACHINE_H_
