#ifndef SPLITWATCH_PRESENCE_PRESENCE_PUBLISHER_H_
#define SPLITWATCH_PRESENCE_PRESENCE_PUBLISHER_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "../tracker/interfaces.h"
#include "presence_sink.h"

namespace Splitwatch {

// In-game time as "m:ss.mmm"; non-positive values render as "0:00.000".
std::string FormatIgt(int64_t ms);

// Presence text for a run state.
PresenceInfo RenderPresence(const RunSnapshot& snapshot);

/**
 * Publisher adapter between the state machine and the presence sinks.
 *
 * Snapshots older than the last one seen are dropped, and a snapshot whose
 * (display milestone, elapsed, new-run) tuple equals the last rendered one is
 * not rendered again. A render only counts as done when every sink accepted
 * it.
 */
class PresencePublisher : public IRunStatePublisher {
	public:
		explicit PresencePublisher(std::vector<std::shared_ptr<IPresenceSink>> sinks);

		void Publish(const RunSnapshot& snapshot) override;
		void Clear() override;

		uint64_t renders() const;

	private:
		struct RenderKey {
			Milestone display;
			int64_t elapsed_ms;
			bool is_new_run;

			bool operator==(const RenderKey& o) const {
				return display == o.display && elapsed_ms == o.elapsed_ms && is_new_run == o.is_new_run;
			}
		};

		std::vector<std::shared_ptr<IPresenceSink>> sinks_;

		mutable absl::Mutex mutex_;
		std::optional<RenderKey> last_rendered_;
		std::optional<uint64_t> last_sequence_;
		uint64_t renders_ = 0;
};

} // namespace Splitwatch

#endif // SPLITWATCH_PRESENCE_PRESENCE_PUBLISHER_H_
