#ifndef SPLITWATCH_TRACKER_MILESTONE_H_
#define SPLITWATCH_TRACKER_MILESTONE_H_

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace Splitwatch {

/**
 * Points of progress in a run. The rank-bearing values are declared in split
 * order; kSearching is a display-only state with no rank.
 */
enum class Milestone {
	kNone = 0,
	kNether,
	kBastion,
	kFortress,
	kFirstPortal,
	kStronghold,
	kEnd,
	kFinish,
	kSearching,
};

constexpr int kNoRank = -1;

// Split order, NONE sentinel first and the terminal COMPLETE value last.
constexpr std::array<Milestone, 8> kSplitOrder = {
	Milestone::kNone,
	Milestone::kNether,
	Milestone::kBastion,
	Milestone::kFortress,
	Milestone::kFirstPortal,
	Milestone::kStronghold,
	Milestone::kEnd,
	Milestone::kFinish,
};

// Number of real splits (everything after kNone).
constexpr int kNumSplits = static_cast<int>(kSplitOrder.size()) - 1;

constexpr Milestone kCompleteMilestone = Milestone::kFinish;

int Rank(Milestone m);
bool IsRankBearing(Milestone m);

// Rank-bearing milestone at position `rank`, kNone when out of range.
Milestone MilestoneAtRank(int rank);

// Canonical lower-case name, e.g. "first_portal".
const char* MilestoneName(Milestone m);

// Inverse of MilestoneName. Case sensitive.
std::optional<Milestone> ParseMilestone(std::string_view name);

/**
 * Half-open rank window [from, until) inside which a display-only state may be
 * shown. Entry requires the run to have reached `from`; reaching `until`
 * supersedes the soft state.
 */
struct DisplayBand {
	Milestone from = Milestone::kFortress;
	Milestone until = Milestone::kStronghold;

	bool Contains(int rank) const {
		return rank >= Rank(from) && rank < Rank(until);
	}
	bool IsValid() const {
		return IsRankBearing(from) && IsRankBearing(until) && Rank(from) < Rank(until);
	}
};

} // namespace Splitwatch

#endif // SPLITWATCH_TRACKER_MILESTONE_H_
