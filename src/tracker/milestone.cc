#include "milestone.h"

namespace Splitwatch {

int Rank(Milestone m) {
	for (size_t i = 0; i < kSplitOrder.size(); ++i) {
		if (kSplitOrder[i] == m) {
			return static_cast<int>(i);
		}
	}
	return kNoRank;
}

bool IsRankBearing(Milestone m) {
	return Rank(m) != kNoRank;
}

Milestone MilestoneAtRank(int rank) {
	if (rank < 0 || rank >= static_cast<int>(kSplitOrder.size())) {
		return Milestone::kNone;
	}
	return kSplitOrder[rank];
}

const char* MilestoneName(Milestone m) {
	switch (m) {
		case Milestone::kNone:        return "none";
		case Milestone::kNether:      return "nether";
		case Milestone::kBastion:     return "bastion";
		case Milestone::kFortress:    return "fortress";
		case Milestone::kFirstPortal: return "first_portal";
		case Milestone::kStronghold:  return "stronghold";
		case Milestone::kEnd:         return "end";
		case Milestone::kFinish:      return "finish";
		case Milestone::kSearching:   return "searching";
	}
	return "unknown";
}

std::optional<Milestone> ParseMilestone(std::string_view name) {
	static constexpr Milestone kAll[] = {
		Milestone::kNone, Milestone::kNether, Milestone::kBastion,
		Milestone::kFortress, Milestone::kFirstPortal, Milestone::kStronghold,
		Milestone::kEnd, Milestone::kFinish, Milestone::kSearching,
	};
	for (Milestone m : kAll) {
		if (name == MilestoneName(m)) {
			return m;
		}
	}
	return std::nullopt;
}

} // namespace Splitwatch
