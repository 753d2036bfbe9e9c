#include "presence_publisher.h"

#include <chrono>
#include <cstdio>

#include <glog/logging.h>

namespace Splitwatch {

namespace {

struct SplitInfo {
	const char* state;
	const char* details;
	const char* large_image;
	const char* large_text;
	const char* small_image;
	const char* small_text;
};

const SplitInfo& InfoFor(Milestone m) {
	static const SplitInfo kNone{"Starting a new run", "Grinding the overworld...",
		"overworld", "Overworld", "grass_block", "Just started"};
	static const SplitInfo kNether{"Entered the Nether", "Trading piglins / looting bastion...",
		"nether", "The Nether", "nether_portal", "Nether entered"};
	static const SplitInfo kBastion{"In Bastion Remnant", "Looting gold & ender pearls...",
		"nether", "The Nether", "bastion", "Bastion found"};
	static const SplitInfo kFortress{"In Nether Fortress", "Collecting blaze rods...",
		"nether", "The Nether", "fortress", "Fortress found"};
	static const SplitInfo kFirstPortal{"Built First Portal", "Returning to the overworld...",
		"nether", "The Nether", "obsidian", "Portal constructed"};
	static const SplitInfo kSearching{"Searching for Stronghold", "Blind traveling...",
		"stronghold", "Searching for Stronghold", "ender_eye", "Blind travel"};
	static const SplitInfo kStronghold{"Locating Stronghold", "Throwing eyes of ender...",
		"stronghold", "Searching for Stronghold", "ender_eye", "Stronghold phase"};
	static const SplitInfo kEnd{"Entered the End", "Fighting the Ender Dragon!",
		"end", "The End", "end_portal", "End portal entered"};
	static const SplitInfo kFinish{"Run Complete!", "Dragon has been slain!",
		"credits", "Finished!", "dragon_egg", "Run finished"};

	switch (m) {
		case Milestone::kNone:        return kNone;
		case Milestone::kNether:      return kNether;
		case Milestone::kBastion:     return kBastion;
		case Milestone::kFortress:    return kFortress;
		case Milestone::kFirstPortal: return kFirstPortal;
		case Milestone::kStronghold:  return kStronghold;
		case Milestone::kEnd:         return kEnd;
		case Milestone::kFinish:      return kFinish;
		case Milestone::kSearching:   return kSearching;
	}
	return kNone;
}

} // end of namespace

std::string FormatIgt(int64_t ms) {
	if (ms <= 0) {
		return "0:00.000";
	}
	int64_t total_s = ms / 1000;
	int64_t millis = ms % 1000;
	int64_t minutes = total_s / 60;
	int64_t seconds = total_s % 60;
	char buf[48];
	std::snprintf(buf, sizeof(buf), "%lld:%02lld.%03lld",
			static_cast<long long>(minutes), static_cast<long long>(seconds),
			static_cast<long long>(millis));
	return buf;
}

PresenceInfo RenderPresence(const RunSnapshot& snapshot) {
	const SplitInfo& info = InfoFor(snapshot.display);
	PresenceInfo presence;
	presence.large_image = info.large_image;
	presence.large_text = info.large_text;
	presence.small_image = info.small_image;
	presence.small_text = info.small_text;

	presence.details = info.details;
	if (snapshot.elapsed_ms > 0 && snapshot.current != Milestone::kNone) {
		presence.details += " | IGT: " + FormatIgt(snapshot.elapsed_ms);
	}

	if (snapshot.current == kCompleteMilestone) {
		presence.state = "FINISHED! IGT: " + FormatIgt(snapshot.elapsed_ms);
	} else {
		presence.state = std::string(info.state) + " (" + std::to_string(Rank(snapshot.current)) +
			"/" + std::to_string(kNumSplits) + " splits)";
	}

	if (snapshot.current == Milestone::kNone) {
		presence.start_timestamp = std::chrono::duration_cast<std::chrono::seconds>(
				snapshot.run_epoch_start.time_since_epoch()).count();
	}
	return presence;
}

PresencePublisher::PresencePublisher(std::vector<std::shared_ptr<IPresenceSink>> sinks)
	: sinks_(std::move(sinks)) {}

void PresencePublisher::Publish(const RunSnapshot& snapshot) {
	absl::MutexLock lock(&mutex_);
	if (last_sequence_ && snapshot.sequence <= *last_sequence_) {
		VLOG(2) << "Dropping stale snapshot " << snapshot.sequence << " (seen " << *last_sequence_ << ")";
		return;
	}
	last_sequence_ = snapshot.sequence;

	RenderKey key{snapshot.display, snapshot.elapsed_ms, snapshot.is_new_run};
	if (last_rendered_ && *last_rendered_ == key) {
		return;
	}

	PresenceInfo presence = RenderPresence(snapshot);
	bool delivered = true;
	for (const auto& sink : sinks_) {
		if (!sink->Update(presence)) {
			LOG(WARNING) << "Presence sink " << sink->name() << " rejected update for "
				<< MilestoneName(snapshot.display);
			delivered = false;
		}
	}
	if (!delivered) {
		last_rendered_.reset();
		return;
	}
	last_rendered_ = key;
	++renders_;
	LOG(INFO) << "Presence updated -> " << MilestoneName(snapshot.display) << ": " << presence.state;
}

void PresencePublisher::Clear() {
	absl::MutexLock lock(&mutex_);
	for (const auto& sink : sinks_) {
		sink->Clear();
	}
	last_rendered_.reset();
}

uint64_t PresencePublisher::renders() const {
	absl::MutexLock lock(&mutex_);
	return renders_;
}

} // namespace Splitwatch
