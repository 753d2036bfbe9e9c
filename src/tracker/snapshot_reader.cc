#include "snapshot_reader.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include "absl/container/flat_hash_map.h"

namespace Splitwatch {

namespace {

const absl::flat_hash_map<std::string, Milestone>& AliasTable() {
	static const auto* table = new absl::flat_hash_map<std::string, Milestone>{
		{"nether", Milestone::kNether},
		{"enter_nether", Milestone::kNether},
		{"enter_the_nether", Milestone::kNether},
		{"minecraft:story/enter_the_nether", Milestone::kNether},

		{"bastion", Milestone::kBastion},
		{"enter_bastion", Milestone::kBastion},
		{"minecraft:nether/find_bastion", Milestone::kBastion},

		{"fortress", Milestone::kFortress},
		{"enter_fortress", Milestone::kFortress},
		{"minecraft:nether/find_fortress", Milestone::kFortress},

		{"first_portal", Milestone::kFirstPortal},
		{"firstportal", Milestone::kFirstPortal},
		{"first-portal", Milestone::kFirstPortal},
		{"nether_travel", Milestone::kFirstPortal},
		{"blind", Milestone::kFirstPortal},

		{"stronghold", Milestone::kStronghold},
		{"enter_stronghold", Milestone::kStronghold},
		{"minecraft:story/follow_ender_eye", Milestone::kStronghold},

		{"end", Milestone::kEnd},
		{"enter_end", Milestone::kEnd},
		{"enter_the_end", Milestone::kEnd},
		{"minecraft:story/enter_the_end", Milestone::kEnd},

		{"finish", Milestone::kFinish},
		{"complete", Milestone::kFinish},
		{"kill_dragon", Milestone::kFinish},
		{"minecraft:end/kill_dragon", Milestone::kFinish},
	};
	return *table;
}

// Non-negative integral milliseconds from a scalar node.
std::optional<int64_t> ReadMillis(const YAML::Node& node) {
	if (!node.IsDefined() || !node.IsScalar()) {
		return std::nullopt;
	}
	try {
		int64_t v = node.as<int64_t>();
		if (v < 0) return std::nullopt;
		return v;
	} catch (const YAML::BadConversion&) {
	}
	try {
		double d = node.as<double>();
		// 2^63 itself is the first double that no longer fits.
		if (!std::isfinite(d) || d < 0 ||
				d >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
			return std::nullopt;
		}
		return static_cast<int64_t>(d);
	} catch (const YAML::BadConversion&) {
	}
	return std::nullopt;
}

void Record(SplitTimes& splits, Milestone m, int64_t ms) {
	// Same split under two aliases: keep the earliest time.
	auto it = splits.find(m);
	if (it == splits.end() || ms < it->second) {
		splits[m] = ms;
	}
}

} // end of namespace

SnapshotReader::SnapshotReader(std::string root, std::vector<std::string> file_names, int max_depth)
	: root_(std::move(root)),
	  file_names_(std::move(file_names)),
	  max_depth_(max_depth) {
	if (file_names_.empty()) {
		file_names_ = DefaultFileNames();
	}
}

std::optional<Milestone> SnapshotReader::CanonicalMilestone(std::string_view raw_key) {
	std::string key(raw_key);
	std::transform(key.begin(), key.end(), key.begin(),
			[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	const auto& table = AliasTable();
	auto it = table.find(key);
	if (it == table.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<SplitTimes> SnapshotReader::Parse(const std::string& content) {
	if (std::all_of(content.begin(), content.end(),
				[](unsigned char c) { return std::isspace(c); })) {
		return std::nullopt;
	}

	YAML::Node root;
	try {
		root = YAML::Load(content);
	} catch (const YAML::Exception& e) {
		VLOG(2) << "Snapshot parse error (file mid-write?): " << e.what();
		return std::nullopt;
	}
	if (!root.IsMap()) {
		VLOG(2) << "Snapshot is not an object";
		return std::nullopt;
	}

	SplitTimes splits;
	try {
		// Flat form: {"nether": 145000, "netherRta": 150000, ...}
		for (const auto& entry : root) {
			if (!entry.first.IsScalar()) continue;
			auto m = CanonicalMilestone(entry.first.Scalar());
			if (!m) continue;
			auto ms = ReadMillis(entry.second);
			if (!ms) continue;
			Record(splits, *m, *ms);
		}

		// Record form: {"timelines": [{"name": "enter_nether", "igt": ...}]}
		const YAML::Node timelines = root["timelines"];
		if (timelines.IsDefined() && timelines.IsSequence()) {
			for (const auto& timeline : timelines) {
				if (!timeline.IsMap()) continue;
				const YAML::Node name = timeline["name"];
				if (!name.IsDefined() || !name.IsScalar()) continue;
				auto m = CanonicalMilestone(name.Scalar());
				if (!m) continue;
				auto ms = ReadMillis(timeline["igt"]);
				if (!ms) continue;
				Record(splits, *m, *ms);
			}
		}

		const YAML::Node completed = root["is_completed"];
		if (completed.IsDefined() && completed.IsScalar() && completed.as<bool>(false)) {
			auto ms = ReadMillis(root["final_igt"]);
			if (ms) {
				Record(splits, Milestone::kFinish, *ms);
			}
		}
	} catch (const YAML::Exception& e) {
		VLOG(2) << "Snapshot structure error: " << e.what();
		return std::nullopt;
	}
	return splits;
}

std::optional<fs::path> SnapshotReader::FindNewestSnapshot() const {
	std::error_code ec;
	fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
	if (ec) {
		return std::nullopt;
	}

	std::optional<fs::path> newest;
	fs::file_time_type newest_mtime{};
	for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
		if (ec) {
			// Entry vanished mid-scan; report nothing this cycle.
			VLOG(2) << "Snapshot scan of " << root_ << " interrupted: " << ec.message();
			return std::nullopt;
		}
		if (it->is_directory(ec)) {
			if (it.depth() >= max_depth_) {
				it.disable_recursion_pending();
			}
			continue;
		}
		if (!it->is_regular_file(ec)) continue;
		std::string name = it->path().filename().string();
		if (std::find(file_names_.begin(), file_names_.end(), name) == file_names_.end()) {
			continue;
		}
		auto mtime = it->last_write_time(ec);
		if (ec) continue;
		if (!newest || mtime > newest_mtime ||
				(mtime == newest_mtime && it->path() > *newest)) {
			newest = it->path();
			newest_mtime = mtime;
		}
	}
	return newest;
}

std::optional<SnapshotData> SnapshotReader::Poll() {
	std::error_code ec;
	if (!fs::is_directory(root_, ec)) {
		if (!root_missing_logged_) {
			VLOG(1) << "Snapshot root " << root_ << " not available";
			root_missing_logged_ = true;
		}
		return std::nullopt;
	}
	root_missing_logged_ = false;

	auto path = FindNewestSnapshot();
	if (!path) {
		return std::nullopt;
	}

	Identity identity;
	identity.path = *path;
	identity.mtime = fs::last_write_time(*path, ec);
	if (ec) return std::nullopt;
	identity.size = fs::file_size(*path, ec);
	if (ec) return std::nullopt;
	if (last_ && *last_ == identity) {
		return std::nullopt;
	}

	std::ifstream in(*path, std::ios::binary);
	if (!in) {
		VLOG(1) << "Could not open snapshot " << *path;
		return std::nullopt;
	}
	std::stringstream buffer;
	buffer << in.rdbuf();
	if (in.bad()) {
		return std::nullopt;
	}

	auto splits = Parse(buffer.str());
	if (!splits) {
		// Left unrecorded so the next poll retries the same file.
		return std::nullopt;
	}
	if (!last_ || last_->path != identity.path) {
		LOG(INFO) << "Tracking snapshot " << identity.path.string();
	}
	last_ = identity;
	if (splits->empty()) {
		return std::nullopt;
	}
	VLOG(1) << "Snapshot " << identity.path.string() << " has " << splits->size() << " splits";
	return SnapshotData{std::move(*splits), identity.path, identity.mtime};
}

std::vector<DetectedEvent> SnapshotReader::ToEvents(const SplitTimes& splits,
		std::chrono::steady_clock::time_point now) {
	std::vector<DetectedEvent> events;
	if (splits.empty()) {
		return events;
	}
	// std::map keyed by enum orders by declaration, which is split order.
	const auto& furthest = *splits.rbegin();
	events.push_back(DetectedEvent::Advance(furthest.first, EventSource::kSnapshot, now, furthest.second));
	for (const auto& [milestone, ms] : splits) {
		events.push_back(DetectedEvent::Enrich(milestone, ms, EventSource::kSnapshot, now));
	}
	return events;
}

} // namespace Splitwatch
