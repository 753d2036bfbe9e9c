#include "pattern_table.h"

#include <algorithm>
#include <glog/logging.h>

namespace Splitwatch {

std::vector<PatternRule> PatternTable::DefaultRules() {
	return {
		{EventKind::kReset,   Milestone::kNone,       MatchType::kContains, "Loaded 0 advancements"},
		{EventKind::kAdvance, Milestone::kNether,     MatchType::kContains, "[We Need to Go Deeper]"},
		{EventKind::kAdvance, Milestone::kBastion,    MatchType::kContains, "[Those Were the Days]"},
		{EventKind::kAdvance, Milestone::kFortress,   MatchType::kContains, "[A Terrible Fortress]"},
		{EventKind::kAdvance, Milestone::kStronghold, MatchType::kContains, "[Eye Spy]"},
		{EventKind::kAdvance, Milestone::kEnd,        MatchType::kContains, "[The End?]"},
		{EventKind::kAdvance, Milestone::kFinish,     MatchType::kContains, "[Free the End]"},
		{EventKind::kDisplay, Milestone::kSearching,  MatchType::kContains, "[Subspace Bubble]"},
	};
}

std::string PatternTable::CheckRule(const PatternRule& rule) {
	if (rule.pattern.empty()) {
		return "empty pattern";
	}
	switch (rule.kind) {
		case EventKind::kReset:
			break;
		case EventKind::kAdvance:
			if (!IsRankBearing(rule.milestone) || rule.milestone == Milestone::kNone) {
				return std::string("advance rule needs a split milestone, got ") +
					MilestoneName(rule.milestone);
			}
			break;
		case EventKind::kDisplay:
			if (rule.milestone == Milestone::kNone) {
				return "display rule needs a milestone";
			}
			break;
		case EventKind::kEnrich:
			return "enrich events cannot come from log lines";
	}
	if (rule.match_type == MatchType::kRegex) {
		try {
			std::regex re(rule.pattern, std::regex::ECMAScript);
		} catch (const std::regex_error& e) {
			return std::string("invalid regex '") + rule.pattern + "': " + e.what();
		}
	}
	return "";
}

PatternTable::PatternTable(std::vector<PatternRule> rules) {
	rules_.reserve(rules.size());
	for (auto& rule : rules) {
		std::string problem = CheckRule(rule);
		if (!problem.empty()) {
			LOG(WARNING) << "Dropping pattern rule '" << rule.pattern << "': " << problem;
			continue;
		}
		CompiledRule compiled{std::move(rule), std::nullopt};
		if (compiled.rule.match_type == MatchType::kRegex) {
			compiled.regex.emplace(compiled.rule.pattern, std::regex::ECMAScript);
		}
		rules_.push_back(std::move(compiled));
	}
	std::stable_sort(rules_.begin(), rules_.end(),
			[](const CompiledRule& a, const CompiledRule& b) {
				if (KindPriority(a.rule.kind) != KindPriority(b.rule.kind)) {
					return KindPriority(a.rule.kind) < KindPriority(b.rule.kind);
				}
				return a.rule.kind == EventKind::kAdvance && Rank(a.rule.milestone) < Rank(b.rule.milestone);
			});
}

int PatternTable::KindPriority(EventKind kind) {
	switch (kind) {
		case EventKind::kReset:   return 0;
		case EventKind::kAdvance: return 1;
		case EventKind::kDisplay: return 2;
		case EventKind::kEnrich:  return 3;
	}
	return 3;
}

bool PatternTable::Matches(const CompiledRule& compiled, std::string_view line) {
	if (compiled.regex) {
		try {
			return std::regex_search(line.begin(), line.end(), *compiled.regex);
		} catch (const std::regex_error& e) {
			// Backtracking limits on pathological lines.
			VLOG(1) << "Pattern '" << compiled.rule.pattern << "' gave up on a line: " << e.what();
			return false;
		}
	}
	return line.find(compiled.rule.pattern) != std::string_view::npos;
}

const PatternRule* PatternTable::MatchingRule(std::string_view line) const {
	for (const auto& compiled : rules_) {
		if (Matches(compiled, line)) {
			return &compiled.rule;
		}
	}
	return nullptr;
}

std::optional<DetectedEvent> PatternTable::Match(std::string_view line,
		std::chrono::steady_clock::time_point now) const {
	const PatternRule* rule = MatchingRule(line);
	if (rule == nullptr) {
		return std::nullopt;
	}
	switch (rule->kind) {
		case EventKind::kReset:
			return DetectedEvent::Reset(EventSource::kStream, now);
		case EventKind::kAdvance:
			return DetectedEvent::Advance(rule->milestone, EventSource::kStream, now);
		case EventKind::kDisplay:
			return DetectedEvent::Display(rule->milestone, EventSource::kStream, now);
		case EventKind::kEnrich:
			break;
	}
	return std::nullopt;
}

} // namespace Splitwatch
