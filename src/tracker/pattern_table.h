#ifndef SPLITWATCH_TRACKER_PATTERN_TABLE_H_
#define SPLITWATCH_TRACKER_PATTERN_TABLE_H_

#include <chrono>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "detected_event.h"

namespace Splitwatch {

enum class MatchType {
	kContains,
	kRegex,
};

struct PatternRule {
	EventKind kind = EventKind::kAdvance;
	Milestone milestone = Milestone::kNone;
	MatchType match_type = MatchType::kContains;
	std::string pattern;
};

/**
 * Ordered line-match rules turning one log line into at most one event.
 *
 * Rules are evaluated RESET first, then ADVANCE in split order, then DISPLAY;
 * rules that tie keep the given order and the first matching rule wins. The constructor
 * enforces that ordering regardless of how the rule list was assembled, so a
 * reset line is never read as a milestone line.
 */
class PatternTable {
	public:
		explicit PatternTable(std::vector<PatternRule> rules);

		// Vanilla latest.log advancement lines.
		static std::vector<PatternRule> DefaultRules();
		static PatternTable Default() { return PatternTable(DefaultRules()); }

		// Empty string when the rule is usable, otherwise the reason it is not.
		static std::string CheckRule(const PatternRule& rule);

		std::optional<DetectedEvent> Match(std::string_view line,
				std::chrono::steady_clock::time_point now) const;

		// Rule that would fire for `line`, nullptr when none does.
		const PatternRule* MatchingRule(std::string_view line) const;

		size_t size() const { return rules_.size(); }

	private:
		struct CompiledRule {
			PatternRule rule;
			std::optional<std::regex> regex;
		};

		static int KindPriority(EventKind kind);
		static bool Matches(const CompiledRule& compiled, std::string_view line);

		std::vector<CompiledRule> rules_;
};

} // namespace Splitwatch

#endif // SPLITWATCH_TRACKER_PATTERN_TABLE_H_
