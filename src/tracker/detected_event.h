#pragma once

#include <chrono>
#include <cstdint>
#include "milestone.h"

namespace Splitwatch {

enum class EventKind {
	kReset,
	kAdvance,
	kDisplay,
	kEnrich,
};

enum class EventSource {
	kStream,
	kSnapshot,
};

/**
 * Normalized signal produced by either reader. elapsed_ms is only meaningful
 * for snapshot ADVANCE and ENRICH.
 */
struct DetectedEvent {
	EventKind kind = EventKind::kReset;
	Milestone milestone = Milestone::kNone;
	int64_t elapsed_ms = 0;
	EventSource source = EventSource::kStream;
	std::chrono::steady_clock::time_point arrival{};

	static DetectedEvent Reset(EventSource source, std::chrono::steady_clock::time_point at) {
		return {EventKind::kReset, Milestone::kNone, 0, source, at};
	}
	static DetectedEvent Advance(Milestone m, EventSource source,
			std::chrono::steady_clock::time_point at, int64_t elapsed_ms = 0) {
		return {EventKind::kAdvance, m, elapsed_ms, source, at};
	}
	static DetectedEvent Display(Milestone m, EventSource source,
			std::chrono::steady_clock::time_point at) {
		return {EventKind::kDisplay, m, 0, source, at};
	}
	static DetectedEvent Enrich(Milestone m, int64_t elapsed_ms, EventSource source,
			std::chrono::steady_clock::time_point at) {
		return {EventKind::kEnrich, m, elapsed_ms, source, at};
	}
};

const char* EventKindName(EventKind kind);
const char* EventSourceName(EventSource source);

} // namespace Splitwatch
