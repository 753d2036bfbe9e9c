#include "detected_event.h"

namespace Splitwatch {

const char* EventKindName(EventKind kind) {
	switch (kind) {
		case EventKind::kReset:   return "RESET";
		case EventKind::kAdvance: return "ADVANCE";
		case EventKind::kDisplay: return "DISPLAY";
		case EventKind::kEnrich:  return "ENRICH";
	}
	return "UNKNOWN";
}

const char* EventSourceName(EventSource source) {
	switch (source) {
		case EventSource::kStream:   return "stream";
		case EventSource::kSnapshot: return "snapshot";
	}
	return "unknown";
}

} // namespace Splitwatch
