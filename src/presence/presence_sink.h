#ifndef SPLITWATCH_PRESENCE_PRESENCE_SINK_H_
#define SPLITWATCH_PRESENCE_PRESENCE_SINK_H_

#include <cstdint>
#include <optional>
#include <string>

namespace Splitwatch {

/**
 * Rendered presence, laid out like a rich-presence activity.
 */
struct PresenceInfo {
	std::string state;
	std::string details;
	std::string large_image;
	std::string large_text;
	std::string small_image;
	std::string small_text;
	// Unix seconds the display timer counts from; unset hides the timer.
	std::optional<int64_t> start_timestamp;

	bool operator==(const PresenceInfo& o) const {
		return state == o.state && details == o.details &&
			large_image == o.large_image && large_text == o.large_text &&
			small_image == o.small_image && small_text == o.small_text &&
			start_timestamp == o.start_timestamp;
	}
	bool operator!=(const PresenceInfo& o) const { return !(*this == o); }
};

/**
 * Destination for rendered presence.
 */
class IPresenceSink {
public:
    virtual ~IPresenceSink() = default;

    // False when the destination could not be reached; the publisher retries
    // on the next transition.
    virtual bool Update(const PresenceInfo& info) = 0;
    virtual void Clear() = 0;
    virtual const char* name() const = 0;
};

// Writes every render to the INFO log.
class LogPresenceSink : public IPresenceSink {
public:
    bool Update(const PresenceInfo& info) override;
    void Clear() override;
    const char* name() const override { return "log"; }
};

/**
 * Keeps a small text file with the current presence, for stream overlays.
 * Each update replaces the file atomically; Clear() leaves it empty.
 */
class StatusFileSink : public IPresenceSink {
public:
    explicit StatusFileSink(std::string path);

    bool Update(const PresenceInfo& info) override;
    void Clear() override;
    const char* name() const override { return "status_file"; }

    const std::string& path() const { return path_; }

private:
    bool WriteAtomically(const std::string& content);

    std::string path_;
};

} // namespace Splitwatch

#endif // SPLITWATCH_PRESENCE_PRESENCE_SINK_H_
