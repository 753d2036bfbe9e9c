#include "line_stream_reader.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <glog/logging.h>

#include "../common/scoped_fd.h"

namespace Splitwatch {

namespace {

constexpr char kReplacementChar[] = "\xEF\xBF\xBD";

bool IsBlank(std::string_view line) {
	for (char c : line) {
		if (c != ' ' && c != '\t' && c != '\r' && c != '\f' && c != '\v') {
			return false;
		}
	}
	return true;
}

} // end of namespace

std::string SanitizeUtf8(std::string_view in) {
	std::string out;
	out.reserve(in.size());
	size_t i = 0;
	const size_t n = in.size();
	while (i < n) {
		unsigned char c = static_cast<unsigned char>(in[i]);
		if (c < 0x80) {
			out.push_back(static_cast<char>(c));
			++i;
			continue;
		}
		size_t len = 0;
		uint32_t min_cp = 0;
		uint32_t cp = 0;
		if ((c & 0xE0) == 0xC0) {
			len = 2; min_cp = 0x80; cp = c & 0x1F;
		} else if ((c & 0xF0) == 0xE0) {
			len = 3; min_cp = 0x800; cp = c & 0x0F;
		} else if ((c & 0xF8) == 0xF0) {
			len = 4; min_cp = 0x10000; cp = c & 0x07;
		}
		bool valid = len > 0 && i + len <= n;
		for (size_t k = 1; valid && k < len; ++k) {
			unsigned char cc = static_cast<unsigned char>(in[i + k]);
			if ((cc & 0xC0) != 0x80) {
				valid = false;
			} else {
				cp = (cp << 6) | (cc & 0x3F);
			}
		}
		// Overlong forms, surrogates and out-of-range code points.
		if (valid && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
			valid = false;
		}
		if (valid) {
			out.append(in.data() + i, len);
			i += len;
		} else {
			out.append(kReplacementChar);
			++i;
		}
	}
	return out;
}

LineStreamReader::LineStreamReader(std::string path, bool from_start)
	: path_(std::move(path)) {
	struct stat st;
	if (::stat(path_.c_str(), &st) == 0) {
		dev_ = st.st_dev;
		ino_ = st.st_ino;
		have_identity_ = true;
		if (!from_start) {
			offset_ = static_cast<uint64_t>(st.st_size);
		}
	} else {
		VLOG(1) << "Log file " << path_ << " not present yet, reading from its start once created";
	}
}

bool LineStreamReader::ReadRange(int fd, uint64_t from, uint64_t to, std::string& out) {
	out.resize(to - from);
	uint64_t done = 0;
	while (from + done < to) {
		ssize_t n = ::pread(fd, &out[done], to - from - done, static_cast<off_t>(from + done));
		if (n < 0) {
			if (errno == EINTR) {
				continue;
			}
			VLOG(1) << "pread on " << path_ << " failed: " << strerror(errno);
			return false;
		}
		if (n == 0) {
			// Shrunk between fstat and pread; keep what was read.
			break;
		}
		done += static_cast<uint64_t>(n);
	}
	out.resize(done);
	return true;
}

std::vector<std::string> LineStreamReader::Poll() {
	std::vector<std::string> lines;

	ScopedFd fd = ScopedFd::OpenReadOnly(path_);
	if (!fd.valid()) {
		if (!open_failure_logged_) {
			VLOG(1) << "Cannot open " << path_ << ": " << strerror(fd.error());
			open_failure_logged_ = true;
		}
		return lines;
	}
	open_failure_logged_ = false;

	struct stat st;
	if (::fstat(fd.get(), &st) != 0) {
		VLOG(1) << "fstat on " << path_ << " failed: " << strerror(errno);
		return lines;
	}
	uint64_t size = static_cast<uint64_t>(st.st_size);

	bool replaced = have_identity_ && (st.st_dev != dev_ || st.st_ino != ino_);
	if (replaced || size < offset_) {
		LOG(INFO) << "Log file " << path_ << (replaced ? " replaced" : " truncated")
			<< ", restarting from offset 0 (was " << offset_ << ")";
		offset_ = 0;
		++rotations_;
	}
	dev_ = st.st_dev;
	ino_ = st.st_ino;
	have_identity_ = true;

	if (size == offset_) {
		return lines;
	}

	uint64_t end = std::min(size, offset_ + kMaxReadPerPoll);
	std::string chunk;
	if (!ReadRange(fd.get(), offset_, end, chunk) || chunk.empty()) {
		return lines;
	}

	size_t last_newline = chunk.rfind('\n');
	size_t consumed;
	if (last_newline != std::string::npos) {
		consumed = last_newline + 1;
	} else if (chunk.size() >= kMaxReadPerPoll) {
		// A single line larger than the read window; hand it over as is.
		consumed = chunk.size();
	} else {
		return lines;
	}

	std::string_view data(chunk.data(), consumed);
	size_t start = 0;
	while (start < data.size()) {
		size_t nl = data.find('\n', start);
		if (nl == std::string_view::npos) {
			nl = data.size();
		}
		std::string_view line = data.substr(start, nl - start);
		if (!line.empty() && line.back() == '\r') {
			line.remove_suffix(1);
		}
		if (!IsBlank(line)) {
			lines.push_back(SanitizeUtf8(line));
		}
		start = nl + 1;
	}
	offset_ += consumed;
	VLOG(3) << "Read " << consumed << " bytes, " << lines.size() << " lines from " << path_;
	return lines;
}

} // namespace Splitwatch
