// Owning file descriptor for the poll loops' short-lived opens.
#ifndef SPLITWATCH_SRC_COMMON_SCOPED_FD_H_
#define SPLITWATCH_SRC_COMMON_SCOPED_FD_H_

#include <cerrno>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace Splitwatch {

class ScopedFd {
	public:
		ScopedFd() = default;
		explicit ScopedFd(int fd) : fd_(fd) {}

		// open(2) with O_RDONLY | O_CLOEXEC, retried on EINTR. On failure the
		// result is invalid and error() holds errno.
		static ScopedFd OpenReadOnly(const std::string& path) {
			ScopedFd result;
			do {
				result.fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
			} while (result.fd_ < 0 && errno == EINTR);
			if (result.fd_ < 0) {
				result.error_ = errno;
			}
			return result;
		}

		~ScopedFd() { Reset(); }

		ScopedFd(const ScopedFd&) = delete;
		ScopedFd& operator=(const ScopedFd&) = delete;

		ScopedFd(ScopedFd&& o) noexcept : fd_(o.fd_), error_(o.error_) { o.fd_ = -1; }
		ScopedFd& operator=(ScopedFd&& o) noexcept {
			if (this != &o) {
				Reset();
				fd_ = o.fd_;
				error_ = o.error_;
				o.fd_ = -1;
			}
			return *this;
		}

		int get() const { return fd_; }
		bool valid() const { return fd_ >= 0; }
		int error() const { return error_; }

		void Reset() {
			if (fd_ >= 0) {
				::close(fd_);
				fd_ = -1;
			}
		}

	private:
		int fd_ = -1;
		int error_ = 0;
};

}  // namespace Splitwatch

#endif  // SPLITWATCH_SRC_COMMON_SCOPED_FD_H_
