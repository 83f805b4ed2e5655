#pragma once

#include <cerrno>
#include <cstddef>
#include <streambuf>
#include <unistd.h>

namespace snipvisor::worker {

// Buffered std::streambuf over a raw file descriptor. Does not own the fd.
class FdOutputBuf : public std::streambuf {
public:
    explicit FdOutputBuf(int fd) : fd_(fd) {
        setp(buffer_, buffer_ + sizeof(buffer_));
    }

    ~FdOutputBuf() override { static_cast<void>(flush_buffer()); }

protected:
    int_type overflow(int_type ch) override {
        if (flush_buffer() != 0) {
            return traits_type::eof();
        }
        if (!traits_type::eq_int_type(ch, traits_type::eof())) {
            *pptr() = traits_type::to_char_type(ch);
            pbump(1);
        }
        return traits_type::not_eof(ch);
    }

    int sync() override { return flush_buffer(); }

private:
    int flush_buffer() {
        const char* data = pbase();
        std::size_t remaining = static_cast<std::size_t>(pptr() - pbase());
        while (remaining > 0) {
            const ssize_t n = write(fd_, data, remaining);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return -1;
            }
            data += n;
            remaining -= static_cast<std::size_t>(n);
        }
        setp(buffer_, buffer_ + sizeof(buffer_));
        return 0;
    }

    int fd_;
    char buffer_[4096];
};

}  // namespace snipvisor::worker
