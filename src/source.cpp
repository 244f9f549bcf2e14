#include <algorithm>
#include <cerrno>
#include <cstring>
#include <istream>
#include <semq/errors.hpp>
#include <semq/source.hpp>
#include <sys/select.h>
#include <unistd.h>

namespace semq
{

// ============================================================================
// StringSource implementation
// ============================================================================

StringSource::StringSource(std::string text)
{
    chunks_.push_back(std::move(text));
}

StringSource::StringSource(std::vector<std::string> chunks) : chunks_(std::move(chunks)) {}

size_t StringSource::read(char* buffer, size_t size)
{
    // Skip exhausted and empty chunks
    while (chunk_index_ < chunks_.size() && chunk_offset_ >= chunks_[chunk_index_].size())
    {
        ++chunk_index_;
        chunk_offset_ = 0;
    }

    if (chunk_index_ >= chunks_.size() || size == 0)
        return 0;

    const std::string& chunk = chunks_[chunk_index_];
    const size_t n = std::min(size, chunk.size() - chunk_offset_);
    std::memcpy(buffer, chunk.data() + chunk_offset_, n);
    chunk_offset_ += n;
    return n;
}

// ============================================================================
// IstreamSource implementation
// ============================================================================

IstreamSource::IstreamSource(std::istream& stream) : stream_(stream) {}

size_t IstreamSource::read(char* buffer, size_t size)
{
    if (size == 0 || stream_.eof())
        return 0;

    stream_.read(buffer, static_cast<std::streamsize>(size));
    const auto n = stream_.gcount();
    if (stream_.bad())
        throw SourceError("Input stream failed");

    return static_cast<size_t>(n);
}

// ============================================================================
// FdSource implementation
// ============================================================================

struct FdHandle
{
    int fd = -1;
    bool owns = false;

    ~FdHandle()
    {
        if (owns && fd >= 0)
            ::close(fd);
    }
};

static std::string get_errno_message()
{
    return std::strerror(errno);
}

FdSource::FdSource(int fd, bool owns) : handle_(std::make_unique<FdHandle>())
{
    handle_->fd = fd;
    handle_->owns = owns;
}

FdSource::~FdSource() = default;

FdSource::FdSource(FdSource&&) noexcept = default;
FdSource& FdSource::operator=(FdSource&&) noexcept = default;

size_t FdSource::read(char* buffer, size_t size)
{
    if (!is_open())
        throw SourceError("File descriptor is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);

        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            // Non-blocking descriptor: wait until readable instead of reporting end of input
            has_data(-1);
            continue;
        }
        throw SourceError("Read failed: " + get_errno_message());
    }
}

bool FdSource::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(handle_->fd + 1, &read_fds, nullptr, nullptr,
                        timeout_ms < 0 ? nullptr : &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw SourceError("select failed: " + get_errno_message());
    }

    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void FdSource::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        if (handle_->owns)
            ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool FdSource::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// LineReader implementation
// ============================================================================

LineReader::LineReader(ByteSource& source, size_t read_size)
    : source_(source), chunk_(std::max<size_t>(read_size, 1))
{
}

std::optional<std::string> LineReader::read_line()
{
    while (true)
    {
        size_t pos = buffer_.find('\n', scan_from_);
        if (pos != std::string::npos)
        {
            std::string line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            scan_from_ = 0;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }
        scan_from_ = buffer_.size();

        if (eof_)
        {
            if (buffer_.empty())
                return std::nullopt;

            std::string line = std::move(buffer_);
            buffer_.clear();
            scan_from_ = 0;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }

        size_t n = source_.read(chunk_.data(), chunk_.size());
        if (n == 0)
            eof_ = true;
        else
            buffer_.append(chunk_.data(), n);
    }
}

} // namespace semq
