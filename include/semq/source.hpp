#ifndef SEMQ_SOURCE_HPP
#define SEMQ_SOURCE_HPP

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace semq
{

/**
 * Abstract byte source feeding a stream.
 *
 * This is the boundary to whatever produces model output: an HTTP response
 * body, a subprocess pipe, a file, a test fixture. The pipeline only needs
 * decoded bytes; it does not know about HTTP, TLS or authentication.
 *
 * Implementations include:
 * - StringSource: in-memory chunks (tests, replays)
 * - IstreamSource: any std::istream
 * - FdSource: a POSIX file descriptor (pipes, stdin, sockets)
 */
class ByteSource
{
  public:
    virtual ~ByteSource() = default;

    /**
     * Read up to `size` bytes into `buffer`.
     * Blocks until at least one byte is available or the input ends.
     * @return Number of bytes read; 0 means end of input
     * @throws SourceError if the underlying source fails
     */
    virtual size_t read(char* buffer, size_t size) = 0;
};

// Serves a fixed list of chunks; every read returns bytes from a single chunk,
// so chunk boundaries are reproduced exactly.
class StringSource : public ByteSource
{
  public:
    explicit StringSource(std::string text);
    explicit StringSource(std::vector<std::string> chunks);

    size_t read(char* buffer, size_t size) override;

  private:
    std::vector<std::string> chunks_;
    size_t chunk_index_ = 0;
    size_t chunk_offset_ = 0;
};

// Reads from a caller-owned std::istream, which must outlive the source
class IstreamSource : public ByteSource
{
  public:
    explicit IstreamSource(std::istream& stream);

    size_t read(char* buffer, size_t size) override;

  private:
    std::istream& stream_;
};

struct FdHandle;

// Reads from a POSIX file descriptor
class FdSource : public ByteSource
{
  public:
    // When `owns` is true the descriptor is closed with the source
    explicit FdSource(int fd, bool owns = false);
    ~FdSource() override;

    // No copy, move only
    FdSource(const FdSource&) = delete;
    FdSource& operator=(const FdSource&) = delete;
    FdSource(FdSource&&) noexcept;
    FdSource& operator=(FdSource&&) noexcept;

    size_t read(char* buffer, size_t size) override;

    // Wait up to timeout_ms for readable data (or end of input)
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    std::unique_ptr<FdHandle> handle_;
};

// Splits a byte source into lines. Line terminators ("\n" or "\r\n") are
// stripped; a final unterminated line is returned before end of input.
class LineReader
{
  public:
    explicit LineReader(ByteSource& source, size_t read_size = 4096);

    // Next line, or nullopt at end of input
    std::optional<std::string> read_line();

  private:
    ByteSource& source_;
    std::vector<char> chunk_;
    std::string buffer_;
    size_t scan_from_ = 0;
    bool eof_ = false;
};

} // namespace semq

#endif // SEMQ_SOURCE_HPP
