#include "fs.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <system_error>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#ifdef __linux__
    #include <liburing.h>
#endif

namespace fxfer::adapters::fs {

namespace {

// Владеющий файловый дескриптор
class UniqueFd {
public:
    explicit UniqueFd(int fd = -1) noexcept : fd_(fd) {}
    ~UniqueFd() { if (fd_ >= 0) ::close(fd_); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    // close() на записываемом файле может вернуть отложенную ошибку (NFS, ENOSPC)
    [[nodiscard]] int close() noexcept {
        int fd = fd_;
        fd_ = -1;
        return ::close(fd);
    }

private:
    int fd_;
};

auto open_source(const std::filesystem::path& src) -> infra::Result<UniqueFd> {
    UniqueFd fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return std::unexpected(infra::from_errno(errno, fmt::format("Cannot open {}", src.string())));
    }
    return fd;
}

// O_TRUNC на самом источнике уничтожил бы его до чтения первого байта
auto ensure_distinct(const UniqueFd& src_fd, const std::filesystem::path& dst) -> infra::VoidResult {
    struct stat src_st;
    if (::fstat(src_fd.get(), &src_st) == -1) {
        return std::unexpected(infra::from_errno(errno, "fstat of source failed"));
    }
    struct stat dst_st;
    if (::stat(dst.c_str(), &dst_st) == -1) {
        if (errno == ENOENT) return {};
        return std::unexpected(infra::from_errno(errno, fmt::format("Cannot stat {}", dst.string())));
    }
    if (src_st.st_dev == dst_st.st_dev && src_st.st_ino == dst_st.st_ino) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                               fmt::format("Destination {} is the source file itself", dst.string())));
    }
    return {};
}

auto open_destination(const UniqueFd& src_fd, const std::filesystem::path& dst) -> infra::Result<UniqueFd> {
    auto distinct = ensure_distinct(src_fd, dst);
    if (!distinct) return std::unexpected(std::move(distinct.error()));

    UniqueFd fd(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666));
    if (!fd.valid()) {
        return std::unexpected(infra::from_errno(errno, fmt::format("Cannot create {}", dst.string())));
    }
    return fd;
}

auto write_all(int fd, const char* data, std::size_t size, const std::filesystem::path& dst)
    -> infra::VoidResult
{
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::from_errno(errno, fmt::format("Write to {} failed", dst.string())));
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

auto finish(UniqueFd& dst_fd, const std::filesystem::path& dst) -> infra::VoidResult {
    if (dst_fd.close() != 0) {
        return std::unexpected(infra::from_errno(errno, fmt::format("Cannot close {}", dst.string())));
    }
    return {};
}

} // namespace

auto select_strategy(std::uintmax_t file_size) -> CopyStrategy {
    if (file_size < 1'000'000) return CopyStrategy::Buffered;      // < 1 MB
    if (file_size < 100'000'000) return CopyStrategy::MMap;        // < 100 MB
    return CopyStrategy::Uring;                                    // >= 100 MB
}

// =============== Buffered I/O ===============
auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size
) -> infra::VoidResult {
    auto in = open_source(src);
    if (!in) return std::unexpected(std::move(in.error()));
    auto out = open_destination(*in, dst);
    if (!out) return std::unexpected(std::move(out.error()));

    std::vector<char> buffer(buffer_size > 0 ? buffer_size : kDefaultBufferSize);
    for (;;) {
        ssize_t n = ::read(in->get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::from_errno(errno, fmt::format("Read from {} failed", src.string())));
        }
        if (n == 0) break;
        auto res = write_all(out->get(), buffer.data(), static_cast<std::size_t>(n), dst);
        if (!res) return res;
    }
    return finish(*out, dst);
}

// =============== Memory-mapped I/O ===============
auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    auto in = open_source(src);
    if (!in) return std::unexpected(std::move(in.error()));

    struct stat sb;
    if (::fstat(in->get(), &sb) == -1) {
        return std::unexpected(infra::from_errno(errno, fmt::format("fstat {} failed", src.string())));
    }
    const auto size = static_cast<std::size_t>(sb.st_size);
    if (size == 0) {
        // mmap нулевой длины невозможен
        return copy_file_buffered(src, dst);
    }

    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, in->get(), 0);
    if (src_map == MAP_FAILED) {
        spdlog::debug("mmap of {} failed ({}), falling back to buffered copy", src.string(), errno);
        return copy_file_buffered(src, dst);
    }
    (void)::madvise(src_map, size, MADV_SEQUENTIAL); // только подсказка ядру

    auto out = open_destination(*in, dst);
    if (!out) {
        ::munmap(src_map, size);
        return std::unexpected(std::move(out.error()));
    }

    auto res = write_all(out->get(), static_cast<const char*>(src_map), size, dst);
    ::munmap(src_map, size);
    if (!res) return res;
    return finish(*out, dst);
}

// =============== io_uring ===============
auto copy_file_uring(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size
) -> infra::VoidResult {
#ifdef __linux__
    constexpr unsigned kRingSize = 8;

    io_uring ring;
    int rc = io_uring_queue_init(kRingSize, &ring, 0);
    if (rc < 0) {
        spdlog::debug("io_uring unavailable ({}), falling back to buffered copy", -rc);
        return copy_file_buffered(src, dst, buffer_size);
    }

    struct RingGuard {
        io_uring* r;
        ~RingGuard() { io_uring_queue_exit(r); }
    } guard{&ring};

    auto in = open_source(src);
    if (!in) return std::unexpected(std::move(in.error()));
    auto out = open_destination(*in, dst);
    if (!out) return std::unexpected(std::move(out.error()));

    // Одна операция за раз: результат -errno или число байт
    auto run_one = [&ring](bool is_read, int fd, char* buf, unsigned len, std::uint64_t offset) -> int {
        io_uring_sqe* sqe = io_uring_get_sqe(&ring);
        if (!sqe) return -EBUSY;
        if (is_read) {
            io_uring_prep_read(sqe, fd, buf, len, offset);
        } else {
            io_uring_prep_write(sqe, fd, buf, len, offset);
        }
        int submitted = io_uring_submit_and_wait(&ring, 1);
        if (submitted < 0) return submitted;

        io_uring_cqe* cqe = nullptr;
        int wait_rc = io_uring_wait_cqe(&ring, &cqe);
        if (wait_rc < 0) return wait_rc;
        int res = cqe->res;
        io_uring_cqe_seen(&ring, cqe);
        return res;
    };

    std::vector<char> buffer(buffer_size > 0 ? buffer_size : kDefaultBufferSize);
    const auto chunk = static_cast<unsigned>(std::min<std::size_t>(buffer.size(), 1u << 30));
    std::uint64_t offset = 0;
    for (;;) {
        int got = run_one(true, in->get(), buffer.data(), chunk, offset);
        if (got == -EINTR || got == -EAGAIN) continue;
        if ((got == -EINVAL || got == -EOPNOTSUPP) && offset == 0) {
            // Старое ядро без IORING_OP_READ
            spdlog::debug("io_uring read unsupported, falling back to buffered copy");
            return copy_file_buffered(src, dst, buffer_size);
        }
        if (got < 0) {
            return std::unexpected(infra::from_errno(-got, fmt::format("Read from {} failed", src.string())));
        }
        if (got == 0) break;

        unsigned written = 0;
        while (written < static_cast<unsigned>(got)) {
            int put = run_one(false, out->get(), buffer.data() + written,
                              static_cast<unsigned>(got) - written, offset + written);
            if (put == -EINTR || put == -EAGAIN) continue;
            if (put < 0) {
                return std::unexpected(infra::from_errno(-put, fmt::format("Write to {} failed", dst.string())));
            }
            if (put == 0) {
                return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
                                       fmt::format("Write to {} made no progress", dst.string())));
            }
            written += static_cast<unsigned>(put);
        }
        offset += static_cast<std::uint64_t>(got);
    }
    return finish(*out, dst);
#else
    return copy_file_buffered(src, dst, buffer_size);
#endif
}

// =============== Unified copy_file ===============
auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy,
    std::size_t buffer_size
) -> infra::VoidResult {
    switch (strategy) {
        case CopyStrategy::MMap:
            return copy_file_mmap(src, dst);
        case CopyStrategy::Uring:
            return copy_file_uring(src, dst, buffer_size);
        case CopyStrategy::Buffered:
        default:
            return copy_file_buffered(src, dst, buffer_size);
    }
}

auto ensure_parent_directories(const std::filesystem::path& dst) -> infra::VoidResult {
    const auto parent = dst.parent_path();
    if (parent.empty()) return {};

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, fmt::format("Cannot create directory {}", parent.string())));
    }
    return {};
}

auto is_up_to_date(const std::filesystem::path& src,
                   const std::filesystem::path& dst) -> bool {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(dst, ec)) return false;

    auto src_size = std::filesystem::file_size(src, ec);
    if (ec) return false;
    auto dst_size = std::filesystem::file_size(dst, ec);
    if (ec || src_size != dst_size) return false;

    auto src_time = std::filesystem::last_write_time(src, ec);
    if (ec) return false;
    auto dst_time = std::filesystem::last_write_time(dst, ec);
    if (ec) return false;

    using std::chrono::duration_cast;
    using std::chrono::seconds;
    return duration_cast<seconds>(src_time.time_since_epoch()) <=
           duration_cast<seconds>(dst_time.time_since_epoch());
}

} // namespace fxfer::adapters::fs
