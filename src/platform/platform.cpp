// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// POSIX реализация: stat(2), mmap(2), isatty(3).
//
// ==============================================================================

#include "fiq/platform.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <thread>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fiq::platform {

namespace {

TimePoint from_timespec(const struct timespec& ts) {
    auto d = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return TimePoint(std::chrono::duration_cast<Clock::duration>(d));
}

}  // namespace

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.string();
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
    return isatty(fileno(stdout)) != 0;
}

bool is_tty_stderr() {
    return isatty(fileno(stderr)) != 0;
}

// ----------------------------------------------------------------------------
// Метаданные файла
// ----------------------------------------------------------------------------

std::optional<FileStat> stat_path(const std::filesystem::path& p) {
    struct stat st {};
    if (::stat(p.c_str(), &st) != 0) {
        return std::nullopt;
    }

    FileStat result;
    result.size = static_cast<std::uint64_t>(st.st_size);
#ifdef __APPLE__
    result.modified = from_timespec(st.st_mtimespec);
#else
    result.modified = from_timespec(st.st_mtim);
#endif
    result.is_regular = S_ISREG(st.st_mode);
    result.is_directory = S_ISDIR(st.st_mode);
    return result;
}

std::optional<TimePoint> modified_time(const std::filesystem::path& p) {
    auto st = stat_path(p);
    if (!st) {
        return std::nullopt;
    }
    return st->modified;
}

// ----------------------------------------------------------------------------
// Окружение и каталоги пользователя
// ----------------------------------------------------------------------------

std::optional<std::string> env_var(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::size_t> env_positive_int(const char* name) {
    auto value = env_var(name);
    if (!value) {
        return std::nullopt;
    }
    std::size_t result = 0;
    for (char c : *value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        result = result * 10 + static_cast<std::size_t>(c - '0');
        if (result > 4096) {
            return std::nullopt;
        }
    }
    if (result == 0) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::filesystem::path> user_cache_root() {
    if (auto xdg = env_var("XDG_CACHE_HOME")) {
        return path_from_utf8(*xdg);
    }
    if (auto home = env_var("HOME")) {
        return path_from_utf8(*home) / ".cache";
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> user_config_root() {
    if (auto xdg = env_var("XDG_CONFIG_HOME")) {
        return path_from_utf8(*xdg);
    }
    if (auto home = env_var("HOME")) {
        return path_from_utf8(*home) / ".config";
    }
    return std::nullopt;
}

std::size_t available_cores() {
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<std::size_t>(n);
}

// ----------------------------------------------------------------------------
// MappedFile
// ----------------------------------------------------------------------------

MappedFile::~MappedFile() {
    release();
}

MappedFile::MappedFile(MappedFile&& other) noexcept : data_(other.data_), size_(other.size_) {
    other.data_ = nullptr;
    other.size_ = 0;
}

MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
    if (this != &other) {
        release();
        data_ = other.data_;
        size_ = other.size_;
        other.data_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void MappedFile::release() {
    if (data_ != nullptr) {
        munmap(const_cast<unsigned char*>(data_), size_);
        data_ = nullptr;
        size_ = 0;
    }
}

std::optional<MappedFile> MappedFile::open(const std::filesystem::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::nullopt;
    }

    struct stat st {};
    if (fstat(fd, &st) != 0 || st.st_size <= 0) {
        close(fd);
        return std::nullopt;
    }

    auto size = static_cast<std::size_t>(st.st_size);
    void* addr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    // Дескриптор не нужен после mmap
    close(fd);
    if (addr == MAP_FAILED) {
        return std::nullopt;
    }
    madvise(addr, size, MADV_SEQUENTIAL);

    MappedFile mapped;
    mapped.data_ = static_cast<const unsigned char*>(addr);
    mapped.size_ = size;
    return mapped;
}

std::optional<std::string> read_file(const std::filesystem::path& p) {
    std::ifstream file(p, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return content;
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#if defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace fiq::platform
