#pragma once

#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kiln {

/**
 * @brief Read-only memory mapped view of an asset on disk.
 *
 * Handles resource cleanup via RAII.
 * Throws std::runtime_error on failure.
 */
class MappedFile {
public:
    /**
     * @brief Opens and maps the specified file.
     * @param path The path to the file.
     * @throws std::runtime_error If opening, stating, or mapping fails, or if the path is not a regular file.
     */
    explicit MappedFile(const std::filesystem::path &path) {
        int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1) {
            throw std::runtime_error("Failed to open asset: " + path.string());
        }

        struct stat sb;
        if (fstat(fd, &sb) == -1) {
            close(fd);
            throw std::runtime_error("Failed to stat asset: " + path.string());
        }
        if (!S_ISREG(sb.st_mode)) {
            close(fd);
            throw std::runtime_error("Not a regular file: " + path.string());
        }
        size_ = static_cast<size_t>(sb.st_size);

        // mmap rejects zero-length mappings
        if (size_ == 0) {
            close(fd);
            return;
        }

        void *addr = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
        // The mapping keeps the file alive.
        close(fd);
        if (addr == MAP_FAILED) {
            throw std::runtime_error("Failed to mmap asset: " + path.string());
        }
        data_ = static_cast<char *>(addr);
    }

    ~MappedFile() {
        if (data_) {
            munmap(data_, size_);
        }
    }

    MappedFile(MappedFile &&other) noexcept
        : data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)) {
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;
    MappedFile &operator=(MappedFile &&) = delete;

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    size_t size() const {
        return size_;
    }

private:
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace kiln
