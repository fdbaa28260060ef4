#pragma once

#include <unistd.h>

#include <utility>

namespace anybody::home::util
{

/**
 * @class FileDescriptor
 *
 * Owns a file descriptor (or socket) and closes it when it goes
 * out of scope or is replaced.
 */
class FileDescriptor
{
  public:
    FileDescriptor() = default;
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    explicit FileDescriptor(int fd) : fd(fd) {}

    FileDescriptor(FileDescriptor&& other) noexcept :
        fd(std::exchange(other.fd, -1))
    {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept
    {
        if (this != &other)
        {
            reset(std::exchange(other.fd, -1));
        }
        return *this;
    }

    ~FileDescriptor()
    {
        reset();
    }

    int operator()() const
    {
        return fd;
    }

    /**
     * @brief Closes the current descriptor, if any, and takes
     *        ownership of the new one.
     *
     * @param[in] newFd - The descriptor to own, or -1 for none
     */
    void reset(int newFd = -1)
    {
        if (fd != -1)
        {
            close(fd);
        }
        fd = newFd;
    }

    bool is_open() const
    {
        return fd != -1;
    }

  private:
    int fd = -1;
};

} // namespace anybody::home::util
