// Copyright (c) 2026 - Sluice contributors

#include "chunk_source.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/date_time/posix_time/posix_time.hpp>

#include "sluice/assert.h"
#include "sluice/log.h"
#include "sluice/streams/buffer.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:files:chunksource");

namespace {

class FileResourceHandle : public ResourceHandle
{
public:
    FileResourceHandle(int fd, const Resource &resource)
        : m_fd(fd),
          m_resource(resource)
    {}

    ~FileResourceHandle()
    {
        if (m_fd >= 0) {
            int rc = ::close(m_fd);
            SLUICE_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
                << " close(" << m_fd << "): " << rc << " (" << errno
                << ")";
        }
    }

    const Resource &resource() const { return m_resource; }

    size_t readAt(unsigned long long offset, Buffer &buffer, size_t maxLength)
    {
        SLUICE_ASSERT(m_fd >= 0);
        iovec iov = buffer.writeBuffer(maxLength);
        size_t total = 0;
        while (total < maxLength) {
            ssize_t rc = pread(m_fd, (char *)iov.iov_base + total,
                maxLength - total, (off_t)(offset + total));
            if (rc < 0) {
                int error = errno;
                if (error == EINTR)
                    continue;
                SLUICE_LOG_ERROR(g_log) << this << " pread(" << m_fd << ", "
                    << maxLength - total << ", " << offset + total << "): "
                    << rc << " (" << error << ")";
                SLUICE_THROW_EXCEPTION(ChunkReadException()
                    << errinfo_resource(m_resource.key)
                    << errinfo_offset(offset + total)
                    << errinfo_nativeerror(error)
                    << boost::errinfo_api_function("pread"));
            }
            if (rc == 0)
                break;
            total += rc;
        }
        buffer.produce(total);
        SLUICE_LOG_TRACE(g_log) << this << " readAt(" << offset << ", "
            << maxLength << "): " << total;
        return total;
    }

    void writeAt(unsigned long long offset, const Buffer &buffer)
    {
        SLUICE_ASSERT(m_fd >= 0);
        iovec iov = buffer.readBuffer(~0);
        size_t total = 0;
        while (total < iov.iov_len) {
            ssize_t rc = pwrite(m_fd, (const char *)iov.iov_base + total,
                iov.iov_len - total, (off_t)(offset + total));
            if (rc < 0) {
                int error = errno;
                if (error == EINTR)
                    continue;
                SLUICE_LOG_ERROR(g_log) << this << " pwrite(" << m_fd << ", "
                    << iov.iov_len - total << ", " << offset + total << "): "
                    << rc << " (" << error << ")";
                SLUICE_THROW_EXCEPTION(ChunkWriteException()
                    << errinfo_resource(m_resource.key)
                    << errinfo_offset(offset + total)
                    << errinfo_nativeerror(error)
                    << boost::errinfo_api_function("pwrite"));
            }
            total += rc;
        }
        SLUICE_LOG_TRACE(g_log) << this << " writeAt(" << offset << ", "
            << iov.iov_len << ")";
        if (offset + total > m_resource.length)
            m_resource.length = offset + total;
    }

    void close()
    {
        if (m_fd < 0)
            return;
        int fd = m_fd;
        m_fd = -1;
        int rc = ::close(fd);
        int error = errno;
        SLUICE_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
            << " close(" << fd << "): " << rc << " (" << error << ")";
        if (rc)
            SLUICE_THROW_EXCEPTION_FROM_ERROR_API(error, "close");
    }

private:
    int m_fd;
    Resource m_resource;
};

}

bool
ChunkSource::validKey(const std::string &key)
{
    if (key.empty() || key[0] == '.')
        return false;
    for (std::string::const_iterator it = key.begin(); it != key.end(); ++it) {
        char c = *it;
        if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-'))
            return false;
    }
    return true;
}

FileChunkSource::FileChunkSource(const std::string &root)
: m_root(root)
{
    if (m_root.empty())
        m_root = ".";
}

std::string
FileChunkSource::path(const std::string &key) const
{
    if (!validKey(key))
        SLUICE_THROW_EXCEPTION(ResourceNotFoundException()
            << errinfo_resource(key));
    if (m_root[m_root.size() - 1] == '/')
        return m_root + key;
    return m_root + "/" + key;
}

ResourceHandle::ptr
FileChunkSource::open(const std::string &key)
{
    std::string fullPath = path(key);
    int fd = ::open(fullPath.c_str(), O_RDONLY);
    int error = errno;
    SLUICE_LOG_VERBOSE(g_log) << "open(" << fullPath << ", O_RDONLY): "
        << fd << " (" << error << ")";
    if (fd < 0) {
        if (error == ENOENT || error == ENOTDIR)
            SLUICE_THROW_EXCEPTION(ResourceNotFoundException()
                << errinfo_resource(key));
        SLUICE_THROW_EXCEPTION(ChunkReadException()
            << errinfo_resource(key)
            << errinfo_offset(0)
            << errinfo_nativeerror(error)
            << boost::errinfo_api_function("open"));
    }
    struct stat st;
    if (fstat(fd, &st)) {
        error = errno;
        ::close(fd);
        SLUICE_THROW_EXCEPTION(ChunkReadException()
            << errinfo_resource(key)
            << errinfo_offset(0)
            << errinfo_nativeerror(error)
            << boost::errinfo_api_function("fstat"));
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        SLUICE_THROW_EXCEPTION(ResourceNotFoundException()
            << errinfo_resource(key));
    }
    Resource resource;
    resource.key = key;
    resource.length = st.st_size;
    resource.contentType = "application/octet-stream";
    resource.lastModified = boost::posix_time::from_time_t(st.st_mtime);
    return ResourceHandle::ptr(new FileResourceHandle(fd, resource));
}

ResourceHandle::ptr
FileChunkSource::create(const std::string &key)
{
    std::string fullPath = path(key);
    int fd = ::open(fullPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    int error = errno;
    SLUICE_LOG_VERBOSE(g_log) << "open(" << fullPath
        << ", O_WRONLY | O_CREAT | O_TRUNC): " << fd << " (" << error << ")";
    if (fd < 0) {
        SLUICE_THROW_EXCEPTION(ChunkWriteException()
            << errinfo_resource(key)
            << errinfo_offset(0)
            << errinfo_nativeerror(error)
            << boost::errinfo_api_function("open"));
    }
    Resource resource;
    resource.key = key;
    resource.contentType = "application/octet-stream";
    resource.lastModified = boost::posix_time::second_clock::universal_time();
    return ResourceHandle::ptr(new FileResourceHandle(fd, resource));
}

}
