#ifndef __SLUICE_FILES_CHUNK_SOURCE_H__
#define __SLUICE_FILES_CHUNK_SOURCE_H__
// Copyright (c) 2026 - Sluice contributors

#include <string>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "sluice/exception.h"

namespace Sluice {

class Buffer;

typedef boost::error_info<struct tag_resource, std::string> errinfo_resource;
typedef boost::error_info<struct tag_offset, unsigned long long> errinfo_offset;

/// The key does not name a resource
struct ResourceNotFoundException : virtual Exception {};
/// The underlying storage failed; errinfo_offset says where
struct ChunkSourceException : virtual Exception {};
struct ChunkReadException : virtual ChunkSourceException {};
struct ChunkWriteException : virtual ChunkSourceException {};

/// Metadata of a resource, captured once when it is opened
struct Resource
{
    Resource() : length(0) {}

    std::string key;
    unsigned long long length;
    std::string contentType;
    boost::posix_time::ptime lastModified;
};

/// An open resource
///
/// Reads are positional, so any number of sessions may read the same
/// resource concurrently.  At most one writer per resource is supported;
/// concurrent writers are not detected.
class ResourceHandle : boost::noncopyable
{
public:
    typedef boost::shared_ptr<ResourceHandle> ptr;

public:
    virtual ~ResourceHandle() {}

    virtual const Resource &resource() const = 0;

    /// Append up to maxLength bytes starting at offset to buffer
    /// @return The number of bytes read; less than maxLength means the end
    /// of the resource was reached
    /// @throws ChunkReadException
    virtual size_t readAt(unsigned long long offset, Buffer &buffer,
        size_t maxLength) = 0;
    /// Write all of buffer at offset
    /// @throws ChunkWriteException
    virtual void writeAt(unsigned long long offset, const Buffer &buffer) = 0;

    /// Release the underlying storage handle; further reads and writes are
    /// not allowed
    virtual void close() = 0;
};

/// A store of byte-addressable resources, looked up by key
class ChunkSource : boost::noncopyable
{
public:
    typedef boost::shared_ptr<ChunkSource> ptr;

public:
    virtual ~ChunkSource() {}

    /// @throws ResourceNotFoundException
    virtual ResourceHandle::ptr open(const std::string &key) = 0;
    /// Create the resource, or truncate it if it already exists
    virtual ResourceHandle::ptr create(const std::string &key) = 0;

    /// Keys are non-empty, made of [A-Za-z0-9._-], and don't start with '.'
    static bool validKey(const std::string &key);
};

/// Resources are the regular files directly inside a directory
class FileChunkSource : public ChunkSource
{
public:
    FileChunkSource(const std::string &root);

    const std::string &root() const { return m_root; }

    ResourceHandle::ptr open(const std::string &key);
    ResourceHandle::ptr create(const std::string &key);

private:
    std::string path(const std::string &key) const;

private:
    std::string m_root;
};

}

#endif
