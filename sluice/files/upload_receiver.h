#ifndef __SLUICE_FILES_UPLOAD_RECEIVER_H__
#define __SLUICE_FILES_UPLOAD_RECEIVER_H__
// Copyright (c) 2026 - Sluice contributors

#include <boost/noncopyable.hpp>

#include "chunk_source.h"

namespace Sluice {

class Stream;

typedef boost::error_info<struct tag_bytes_written, unsigned long long> errinfo_bytes_written;

/// Persisting an upload failed after errinfo_bytes_written bytes; the
/// storage failure is attached as boost::errinfo_nested_exception
struct UploadFailedException : virtual Exception {};

/// Copies a stream into a resource, one chunk at a time, at increasing
/// offsets; every chunk but the last is exactly chunkSize bytes
class UploadReceiver : boost::noncopyable
{
public:
    UploadReceiver(size_t chunkSize);

    /// @return The number of bytes written
    /// @throws UploadFailedException if the destination fails; failures
    /// reading source propagate unchanged, and bytesWritten() says how far
    /// it got
    unsigned long long receive(Stream &source, ResourceHandle &destination);

    unsigned long long bytesWritten() const { return m_bytesWritten; }

private:
    size_t m_chunkSize;
    unsigned long long m_bytesWritten;
};

}

#endif
