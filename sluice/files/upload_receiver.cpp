// Copyright (c) 2026 - Sluice contributors

#include "upload_receiver.h"

#include "sluice/assert.h"
#include "sluice/log.h"
#include "sluice/streams/buffer.h"
#include "sluice/streams/stream.h"

namespace Sluice {

static Logger::ptr g_log = Log::lookup("sluice:files:upload");

UploadReceiver::UploadReceiver(size_t chunkSize)
: m_chunkSize(chunkSize),
  m_bytesWritten(0)
{
    SLUICE_ASSERT(m_chunkSize > 0);
}

unsigned long long
UploadReceiver::receive(Stream &source, ResourceHandle &destination)
{
    const std::string &key = destination.resource().key;
    m_bytesWritten = 0;
    Buffer chunk;
    bool eof = false;
    while (!eof) {
        chunk.clear();
        // Only the last chunk may be short
        while (chunk.readAvailable() < m_chunkSize) {
            if (source.read(chunk, m_chunkSize - chunk.readAvailable()) == 0) {
                eof = true;
                break;
            }
        }
        size_t read = chunk.readAvailable();
        if (read == 0)
            break;
        try {
            destination.writeAt(m_bytesWritten, chunk);
        } catch (ChunkSourceException &ex) {
            // Storage may have taken part of the chunk before failing
            const unsigned long long *failedAt =
                boost::get_error_info<errinfo_offset>(ex);
            if (failedAt && *failedAt > m_bytesWritten &&
                *failedAt <= m_bytesWritten + read)
                m_bytesWritten = *failedAt;
            SLUICE_LOG_ERROR(g_log) << key << " write failed after "
                << m_bytesWritten << " bytes: "
                << boost::current_exception_diagnostic_information();
            UploadFailedException failure;
            failure << errinfo_bytes_written(m_bytesWritten)
                << errinfo_resource(key)
                << boost::errinfo_nested_exception(boost::current_exception());
            const int *error = boost::get_error_info<errinfo_nativeerror>(ex);
            if (error)
                failure << errinfo_nativeerror(*error);
            SLUICE_THROW_EXCEPTION(failure);
        }
        m_bytesWritten += read;
        SLUICE_LOG_TRACE(g_log) << key << " wrote " << read << " bytes, "
            << m_bytesWritten << " total";
    }
    SLUICE_LOG_INFO(g_log) << key << " upload complete: " << m_bytesWritten
        << " bytes";
    return m_bytesWritten;
}

}
