#ifndef __SLUICE_FILES_FILE_SERVLET_H__
#define __SLUICE_FILES_FILE_SERVLET_H__
// Copyright (c) 2026 - Sluice contributors

#include "sluice/http/servlet.h"
#include "chunk_source.h"

namespace Sluice {

namespace HTTP {
class ServerRequest;
}

/// GET, HEAD and POST of the resources of a ChunkSource, at prefix + key
class FileServlet : public HTTP::Servlet
{
public:
    typedef boost::shared_ptr<FileServlet> ptr;

public:
    FileServlet(ChunkSource::ptr source,
        const std::string &prefix = "/files/");

    void request(boost::shared_ptr<HTTP::ServerRequest> request);

    /// Current value of sluice.chunksize
    static size_t chunkSize();

private:
    void download(boost::shared_ptr<HTTP::ServerRequest> request,
        const std::string &key);
    void upload(boost::shared_ptr<HTTP::ServerRequest> request,
        const std::string &key);

private:
    ChunkSource::ptr m_source;
    std::string m_prefix;
};

}

#endif
