// Copyright (c) 2009 - Mozy, Inc.

#include "transfer.h"

#include "sluice/exception.h"

namespace Sluice {

static const size_t g_blockSize = 65536;

static unsigned long long
copyBlocks(Stream &src, Stream *dst, unsigned long long limit)
{
    Buffer block;
    unsigned long long copied = 0;
    while (copied < limit) {
        size_t want = g_blockSize;
        if (limit - copied < want)
            want = (size_t)(limit - copied);
        size_t got = src.read(block, want);
        if (got == 0) {
            if (limit != ~0ull)
                SLUICE_THROW_EXCEPTION(UnexpectedEofException());
            break;
        }
        copied += got;
        while (dst && block.readAvailable() > 0)
            block.consume(dst->write(block, block.readAvailable()));
        block.clear();
    }
    return copied;
}

unsigned long long
transferStream(Stream &src, Stream &dst, unsigned long long limit)
{
    return copyBlocks(src, &dst, limit);
}

unsigned long long
drainStream(Stream &src)
{
    return copyBlocks(src, NULL, ~0ull);
}

}
