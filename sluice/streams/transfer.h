#ifndef __SLUICE_TRANSFER_STREAM_H__
#define __SLUICE_TRANSFER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Sluice {

/// Copy src to dst until EOF, or until limit bytes have been copied
///
/// Holds at most one 64KB block in memory; every write() finishes before the
/// next read() starts.
/// @throws UnexpectedEofException a limit was given and src ended first
unsigned long long transferStream(Stream &src, Stream &dst,
    unsigned long long limit = ~0ull);

/// Read src to EOF, keeping nothing
unsigned long long drainStream(Stream &src);

}

#endif
