/*-------------------------------------------------------------------------
 *
 * CByteSinks.cpp
 *      Stream and vector byte sinks.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "bucket/IByteSink.hpp"

namespace DocBucket
{

COstreamSink::COstreamSink(std::ostream& out) : out_(out)
{
}

BucketResult<void> COstreamSink::accept(ByteSpan bytes)
{
    out_.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!out_)
        return bucketFailure(BucketErrors::StreamIoError{"output stream write failed"});
    return {};
}

BucketResult<void> CVectorSink::accept(ByteSpan bytes)
{
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
    return {};
}

const ByteVector& CVectorSink::bytes() const noexcept
{
    return bytes_;
}

ByteVector CVectorSink::release()
{
    ByteVector out;
    out.swap(bytes_);
    return out;
}

} /* namespace DocBucket */
