/*-------------------------------------------------------------------------
 *
 * IByteSink.hpp
 *      Destination for downloaded bytes.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../CTypes.hpp"
#include "CBucketError.hpp"

#include <ostream>

namespace DocBucket
{

class IByteSink
{
  public:
    virtual ~IByteSink() = default;

    /* Consumes the bytes in order; a failure stops the download */
    virtual BucketResult<void> accept(ByteSpan bytes) = 0;
};

/* Writes to a std::ostream; badbit or failbit is a StreamIoError */
class COstreamSink : public IByteSink
{
  public:
    explicit COstreamSink(std::ostream& out);
    BucketResult<void> accept(ByteSpan bytes) override;

  private:
    std::ostream& out_;
};

class CVectorSink : public IByteSink
{
  public:
    CVectorSink() = default;
    BucketResult<void> accept(ByteSpan bytes) override;

    const ByteVector& bytes() const noexcept;
    ByteVector release();

  private:
    ByteVector bytes_;
};

} /* namespace DocBucket */
