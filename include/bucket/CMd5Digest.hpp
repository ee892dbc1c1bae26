/*-------------------------------------------------------------------------
 *
 * CMd5Digest.hpp
 *      Incremental MD5 over OpenSSL EVP.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../CTypes.hpp"

#include <openssl/evp.h>
#include <string>

namespace DocBucket
{

class CMd5Digest
{
  public:
    CMd5Digest();
    ~CMd5Digest();

    CMd5Digest(const CMd5Digest&) = delete;
    CMd5Digest& operator=(const CMd5Digest&) = delete;

    /* False when the provider refuses MD5 (FIPS builds) */
    bool isValid() const noexcept;

    void update(ByteSpan bytes);

    /* Lowercase hex; the digest cannot be updated afterwards */
    std::string finalHex();

  private:
    EVP_MD_CTX* ctx_;
    bool valid_;
};

} /* namespace DocBucket */
