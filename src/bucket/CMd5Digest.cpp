/*-------------------------------------------------------------------------
 *
 * CMd5Digest.cpp
 *      Incremental MD5 over OpenSSL EVP.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "bucket/CMd5Digest.hpp"

namespace DocBucket
{

CMd5Digest::CMd5Digest() : ctx_(EVP_MD_CTX_new()), valid_(false)
{
    if (ctx_ && EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) == 1)
        valid_ = true;
}

CMd5Digest::~CMd5Digest()
{
    if (ctx_)
        EVP_MD_CTX_free(ctx_);
}

bool CMd5Digest::isValid() const noexcept
{
    return valid_;
}

void CMd5Digest::update(ByteSpan bytes)
{
    if (valid_ && !bytes.empty() &&
        EVP_DigestUpdate(ctx_, bytes.data(), bytes.size()) != 1)
        valid_ = false;
}

std::string CMd5Digest::finalHex()
{
    static const char digits[] = "0123456789abcdef";
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (!valid_ || EVP_DigestFinal_ex(ctx_, digest, &length) != 1)
    {
        valid_ = false;
        return std::string();
    }
    valid_ = false;

    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i)
    {
        hex += digits[digest[i] >> 4];
        hex += digits[digest[i] & 0x0f];
    }
    return hex;
}

} /* namespace DocBucket */
