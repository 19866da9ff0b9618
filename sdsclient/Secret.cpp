/* 
 * File:   Secret.cpp
 * Author: me
 * 
 * Created on March 2, 2024, 10:02 PM
 */

#include "Secret.hpp"

#include <openssl/crypto.h>

using namespace std;

namespace sdsclient
{
    Secret::Secret()
    {
        // Empty
    }
    
    Secret::Secret(const string& value)
    : mValue(value)
    {
        // No body
    }
    
    Secret::Secret(const char* data, size_t length)
    : mValue(data, length)
    {
        // No body
    }
    
    Secret::Secret(const Secret& orig)
    : mValue(orig.mValue)
    {
        // No body
    }
    
    Secret& Secret::operator=(const Secret& orig)
    {
        if (this != &orig)
        {
            wipe();
            mValue = orig.mValue;
        }
        return *this;
    }

    Secret::~Secret()
    {
        wipe();
    }
    
    const string& Secret::expose() const
    {
        return mValue;
    }
    
    const unsigned char* Secret::bytes() const
    {
        return reinterpret_cast<const unsigned char*>(mValue.data());
    }
    
    size_t Secret::size() const
    {
        return mValue.size();
    }
    
    bool Secret::empty() const
    {
        return mValue.empty();
    }
    
    void Secret::clear()
    {
        wipe();
    }
    
    bool Secret::operator==(const Secret& other) const
    {
        if (mValue.size() != other.mValue.size())
        {
            return false;
        }
        return CRYPTO_memcmp(mValue.data(), other.mValue.data(), 
                mValue.size()) == 0;
    }
    
    bool Secret::operator!=(const Secret& other) const
    {
        return !(*this == other);
    }
    
    void Secret::wipe()
    {
        if (!mValue.empty())
        {
            // Overwrite the whole allocation, not just the used part, before
            // giving it back.
            mValue.resize(mValue.capacity());
            OPENSSL_cleanse(&mValue[0], mValue.size());
        }
        mValue.clear();
    }

}
