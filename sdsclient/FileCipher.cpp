/* 
 * File:   FileCipher.cpp
 * Author: me
 * 
 * Created on March 11, 2024, 2:15 PM
 */

#include "FileCipher.hpp"
#include "Errors.hpp"

#include <limits.h>

#include <openssl/crypto.h>

using namespace std;

namespace sdsclient
{
    namespace
    {
        EVP_CIPHER_CTX* newGcmContext(const PlainFileKey& fileKey, 
                bool encrypt)
        {
            if (fileKey.key.size() != PlainFileKey::KEY_SIZE || 
                    fileKey.iv.size() != PlainFileKey::IV_SIZE)
            {
                throw CryptoError("AES-256-GCM needs a 32 byte key and a "
                        "12 byte IV");
            }
            
            EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
            if (ctx == NULL)
            {
                throw CryptoError("cipher context allocation failed");
            }
            
            const unsigned char* iv = (const unsigned char*) fileKey.iv.data();
            bool success = encrypt ? 
                (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), NULL, NULL, 
                    NULL) == 1 &&
                EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, 
                    (int) fileKey.iv.size(), NULL) == 1 &&
                EVP_EncryptInit_ex(ctx, NULL, NULL, fileKey.key.bytes(), 
                    iv) == 1) :
                (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), NULL, NULL, 
                    NULL) == 1 &&
                EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, 
                    (int) fileKey.iv.size(), NULL) == 1 &&
                EVP_DecryptInit_ex(ctx, NULL, NULL, fileKey.key.bytes(), 
                    iv) == 1);
            if (!success)
            {
                EVP_CIPHER_CTX_free(ctx);
                throw CryptoError("AES-256-GCM init failed");
            }
            return ctx;
        }
    }
    
    /**************************
    * FileEncrypter
    **************************/
    
    FileEncrypter::FileEncrypter()
    : mpCtx(NULL), mFileKey(PlainFileKey::generate()), mFinalized(false)
    {
        mpCtx = newGcmContext(mFileKey, true);
    }
    
    FileEncrypter::~FileEncrypter()
    {
        EVP_CIPHER_CTX_free(mpCtx);
    }
    
    void FileEncrypter::update(const char* data, size_t size, string& out)
    {
        if (mFinalized)
        {
            throw CryptoError("encrypter already finalized");
        }
        // EVP takes int lengths
        while (size > 0)
        {
            int piece = (size > (size_t) INT_MAX) ? INT_MAX : (int) size;
            size_t offset = out.size();
            out.resize(offset + piece);
            int outLength = 0;
            if (EVP_EncryptUpdate(mpCtx, (unsigned char*) &out[offset], 
                    &outLength, (const unsigned char*) data, piece) != 1)
            {
                throw CryptoError("AES-256-GCM encrypt failed");
            }
            out.resize(offset + outLength);
            data += piece;
            size -= piece;
        }
    }
    
    void FileEncrypter::finalize(string& out)
    {
        if (mFinalized)
        {
            return;
        }
        unsigned char buffer[16];
        int outLength = 0;
        if (EVP_EncryptFinal_ex(mpCtx, buffer, &outLength) != 1)
        {
            throw CryptoError("AES-256-GCM final failed");
        }
        out.append((const char*) buffer, outLength);
        
        mFileKey.tag.assign(PlainFileKey::TAG_SIZE, '\0');
        if (EVP_CIPHER_CTX_ctrl(mpCtx, EVP_CTRL_GCM_GET_TAG, 
                (int) PlainFileKey::TAG_SIZE, &mFileKey.tag[0]) != 1)
        {
            throw CryptoError("AES-256-GCM get tag failed");
        }
        mFinalized = true;
    }
    
    const PlainFileKey& FileEncrypter::fileKey() const
    {
        return mFileKey;
    }
    
    /**************************
    * FileDecrypter
    **************************/
    
    FileDecrypter::FileDecrypter(const PlainFileKey& fileKey, 
            uint64_t expectedSize)
    : mpCtx(NULL), mTag(fileKey.tag), mFinalized(false)
    {
        if (mTag.size() != PlainFileKey::TAG_SIZE)
        {
            throw CryptoError("file key has no valid tag");
        }
        mpCtx = newGcmContext(fileKey, false);
        mPlaintext.reserve(expectedSize);
    }
    
    FileDecrypter::~FileDecrypter()
    {
        EVP_CIPHER_CTX_free(mpCtx);
        if (!mPlaintext.empty())
        {
            OPENSSL_cleanse(&mPlaintext[0], mPlaintext.size());
        }
    }
    
    void FileDecrypter::update(const char* data, size_t size)
    {
        if (mFinalized)
        {
            throw CryptoError("decrypter already finalized");
        }
        while (size > 0)
        {
            int piece = (size > (size_t) INT_MAX) ? INT_MAX : (int) size;
            size_t offset = mPlaintext.size();
            mPlaintext.resize(offset + piece);
            int outLength = 0;
            if (EVP_DecryptUpdate(mpCtx, (unsigned char*) &mPlaintext[offset],
                    &outLength, (const unsigned char*) data, piece) != 1)
            {
                throw CryptoError("AES-256-GCM decrypt failed");
            }
            mPlaintext.resize(offset + outLength);
            data += piece;
            size -= piece;
        }
    }
    
    const string& FileDecrypter::finalize()
    {
        if (mFinalized)
        {
            return mPlaintext;
        }
        if (EVP_CIPHER_CTX_ctrl(mpCtx, EVP_CTRL_GCM_SET_TAG, 
                (int) mTag.size(), &mTag[0]) != 1)
        {
            throw CryptoError("AES-256-GCM set tag failed");
        }
        unsigned char buffer[16];
        int outLength = 0;
        if (EVP_DecryptFinal_ex(mpCtx, buffer, &outLength) != 1)
        {
            OPENSSL_cleanse(&mPlaintext[0], mPlaintext.size());
            mPlaintext.clear();
            throw CryptoError("content failed authentication");
        }
        mPlaintext.append((const char*) buffer, outLength);
        mFinalized = true;
        return mPlaintext;
    }

}
