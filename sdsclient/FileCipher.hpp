/* 
 * File:   FileCipher.hpp
 * Author: me
 *
 * Created on March 11, 2024, 2:15 PM
 */

#ifndef FILECIPHER_HPP
#define	FILECIPHER_HPP

#include "Crypto.hpp"

#include <stddef.h>
#include <stdint.h>
#include <string>

#include <openssl/evp.h>

namespace sdsclient
{
    /*
     * AES-256-GCM encryption of one file's content. The constructor 
     * generates a fresh content key; its tag is filled in by finalize().
     */
    class FileEncrypter {
    public:
        FileEncrypter();
        
        virtual ~FileEncrypter();
        
        // Appends the ciphertext of data to out
        void update(const char* data, size_t size, std::string& out);
        
        void finalize(std::string& out);
        
        // Only complete (tag set) after finalize()
        const PlainFileKey& fileKey() const;
        
    private:
        EVP_CIPHER_CTX* mpCtx;
        PlainFileKey mFileKey;
        bool mFinalized;
        
        FileEncrypter(const FileEncrypter& orig);
        FileEncrypter& operator=(const FileEncrypter& orig);
    };
    
    /*
     * AES-256-GCM decryption. The plaintext is collected in an internal 
     * buffer reserved for expectedSize bytes and only released by 
     * finalize() once the tag has been verified.
     */
    class FileDecrypter {
    public:
        FileDecrypter(const PlainFileKey& fileKey, uint64_t expectedSize);
        
        // Wipes any plaintext still buffered
        virtual ~FileDecrypter();
        
        void update(const char* data, size_t size);
        
        // Throws CryptoError if authentication fails. Returns the plaintext.
        const std::string& finalize();
        
    private:
        EVP_CIPHER_CTX* mpCtx;
        std::string mTag;
        std::string mPlaintext;
        bool mFinalized;
        
        FileDecrypter(const FileDecrypter& orig);
        FileDecrypter& operator=(const FileDecrypter& orig);
    };

}

#endif	/* FILECIPHER_HPP */
