/* 
 * File:   Crypto.hpp
 * Author: me
 *
 * Created on March 11, 2024, 9:40 AM
 */

#ifndef CRYPTO_HPP
#define	CRYPTO_HPP

#include "Secret.hpp"

#include <string>

namespace sdsclient
{
    class Json;
    
    /*
     * A content key wrapped under one user's public key, as the API sends
     * it. All fields are base64 except the version.
     */
    class FileKey {
    public:
        FileKey();
        
        static FileKey fromJson(const Json& jsonObj);
        
        Json toJson() const;
        
        std::string key;
        std::string iv;
        std::string tag;
        std::string version;
    };
    
    // Content key in the clear. iv and tag are raw bytes.
    class PlainFileKey {
    public:
        static const size_t KEY_SIZE;
        static const size_t IV_SIZE;
        static const size_t TAG_SIZE;
        
        PlainFileKey();
        
        // Random key and IV, no tag yet
        static PlainFileKey generate();
        
        Secret key;
        std::string iv;
        std::string tag;
    };
    
    // Key pair with the private key still encrypted by the user's secret
    class UserKeyPair {
    public:
        UserKeyPair();
        
        // {privateKeyContainer{version, privateKey}, 
        //  publicKeyContainer{version, publicKey}}
        static UserKeyPair fromJson(const Json& jsonObj);
        
        Json toJson() const;
        
        std::string version;
        std::string encryptedPrivateKey;
        std::string publicKey;
    };
    
    // Unlocked key pair. privateKey is an unencrypted PKCS#8 PEM.
    class PlainUserKeyPair {
    public:
        PlainUserKeyPair();
        
        std::string version;
        Secret privateKey;
        std::string publicKey;
    };
    
    /*
     * RSA operations on key pairs and content keys. Every failure throws
     * CryptoError carrying the OpenSSL error string.
     */
    class Crypto {
    public:
        static const int DEFAULT_KEY_BITS;
        
        // "RSA-{bits}"
        static std::string keyPairVersion(int bits);
        
        // "{key pair version}/AES-256-GCM"
        static std::string fileKeyVersion(const std::string& pairVersion);
        
        /*
         * createKeyPair(): Generates an RSA key pair and encrypts the private
         *                  key with secret (PKCS#8, AES-256-CBC).
         */
        static UserKeyPair createKeyPair(const Secret& secret, 
                int bits=DEFAULT_KEY_BITS);
        
        // Throws CryptoError if secret is wrong
        static PlainUserKeyPair decryptPrivateKey(const UserKeyPair& keyPair,
                const Secret& secret);
        
        // Wraps the content key with RSA-OAEP (SHA-256) under publicKeyPem
        static FileKey encryptFileKey(const PlainFileKey& plainKey, 
                const std::string& publicKeyPem, 
                const std::string& pairVersion);
        
        static PlainFileKey decryptFileKey(const FileKey& fileKey, 
                const PlainUserKeyPair& keyPair);
        
    private:
        Crypto();
        Crypto(const Crypto& orig);
    };

}

#endif	/* CRYPTO_HPP */
