/* 
 * File:   Crypto.cpp
 * Author: me
 * 
 * Created on March 11, 2024, 9:40 AM
 */

#include "Crypto.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Util.hpp"

#include <memory>
#include <sstream>
#include <vector>

#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

using namespace std;

namespace sdsclient
{
    namespace
    {
        string lastOpenSslError(const string& functionName)
        {
            stringstream ss;
            ss << functionName;
            unsigned long err = ERR_get_error();
            if (err != 0)
            {
                char buffer[256];
                ERR_error_string_n(err, buffer, sizeof(buffer));
                ss << ": " << buffer;
            }
            ERR_clear_error();
            return ss.str();
        }
        
        shared_ptr<BIO> newMemBio()
        {
            BIO* bio = BIO_new(BIO_s_mem());
            if (bio == NULL)
            {
                throw CryptoError(lastOpenSslError("BIO_new"));
            }
            return shared_ptr<BIO>(bio, BIO_free_all);
        }
        
        shared_ptr<BIO> readOnlyBio(const string& data)
        {
            BIO* bio = BIO_new_mem_buf(data.data(), (int) data.size());
            if (bio == NULL)
            {
                throw CryptoError(lastOpenSslError("BIO_new_mem_buf"));
            }
            return shared_ptr<BIO>(bio, BIO_free_all);
        }
        
        string bioContents(BIO* bio)
        {
            char* data = NULL;
            long length = BIO_get_mem_data(bio, &data);
            return (length > 0) ? string(data, length) : string();
        }
        
        shared_ptr<EVP_PKEY> readPublicKey(const string& pem)
        {
            shared_ptr<BIO> bio = readOnlyBio(pem);
            EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio.get(), NULL, NULL, NULL);
            if (pkey == NULL)
            {
                throw CryptoError(lastOpenSslError("PEM_read_bio_PUBKEY"));
            }
            return shared_ptr<EVP_PKEY>(pkey, EVP_PKEY_free);
        }
        
        // A NULL passphrase reads an unencrypted key
        shared_ptr<EVP_PKEY> readPrivateKey(const string& pem, 
                const Secret* passphrase)
        {
            shared_ptr<BIO> bio = readOnlyBio(pem);
            // With no callback, OpenSSL takes u as the passphrase
            void* u = passphrase ? 
                (void*) passphrase->expose().c_str() : 
                (void*) "";
            EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio.get(), NULL, NULL, u);
            if (pkey == NULL)
            {
                throw CryptoError(lastOpenSslError("PEM_read_bio_PrivateKey"));
            }
            return shared_ptr<EVP_PKEY>(pkey, EVP_PKEY_free);
        }
        
        shared_ptr<EVP_PKEY_CTX> newOaepContext(EVP_PKEY* pkey, bool encrypt)
        {
            EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(pkey, NULL);
            if (ctx == NULL)
            {
                throw CryptoError(lastOpenSslError("EVP_PKEY_CTX_new"));
            }
            shared_ptr<EVP_PKEY_CTX> guard(ctx, EVP_PKEY_CTX_free);
            
            int result = encrypt ? 
                EVP_PKEY_encrypt_init(ctx) : 
                EVP_PKEY_decrypt_init(ctx);
            if (result != 1)
            {
                throw CryptoError(lastOpenSslError(encrypt ? 
                    "EVP_PKEY_encrypt_init" : "EVP_PKEY_decrypt_init"));
            }
            if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) <= 0 ||
                    EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) <= 0 ||
                    EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) <= 0)
            {
                throw CryptoError(lastOpenSslError("OAEP setup"));
            }
            return guard;
        }
        
        string randomBytes(size_t count)
        {
            string bytes(count, '\0');
            if (RAND_bytes((unsigned char*) &bytes[0], (int) count) != 1)
            {
                throw CryptoError(lastOpenSslError("RAND_bytes"));
            }
            return bytes;
        }
    }
    
    /**************************
    * FileKey
    **************************/
    
    FileKey::FileKey()
    {
        // No body
    }
    
    FileKey FileKey::fromJson(const Json& jsonObj)
    {
        FileKey fileKey;
        fileKey.key = jsonObj.getString("key");
        fileKey.iv = jsonObj.getString("iv");
        fileKey.tag = jsonObj.getString("tag");
        fileKey.version = jsonObj.getString("version");
        if (fileKey.key.empty() || fileKey.iv.empty())
        {
            throw CryptoError("file key is incomplete");
        }
        return fileKey;
    }
    
    Json FileKey::toJson() const
    {
        Json jsonObj;
        jsonObj.addString("key", key)
            .addString("iv", iv)
            .addString("tag", tag)
            .addString("version", version);
        return jsonObj;
    }
    
    /**************************
    * PlainFileKey
    **************************/
    
    const size_t PlainFileKey::KEY_SIZE = 32;
    const size_t PlainFileKey::IV_SIZE = 12;
    const size_t PlainFileKey::TAG_SIZE = 16;
    
    PlainFileKey::PlainFileKey()
    {
        // No body
    }
    
    PlainFileKey PlainFileKey::generate()
    {
        PlainFileKey plainKey;
        string keyBytes = randomBytes(KEY_SIZE);
        plainKey.key = Secret(keyBytes);
        OPENSSL_cleanse(&keyBytes[0], keyBytes.size());
        plainKey.iv = randomBytes(IV_SIZE);
        return plainKey;
    }
    
    /**************************
    * UserKeyPair
    **************************/
    
    UserKeyPair::UserKeyPair()
    {
        // No body
    }
    
    UserKeyPair UserKeyPair::fromJson(const Json& jsonObj)
    {
        UserKeyPair keyPair;
        keyPair.version = jsonObj.getString("privateKeyContainer/version");
        keyPair.encryptedPrivateKey = 
                jsonObj.getString("privateKeyContainer/privateKey");
        keyPair.publicKey = jsonObj.getString("publicKeyContainer/publicKey");
        if (keyPair.encryptedPrivateKey.empty() || keyPair.publicKey.empty())
        {
            throw CryptoError("key pair container is incomplete");
        }
        return keyPair;
    }
    
    Json UserKeyPair::toJson() const
    {
        Json privateContainer;
        privateContainer.addString("version", version)
            .addString("privateKey", encryptedPrivateKey);
        Json publicContainer;
        publicContainer.addString("version", version)
            .addString("publicKey", publicKey);
        
        Json jsonObj;
        jsonObj.addObject("privateKeyContainer", privateContainer)
            .addObject("publicKeyContainer", publicContainer);
        return jsonObj;
    }
    
    PlainUserKeyPair::PlainUserKeyPair()
    {
        // No body
    }
    
    /**************************
    * Crypto
    **************************/
    
    const int Crypto::DEFAULT_KEY_BITS = 4096;
    
    string Crypto::keyPairVersion(int bits)
    {
        return "RSA-" + Util::toString((uint64_t) bits);
    }
    
    string Crypto::fileKeyVersion(const string& pairVersion)
    {
        return pairVersion + "/AES-256-GCM";
    }
    
    UserKeyPair Crypto::createKeyPair(const Secret& secret, int bits)
    {
        if (secret.empty())
        {
            throw MissingEncryptionSecret();
        }
        
        EVP_PKEY_CTX* keyCtx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, NULL);
        if (keyCtx == NULL)
        {
            throw CryptoError(lastOpenSslError("EVP_PKEY_CTX_new_id"));
        }
        shared_ptr<EVP_PKEY_CTX> ctxGuard(keyCtx, EVP_PKEY_CTX_free);
        
        if (EVP_PKEY_keygen_init(keyCtx) != 1)
        {
            throw CryptoError(lastOpenSslError("EVP_PKEY_keygen_init"));
        }
        if (EVP_PKEY_CTX_set_rsa_keygen_bits(keyCtx, bits) <= 0)
        {
            throw CryptoError(
                    lastOpenSslError("EVP_PKEY_CTX_set_rsa_keygen_bits"));
        }
        EVP_PKEY* rawKey = NULL;
        if (EVP_PKEY_keygen(keyCtx, &rawKey) != 1)
        {
            throw CryptoError(lastOpenSslError("EVP_PKEY_keygen"));
        }
        shared_ptr<EVP_PKEY> pkey(rawKey, EVP_PKEY_free);
        
        shared_ptr<BIO> privateBio = newMemBio();
        if (PEM_write_bio_PKCS8PrivateKey(privateBio.get(), pkey.get(), 
                EVP_aes_256_cbc(), (char*) secret.expose().c_str(), 
                (int) secret.size(), NULL, NULL) != 1)
        {
            throw CryptoError(
                    lastOpenSslError("PEM_write_bio_PKCS8PrivateKey"));
        }
        
        shared_ptr<BIO> publicBio = newMemBio();
        if (PEM_write_bio_PUBKEY(publicBio.get(), pkey.get()) != 1)
        {
            throw CryptoError(lastOpenSslError("PEM_write_bio_PUBKEY"));
        }
        
        UserKeyPair keyPair;
        keyPair.version = keyPairVersion(bits);
        keyPair.encryptedPrivateKey = bioContents(privateBio.get());
        keyPair.publicKey = bioContents(publicBio.get());
        return keyPair;
    }
    
    PlainUserKeyPair Crypto::decryptPrivateKey(const UserKeyPair& keyPair, 
            const Secret& secret)
    {
        if (secret.empty())
        {
            throw MissingEncryptionSecret();
        }
        
        shared_ptr<EVP_PKEY> pkey = 
                readPrivateKey(keyPair.encryptedPrivateKey, &secret);
        
        // Keep it as an unencrypted PEM for later unwrapping
        shared_ptr<BIO> bio = newMemBio();
        if (PEM_write_bio_PKCS8PrivateKey(bio.get(), pkey.get(), NULL, NULL, 0,
                NULL, NULL) != 1)
        {
            throw CryptoError(
                    lastOpenSslError("PEM_write_bio_PKCS8PrivateKey"));
        }
        string pem = bioContents(bio.get());
        
        PlainUserKeyPair plainPair;
        plainPair.version = keyPair.version;
        plainPair.privateKey = Secret(pem);
        plainPair.publicKey = keyPair.publicKey;
        OPENSSL_cleanse(&pem[0], pem.size());
        return plainPair;
    }
    
    FileKey Crypto::encryptFileKey(const PlainFileKey& plainKey, 
            const string& publicKeyPem, const string& pairVersion)
    {
        shared_ptr<EVP_PKEY> pkey = readPublicKey(publicKeyPem);
        shared_ptr<EVP_PKEY_CTX> ctx = newOaepContext(pkey.get(), true);
        
        size_t outLength = 0;
        if (EVP_PKEY_encrypt(ctx.get(), NULL, &outLength, 
                plainKey.key.bytes(), plainKey.key.size()) != 1)
        {
            throw CryptoError(lastOpenSslError("EVP_PKEY_encrypt"));
        }
        vector<unsigned char> wrapped(outLength);
        if (EVP_PKEY_encrypt(ctx.get(), &wrapped[0], &outLength, 
                plainKey.key.bytes(), plainKey.key.size()) != 1)
        {
            throw CryptoError(lastOpenSslError("EVP_PKEY_encrypt"));
        }
        
        FileKey fileKey;
        fileKey.key = Util::base64Encode(
                string((const char*) &wrapped[0], outLength));
        fileKey.iv = Util::base64Encode(plainKey.iv);
        fileKey.tag = Util::base64Encode(plainKey.tag);
        fileKey.version = fileKeyVersion(pairVersion.empty() ? 
            keyPairVersion(DEFAULT_KEY_BITS) : pairVersion);
        return fileKey;
    }
    
    PlainFileKey Crypto::decryptFileKey(const FileKey& fileKey, 
            const PlainUserKeyPair& keyPair)
    {
        shared_ptr<EVP_PKEY> pkey = 
                readPrivateKey(keyPair.privateKey.expose(), NULL);
        shared_ptr<EVP_PKEY_CTX> ctx = newOaepContext(pkey.get(), false);
        
        string wrapped = Util::base64Decode(fileKey.key);
        size_t outLength = 0;
        if (EVP_PKEY_decrypt(ctx.get(), NULL, &outLength, 
                (const unsigned char*) wrapped.data(), wrapped.size()) != 1)
        {
            throw CryptoError(lastOpenSslError("EVP_PKEY_decrypt"));
        }
        vector<unsigned char> unwrapped(outLength);
        if (EVP_PKEY_decrypt(ctx.get(), &unwrapped[0], &outLength, 
                (const unsigned char*) wrapped.data(), wrapped.size()) != 1)
        {
            OPENSSL_cleanse(&unwrapped[0], unwrapped.size());
            throw CryptoError(lastOpenSslError("EVP_PKEY_decrypt"));
        }
        
        PlainFileKey plainKey;
        plainKey.key = Secret((const char*) &unwrapped[0], outLength);
        OPENSSL_cleanse(&unwrapped[0], unwrapped.size());
        plainKey.iv = Util::base64Decode(fileKey.iv);
        plainKey.tag = Util::base64Decode(fileKey.tag);
        
        if (plainKey.key.size() != PlainFileKey::KEY_SIZE || 
                plainKey.iv.size() != PlainFileKey::IV_SIZE)
        {
            throw CryptoError("unwrapped file key has the wrong size");
        }
        return plainKey;
    }

}
