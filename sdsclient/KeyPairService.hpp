/* 
 * File:   KeyPairService.hpp
 * Author: me
 *
 * Created on March 12, 2024, 10:10 AM
 */

#ifndef KEYPAIRSERVICE_HPP
#define	KEYPAIRSERVICE_HPP

#include "Crypto.hpp"
#include "Secret.hpp"

#include <mutex>
#include <string>

namespace sdsclient
{
    class SdsContext;
    class TokenManager;
    
    /*
     * Fetches the user's key pair and keeps it unlocked for the rest of the
     * session once a secret has been supplied.
     */
    class KeyPairService {
    public:
        static const std::string URL_KEYPAIR;
        
        KeyPairService(SdsContext& ctx, TokenManager& tokens);
        
        virtual ~KeyPairService();
        
        // Key pair as stored on the server, private key still encrypted
        UserKeyPair getUserKeyPair();
        
        /*
         * getUnlockedKeyPair():    Returns the cached key pair if it was 
         *                          unlocked before. Otherwise fetches and 
         *                          decrypts it with secret and caches it.
         * Throws:
         *      MissingEncryptionSecret if nothing is cached and secret is 
         *      empty, CryptoError if secret is wrong.
         */
        PlainUserKeyPair getUnlockedKeyPair(const Secret& secret=Secret());
        
        bool isUnlocked() const;
        
        // Forgets the unlocked key pair
        void clear();
        
    private:
        SdsContext& mCtx;
        TokenManager& mTokens;
        bool mUnlocked;
        PlainUserKeyPair mKeyPair;
        mutable std::mutex mMutex;
        
        KeyPairService(const KeyPairService& orig);
    };

}

#endif	/* KEYPAIRSERVICE_HPP */
